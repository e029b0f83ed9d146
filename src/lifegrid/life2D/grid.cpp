#include "grid.hpp"
#include <algorithm>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

// Width and height of [top_left, bottom_right). Both must be positive and
// their product must fit in int64.
static Point checkedExtent(Point top_left, Point bottom_right, const char* what)
{
    Point extent;
    if (__builtin_sub_overflow(bottom_right.x, top_left.x, &extent.x) ||
        __builtin_sub_overflow(bottom_right.y, top_left.y, &extent.y))
        throw std::invalid_argument(std::string(what) + " is too wide for 64-bit coordinates");

    if (extent.x <= 0 || extent.y <= 0)
        throw std::invalid_argument(std::string(what) + " must have positive width and height");

    std::int64_t area = 0;
    if (__builtin_mul_overflow(extent.x, extent.y, &area))
        throw std::invalid_argument(std::string(what) + " area does not fit in 64 bits");

    return extent;
}

Grid::Grid(const std::vector<Point>& points)
{
    alive.reserve(points.size());
    for (const auto& p : points)
        alive.emplace(p, 0);
}

Grid Grid::random(Point top_left, Point bottom_right)
{
    std::random_device rd;
    return random(top_left, bottom_right, rd());
}

Grid Grid::random(Point top_left, Point bottom_right, std::uint64_t seed)
{
    const Point extent = checkedExtent(top_left, bottom_right, "random region");

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<std::int64_t> xs(top_left.x, bottom_right.x - 1);
    std::uniform_int_distribution<std::int64_t> ys(top_left.y, bottom_right.y - 1);

    // floor(area * 8 / 10) without forming area * 8
    const std::int64_t area = extent.x * extent.y;
    const std::int64_t draws = area / 10 * 8 + area % 10 * 8 / 10;

    Grid grid;
    for (std::int64_t k = 0; k < draws; ++k)
    {
        const std::int64_t x = xs(rng);
        const std::int64_t y = ys(rng);
        grid.add_point(Point{x, y});
    }
    return grid;
}

Grid& Grid::tick()
{
    ++generation;

    // alive is the snapshot for both passes; it is only replaced at the end.
    CellMap next;
    next.reserve(alive.size());

    // STEP 1 - survival, collecting dead candidates on the way
    std::unordered_set<Point, PointHash> candidates;
    for (const auto& cell : alive)
    {
        const int n = count_neighbors(cell.first);
        if (n == 2 || n == 3)
            next.emplace(cell.first, cell.second);

        for (const auto& q : neighbors(cell.first))
            if (alive.count(q) == 0)
                candidates.insert(q);
    }

    // STEP 2 - birth
    for (const auto& q : candidates)
    {
        if (count_neighbors(q) == 3)
            next.emplace(q, generation);
    }

    alive.swap(next);
    return *this;
}

Grid& Grid::add_point(Point p)
{
    alive.emplace(p, generation);
    return *this;
}

Grid& Grid::remove_point(Point p)
{
    alive.erase(p);
    return *this;
}

std::optional<std::uint64_t> Grid::age_of_point(Point p) const
{
    const auto it = alive.find(p);
    if (it == alive.end())
        return std::nullopt;
    return generation - it->second;
}

int Grid::count_neighbors(Point p) const
{
    int count = 0;
    for (const auto& q : neighbors(p))
        if (alive.count(q) != 0)
            ++count;
    return count;
}

AgeRaster Grid::age_window(Point top_left, Point bottom_right) const
{
    const Point extent = checkedExtent(top_left, bottom_right, "age window");

    AgeRaster ages = AgeRaster::Constant(extent.y, extent.x, -1);

    // Whichever side is smaller drives the scan.
    if (static_cast<std::uint64_t>(extent.x) * static_cast<std::uint64_t>(extent.y)
            > alive.size())
    {
        for (const auto& cell : alive)
        {
            const Point p = cell.first;
            if (p.x < top_left.x || p.y < top_left.y || p.x >= bottom_right.x || p.y >= bottom_right.y)
                continue;
            const Point rel = p - top_left;
            ages(rel.y, rel.x) = static_cast<std::int64_t>(generation - cell.second);
        }
    }
    else
    {
        for (std::int64_t r = 0; r < extent.y; ++r)
        for (std::int64_t c = 0; c < extent.x; ++c)
        {
            const auto it = alive.find(top_left + Point{c, r});
            if (it != alive.end())
                ages(r, c) = static_cast<std::int64_t>(generation - it->second);
        }
    }

    return ages;
}

std::string Grid::to_string() const
{
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Grid& grid)
{
    std::vector<std::pair<Point, std::uint64_t>> sorted(grid.cells().begin(),
                                                        grid.cells().end());
    std::sort(sorted.begin(), sorted.end(),
              [](const std::pair<Point, std::uint64_t>& a,
                 const std::pair<Point, std::uint64_t>& b) { return a.first < b.first; });

    os << "Grid { generation: " << grid.getGeneration()
       << ", population: " << grid.getPopulation() << ", cells: {";
    for (std::size_t k = 0; k < sorted.size(); ++k)
    {
        if (k > 0) os << ",";
        os << " " << sorted[k].first << ": " << sorted[k].second;
    }
    os << (sorted.empty() ? "} }" : " } }");
    return os;
}
