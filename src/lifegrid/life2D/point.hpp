#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

// ---- Point ---- //
// Integer coordinate on the unbounded plane, or an offset between two of them.
struct Point {
    std::int64_t x{0};
    std::int64_t y{0};
};

inline Point operator+(Point a, Point b) noexcept
{
    return Point{a.x + b.x, a.y + b.y};
}

inline Point operator-(Point a, Point b) noexcept
{
    return Point{a.x - b.x, a.y - b.y};
}

inline bool operator==(Point a, Point b) noexcept
{
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(Point a, Point b) noexcept
{
    return !(a == b);
}

// Row-major (y, then x). Only used to print cells in a stable order.
inline bool operator<(Point a, Point b) noexcept
{
    return a.y < b.y || (a.y == b.y && a.x < b.x);
}

inline std::ostream& operator<<(std::ostream& os, Point p)
{
    return os << "(" << p.x << ", " << p.y << ")";
}

// Hash for unordered containers
struct PointHash {
    std::size_t operator()(const Point& p) const noexcept
    {
        std::size_t h = std::hash<std::int64_t>{}(p.x);
        h ^= std::hash<std::int64_t>{}(p.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

// ---- Moore neighborhood ---- //
constexpr std::array<Point, 8> NEIGHBORHOOD_OFFSETS = {{
    {-1,  1}, {0,  1}, {1,  1},
    {-1,  0},          {1,  0},
    {-1, -1}, {0, -1}, {1, -1}
}};

inline std::array<Point, 8> neighbors(Point p) noexcept
{
    std::array<Point, 8> out;
    for (std::size_t k = 0; k < NEIGHBORHOOD_OFFSETS.size(); ++k)
        out[k] = p + NEIGHBORHOOD_OFFSETS[k];
    return out;
}
