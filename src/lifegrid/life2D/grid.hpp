#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/Core>

#include "point.hpp"

// alive point -> generation it was born in
using CellMap = std::unordered_map<Point, std::uint64_t, PointHash>;

// Dense ages for a window, -1 where the cell is dead.
using AgeRaster =
    Eigen::Matrix<std::int64_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// ---- Grid ---- //
// Sparse Life board (B3/S23). Any point missing from `alive` is dead.
class Grid {
private:
    CellMap alive;
    std::uint64_t generation{0};

public:
    Grid() = default;
    explicit Grid(const std::vector<Point>& points);

    // Scatters width*height*8/10 uniform draws over [top_left, bottom_right).
    // Repeated draws collapse, so the population is at most that many.
    static Grid random(Point top_left, Point bottom_right);
    static Grid random(Point top_left, Point bottom_right, std::uint64_t seed);

    // Advance one generation. Survivors keep their birth generation,
    // newborns are stamped with the new one.
    Grid& tick();

    Grid& add_point(Point p);
    Grid& remove_point(Point p);

    std::optional<std::uint64_t> age_of_point(Point p) const;
    bool is_alive(Point p) const { return alive.count(p) != 0; }

    int count_neighbors(Point p) const;

    AgeRaster age_window(Point top_left, Point bottom_right) const;

    std::string to_string() const;

    // ---- Accessors ---- //
    std::uint64_t getGeneration() const noexcept { return generation; }
    std::size_t getPopulation() const noexcept { return alive.size(); }

    const CellMap& cells() const noexcept { return alive; }
};

std::ostream& operator<<(std::ostream& os, const Grid& grid);
