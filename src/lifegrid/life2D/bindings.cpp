#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include <optional>

#include "grid.hpp"

namespace py = pybind11;

PYBIND11_MODULE(lifegrid_cpp, m)
{
    m.doc() = "Sparse Game of Life engine";

    // ---------------- Point ----------------
    py::class_<Point>(m, "Point")
        .def(py::init([](std::int64_t x, std::int64_t y) { return Point{x, y}; }),
             py::arg("x") = 0, py::arg("y") = 0)
        .def_readonly("x", &Point::x)
        .def_readonly("y", &Point::y)
        .def("__add__", [](Point a, Point b) { return a + b; })
        .def("__sub__", [](Point a, Point b) { return a - b; })
        .def("__eq__", [](Point a, Point b) { return a == b; })
        .def("__ne__", [](Point a, Point b) { return a != b; })
        .def("__lt__", [](Point a, Point b) { return a < b; })
        .def("__hash__", [](const Point& p) { return PointHash{}(p); })
        .def("__repr__",
             [](const Point& p) {
                 return "Point(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
             });

    m.def("neighbors", &neighbors, py::arg("point"),
          "The 8 Moore neighbors of a point, in a fixed order");

    // ---------------- Grid ----------------
    py::class_<Grid>(m, "Grid")
        .def(py::init<>())
        .def(py::init<const std::vector<Point>&>(), py::arg("points"))

        .def_static("random",
            [](Point top_left, Point bottom_right, std::optional<std::uint64_t> seed) {
                return seed ? Grid::random(top_left, bottom_right, *seed)
                            : Grid::random(top_left, bottom_right);
            },
            py::arg("top_left"), py::arg("bottom_right"), py::arg("seed") = py::none())

        // mutators hand back the same Python object so calls can be chained
        .def("tick", &Grid::tick, py::return_value_policy::reference_internal)
        .def("add_point", &Grid::add_point, py::arg("point"),
             py::return_value_policy::reference_internal)
        .def("remove_point", &Grid::remove_point, py::arg("point"),
             py::return_value_policy::reference_internal)

        .def("age_of_point", &Grid::age_of_point, py::arg("point"))
        .def("is_alive", &Grid::is_alive, py::arg("point"))
        .def("count_neighbors", &Grid::count_neighbors, py::arg("point"))

        .def_property_readonly("generation", &Grid::getGeneration)
        .def_property_readonly("population", &Grid::getPopulation)
        .def("cells", &Grid::cells, "Copy of the alive cells as {Point: birth generation}")

        // int64 array of shape (height, width), -1 for dead cells
        .def("age_window", &Grid::age_window,
             py::arg("top_left"), py::arg("bottom_right"))

        .def("__len__", &Grid::getPopulation)
        .def("__contains__", &Grid::is_alive)
        .def("__repr__", &Grid::to_string);
}
