// PyBind11 bindings for the sweep planner.
// Exposes Cell, Grid, SearchConfig, SearchResult and the solve/plan entry points.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DSWEEP_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "grid/grid.hpp"
#include "search/search_state.hpp"
#include "planner/planner.hpp"
#include "logging/log.hpp"

namespace py = pybind11;

PYBIND11_MODULE(sweep_bindings, m) {
    m.doc() = "Energy-constrained collection planner";

    py::register_exception<sweep::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    m.attr("UNREACHABLE") = sweep::UNREACHABLE;

    // ── Coord ──
    py::class_<sweep::Coord>(m, "Coord")
        .def(py::init<>())
        .def_readwrite("row", &sweep::Coord::row)
        .def_readwrite("col", &sweep::Coord::col)
        .def("__repr__", [](const sweep::Coord& c) {
            return "Coord(" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")";
        });

    // ── CellKind / Cell ──
    py::enum_<sweep::CellKind>(m, "CellKind")
        .value("EMPTY", sweep::CellKind::EMPTY)
        .value("START", sweep::CellKind::START)
        .value("OBSTACLE", sweep::CellKind::OBSTACLE)
        .value("RECHARGE", sweep::CellKind::RECHARGE)
        .value("COLLECTIBLE", sweep::CellKind::COLLECTIBLE);

    py::class_<sweep::Cell>(m, "Cell")
        .def(py::init<>())
        .def_readonly("kind",  &sweep::Cell::kind)
        .def_readonly("index", &sweep::Cell::index)
        .def("is_obstacle",    &sweep::Cell::isObstacle)
        .def("is_recharge",    &sweep::Cell::isRecharge)
        .def("is_collectible", &sweep::Cell::isCollectible);

    // ── Grid ──
    py::class_<sweep::Grid>(m, "Grid")
        .def(py::init<const std::vector<std::string>&>(), py::arg("rows"))
        .def("rows", &sweep::Grid::rows)
        .def("cols", &sweep::Grid::cols)
        .def("cell_at", [](const sweep::Grid& g, int row, int col) {
            // cellAt leaves bounds to the caller; Python gets an IndexError instead.
            if (!g.inBounds(row, col)) {
                throw py::index_error("[" + std::to_string(row) + "," +
                                      std::to_string(col) + "] is outside the grid");
            }
            return g.cellAt(row, col);
        }, py::arg("row"), py::arg("col"))
        .def("in_bounds", &sweep::Grid::inBounds)
        .def("collectible_index", &sweep::Grid::collectibleIndex)
        .def("start", &sweep::Grid::start)
        .def("collectible_count", &sweep::Grid::collectibleCount)
        .def("collectibles", &sweep::Grid::collectibles)
        .def("full_mask", &sweep::Grid::fullMask)
        .def("state_count", &sweep::Grid::stateCount);

    // ── Outcome ──
    py::enum_<sweep::Outcome>(m, "Outcome")
        .value("FOUND", sweep::Outcome::FOUND)
        .value("EXHAUSTED", sweep::Outcome::EXHAUSTED)
        .value("BUDGET_EXHAUSTED", sweep::Outcome::BUDGET_EXHAUSTED);

    // ── SearchConfig ──
    py::class_<sweep::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("max_pops",       &sweep::SearchConfig::max_pops)
        .def_readwrite("max_frontier",   &sweep::SearchConfig::max_frontier)
        .def_readwrite("budget_seconds", &sweep::SearchConfig::budget_seconds)
        .def_readwrite("record_path",    &sweep::SearchConfig::record_path);

    // ── SearchResult ──
    py::class_<sweep::SearchResult>(m, "SearchResult")
        .def(py::init<>())
        .def_readonly("outcome",         &sweep::SearchResult::outcome)
        .def_readonly("moves",           &sweep::SearchResult::moves)
        .def_readonly("pops",            &sweep::SearchResult::pops)
        .def_readonly("accepted",        &sweep::SearchResult::accepted)
        .def_readonly("peak_frontier",   &sweep::SearchResult::peak_frontier)
        .def_readonly("elapsed_seconds", &sweep::SearchResult::elapsed_seconds)
        .def_readonly("path",            &sweep::SearchResult::path)
        .def("found", &sweep::SearchResult::found);

    m.def("solve", &sweep::solve, py::arg("grid"), py::arg("max_energy"));

    m.def("plan",
          py::overload_cast<const std::vector<std::string>&, int, const sweep::SearchConfig&>(&sweep::plan),
          py::arg("grid"), py::arg("max_energy"), py::arg("config") = sweep::SearchConfig{});

    m.def("plan_grid",
          py::overload_cast<const sweep::Grid&, int, const sweep::SearchConfig&>(&sweep::plan),
          py::arg("grid"), py::arg("max_energy"), py::arg("config") = sweep::SearchConfig{});

    m.def("set_log_level", [](const std::string& level) {
        sweep::logsys::setLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
