/**
 * @file bindings.cpp
 * @brief Python bindings for ripsim using pybind11
 *
 * Provides Python interface for:
 * - Raster grids and ESRI ASCII I/O
 * - Resistance tables
 * - Mesh regridding
 * - Succession steps and the coupled model
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <pybind11/eigen.h>

#include "ripsim/ripsim.hpp"
#include <cstring>
#include <sstream>

namespace py = pybind11;
using namespace ripsim;

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert Eigen Vector to NumPy array
py::array_t<double> vector_to_numpy(const Vector& vec) {
    return py::array_t<double>(vec.size(), vec.data());
}

/// Convert NumPy array to Eigen Vector
Vector numpy_to_vector(py::array_t<double, py::array::c_style | py::array::forcecast> arr) {
    py::buffer_info buf = arr.request();
    Vector vec(buf.size);
    std::memcpy(vec.data(), buf.ptr, buf.size * sizeof(double));
    return vec;
}

/// Accept a Grid or anything os.fspath() understands
GridSource to_grid_source(const py::object& obj, const char* name) {
    if (py::isinstance<Grid>(obj)) {
        return obj.cast<Grid>();
    }
    if (py::isinstance<py::str>(obj) || py::hasattr(obj, "__fspath__")) {
        return obj.cast<std::filesystem::path>();
    }
    throw InputTypeError(std::string(name) + " must be type str or Grid");
}

TableSource to_table_source(const py::object& obj) {
    if (py::isinstance<ResistanceTable>(obj)) {
        return obj.cast<ResistanceTable>();
    }
    if (py::isinstance<py::str>(obj) || py::hasattr(obj, "__fspath__")) {
        return obj.cast<std::filesystem::path>();
    }
    throw InputTypeError("resistance table must be type str or ResistanceTable");
}

MeshSource to_mesh_source(const py::object& obj) {
    if (py::isinstance<MeshSample>(obj)) {
        return obj.cast<MeshSample>();
    }
    if (py::isinstance<py::str>(obj) || py::hasattr(obj, "__fspath__")) {
        return obj.cast<std::filesystem::path>();
    }
    throw InputTypeError("shear mesh must be type str or MeshSample");
}

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(ripsim_py, m) {
    m.doc() = R"pbdoc(
        ripsim: Riparian vegetation succession
        ======================================

        Couples hydraulic shear stress output with a cellular vegetation
        succession model.

        Example:
            >>> import ripsim_py as rs
            >>> model = rs.SuccessionModel()
            >>> veg = model.run("vegclass.asc", "zonemap.asc",
            ...                 "dflow_map.nc", "landscape.csv")
            >>> rs.write_asc(veg, "veg-out.asc")
    )pbdoc";

    // ========================================================================
    // Errors
    // ========================================================================

    py::register_exception<FormatError>(m, "FormatError");
    py::register_exception<ValidationError>(m, "ValidationError");
    py::register_exception<InputTypeError>(m, "InputTypeError", PyExc_TypeError);

    // ========================================================================
    // Grid
    // ========================================================================

    py::class_<GridHeader>(m, "GridHeader")
        .def(py::init<>())
        .def_readwrite("ncols", &GridHeader::ncols)
        .def_readwrite("nrows", &GridHeader::nrows)
        .def_readwrite("xllcorner", &GridHeader::xllcorner)
        .def_readwrite("yllcorner", &GridHeader::yllcorner)
        .def_readwrite("cellsize", &GridHeader::cellsize)
        .def_readwrite("NODATA_value", &GridHeader::nodata_value)
        .def("size", &GridHeader::size)
        .def("__eq__", &GridHeader::operator==)
        .def("__repr__", [](const GridHeader& h) {
            std::ostringstream ss;
            h.print(ss);
            return "<GridHeader\n" + ss.str() + ">";
        });

    py::class_<Grid>(m, "Grid")
        .def(py::init([](const GridHeader& header, py::array_t<double> data) {
            return Grid(header, numpy_to_vector(data));
        }), py::arg("header"), py::arg("data"))
        .def("header", &Grid::header)
        .def_property_readonly("ncols", &Grid::ncols)
        .def_property_readonly("nrows", &Grid::nrows)
        .def_property_readonly("xllcorner", &Grid::xllcorner)
        .def_property_readonly("yllcorner", &Grid::yllcorner)
        .def_property_readonly("cellsize", &Grid::cellsize)
        .def_property_readonly("NODATA_value", &Grid::nodata_value)
        .def_property_readonly("data", [](const Grid& g) {
            return vector_to_numpy(g.data());
        })
        .def("as_matrix", [](const Grid& g, py::object replace_nodata_val) {
            if (replace_nodata_val.is_none()) {
                return RowMatrix(g.as_matrix());
            }
            return g.as_matrix(replace_nodata_val.cast<Real>());
        }, py::arg("replace_nodata_val") = py::none())
        .def("count_nodata", &Grid::count_nodata)
        .def("__eq__", &Grid::operator==)
        .def("__len__", &Grid::size);

    m.def("read_asc", [](const std::filesystem::path& p) { return grid_io::read_asc(p); },
          py::arg("path"), "Read an ESRI ASCII grid");
    m.def("write_asc", [](const Grid& g, const std::filesystem::path& p) {
              grid_io::write_asc(g, p);
          },
          py::arg("grid"), py::arg("path"), "Write an ESRI ASCII grid");

    // ========================================================================
    // Configuration
    // ========================================================================

    py::class_<TableConfig>(m, "TableConfig")
        .def(py::init<>())
        .def_readwrite("code_column", &TableConfig::code_column)
        .def_readwrite("resistance_column", &TableConfig::resistance_column)
        .def_readwrite("roughness_column", &TableConfig::roughness_column);

    py::class_<MeshConfig>(m, "MeshConfig")
        .def(py::init<>())
        .def_readwrite("x_variable", &MeshConfig::x_variable)
        .def_readwrite("y_variable", &MeshConfig::y_variable)
        .def_readwrite("field_variable", &MeshConfig::field_variable);

    py::class_<RunConfig>(m, "RunConfig")
        .def(py::init<>())
        .def_readwrite("verbose", &RunConfig::verbose)
        .def_readwrite("num_threads", &RunConfig::num_threads);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("from_file", &Config::from_file)
        .def("validate", &Config::validate)
        .def_readwrite("mesh", &Config::mesh)
        .def_readwrite("table", &Config::table)
        .def_readwrite("run", &Config::run);

    // ========================================================================
    // Resistance Table
    // ========================================================================

    py::class_<ResistanceTable>(m, "ResistanceTable")
        .def(py::init<>())
        .def(py::init<const std::map<int, Real>&>())
        .def("set", &ResistanceTable::set,
             py::arg("code"), py::arg("threshold"), py::arg("roughness") = py::none())
        .def("contains", &ResistanceTable::contains)
        .def("threshold", &ResistanceTable::threshold)
        .def("roughness", &ResistanceTable::roughness)
        .def("codes", &ResistanceTable::codes)
        .def("__len__", &ResistanceTable::size)
        .def_static("from_csv", &ResistanceTable::from_csv,
                    py::arg("path"), py::arg("config") = TableConfig());

    // ========================================================================
    // Mesh and Regridding
    // ========================================================================

    py::class_<MeshSample>(m, "MeshSample")
        .def(py::init([](py::array_t<double> x, py::array_t<double> y,
                         py::array_t<double> values) {
            MeshSample s;
            s.x = numpy_to_vector(x);
            s.y = numpy_to_vector(y);
            s.values = numpy_to_vector(values);
            s.validate();
            return s;
        }), py::arg("x"), py::arg("y"), py::arg("values"))
        .def_static("from_time_series", &MeshSample::from_time_series,
                    py::arg("x"), py::arg("y"), py::arg("series"))
        .def("size", &MeshSample::size);

    m.def("load_mesh", &mesh_io::load, py::arg("path"), py::arg("config") = MeshConfig());

    py::class_<Regridder>(m, "Regridder")
        .def(py::init<const GridHeader&, const MeshSample&>(),
             py::arg("target"), py::arg("sample"))
        .def("regrid", py::overload_cast<const MeshSample&>(&Regridder::regrid, py::const_))
        .def("n_covered", &Regridder::n_covered)
        .def("is_degenerate", &Regridder::is_degenerate);

    // ========================================================================
    // Succession
    // ========================================================================

    py::class_<SuccessionEngine>(m, "SuccessionEngine")
        .def(py::init<>())
        .def("step", &SuccessionEngine::step,
             py::arg("vegetation"), py::arg("zone"), py::arg("shear"), py::arg("table"))
        .def("roughness_map", &SuccessionEngine::roughness_map)
        .def_static("validate_codes", &SuccessionEngine::validate_codes);

    py::class_<SuccessionModel>(m, "SuccessionModel")
        .def(py::init<>())
        .def(py::init<const Config&>())
        .def("run", [](const SuccessionModel& self, py::object vegetation_map,
                       py::object zone_map, py::object shear_mesh, py::object table) {
            return self.run(to_grid_source(vegetation_map, "vegetation_map"),
                            to_grid_source(zone_map, "zone_map"),
                            to_mesh_source(shear_mesh),
                            to_table_source(table));
        }, py::arg("vegetation_map"), py::arg("zone_map"), py::arg("shear_mesh"),
           py::arg("table"))
        .def("run_with_shear", [](const SuccessionModel& self, py::object vegetation_map,
                                  py::object zone_map, py::object shear_map,
                                  py::object table) {
            return self.run_with_shear(to_grid_source(vegetation_map, "vegetation_map"),
                                       to_grid_source(zone_map, "zone_map"),
                                       to_grid_source(shear_map, "shear_map"),
                                       to_table_source(table));
        }, py::arg("vegetation_map"), py::arg("zone_map"), py::arg("shear_map"),
           py::arg("table"))
        .def("roughness", [](const SuccessionModel& self, py::object vegetation_map,
                             py::object table) {
            return self.roughness(to_grid_source(vegetation_map, "vegetation_map"),
                                  to_table_source(table));
        });
}
