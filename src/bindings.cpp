#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "gridchunk/gridchunk.hpp"

#include <algorithm>

namespace py = pybind11;

PYBIND11_MODULE(_gridchunk_cpp, m) {
    m.doc() = "GridChunk C++ backend for buffered raster window reads and writes";
    m.attr("__version__") = gridchunk::VERSION;

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const gridchunk::AlreadyExists& e) {
            PyErr_SetString(PyExc_FileExistsError, e.what());
        } catch (const gridchunk::BackendOpenFailure& e) {
            PyErr_SetString(PyExc_FileNotFoundError, e.what());
        } catch (const gridchunk::InvalidWindowGeometry& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        }
    });

    py::class_<gridchunk::RasterChunk>(m, "RasterChunk")
        .def_readonly("rows", &gridchunk::RasterChunk::rows)
        .def_readonly("cols", &gridchunk::RasterChunk::cols)
        .def_readonly("buffer", &gridchunk::RasterChunk::buffer)
        .def_readonly("bands", &gridchunk::RasterChunk::bands)
        .def_readonly("x_start", &gridchunk::RasterChunk::x_start)
        .def_readonly("y_start", &gridchunk::RasterChunk::y_start)
        .def_readonly("data_type", &gridchunk::RasterChunk::data_type)
        .def_readonly("projection", &gridchunk::RasterChunk::projection)
        .def_readonly("cell_size", &gridchunk::RasterChunk::cell_size)
        .def_readonly("nodata", &gridchunk::RasterChunk::nodata)
        .def_readonly("driver", &gridchunk::RasterChunk::driver_id)
        .def_property_readonly("geotransform", [](const gridchunk::RasterChunk& c) {
            return std::vector<double>(c.geotransform.begin(), c.geotransform.end());
        })
        .def_property_readonly("data", [](py::object self) {
            const auto& chunk = self.cast<const gridchunk::RasterChunk&>();

            // Shares the chunk's buffer; the array keeps the chunk alive
            std::vector<ssize_t> shape = {chunk.bands, chunk.padded_rows(), chunk.padded_cols()};
            std::vector<ssize_t> strides = {
                static_cast<ssize_t>(chunk.band_stride() * sizeof(double)),
                static_cast<ssize_t>(chunk.padded_cols() * sizeof(double)),
                static_cast<ssize_t>(sizeof(double))
            };
            py::array_t<double> arr(shape, strides, chunk.data.data(), self);
            arr.attr("flags").attr("writeable") = false;
            return arr;
        })
        .def("core", [](const gridchunk::RasterChunk& c, int band) {
            py::array_t<double> arr(std::vector<ssize_t>{c.rows, c.cols});
            auto values = c.core(band);
            std::copy(values.begin(), values.end(), arr.mutable_data());
            return arr;
        }, py::arg("band"))
        .def("write", [](const gridchunk::RasterChunk& c, const std::string& out_path) {
            gridchunk::write_chunk(c, out_path);
        }, py::arg("out_path"));

    m.def("read_chunk", &gridchunk::read_chunk,
          py::arg("path"), py::arg("x_start") = 0, py::arg("y_start") = 0,
          py::arg("read_x") = 0, py::arg("read_y") = 0, py::arg("buffer") = 0);

    m.def("set_log_level", &gridchunk::set_log_level, py::arg("level"));
}
