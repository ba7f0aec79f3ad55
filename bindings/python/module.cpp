// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "pcgrandom/errors.hpp"
#include "pcgrandom/pcg32.hpp"

namespace py = pybind11;
using namespace pcgr;

// InvalidArgument surfaces as IndexError and NullBuffer as ValueError
// through pybind11's std::out_of_range / std::invalid_argument translation.
PYBIND11_MODULE(pcgrandom_python, m){
  m.attr("DEFAULT_STREAM") = Pcg32::DEFAULT_STREAM;
  py::class_<Pcg32>(m, "PcgRandom")
    .def(py::init<>())
    .def(py::init<uint64_t, uint64_t>(), py::arg("seed"), py::arg("stream") = Pcg32::DEFAULT_STREAM)
    .def_static("from_clock", &Pcg32::from_clock, py::arg("stream"))
    .def_property_readonly("state", &Pcg32::state)
    .def_property_readonly("increment", &Pcg32::increment)
    .def("next_u32", &Pcg32::next_u32)
    .def("next_bounded", &Pcg32::next_bounded, py::arg("max"))
    .def("next", &Pcg32::next)
    .def("next_below", &Pcg32::next_below, py::arg("max"))
    .def("next_in_range", &Pcg32::next_in_range, py::arg("min"), py::arg("max"))
    .def("fill_bytes", [](Pcg32& g, py::object buffer){
      if (buffer.is_none()) throw NullBuffer("buffer");
      if (!py::isinstance<py::buffer>(buffer)) throw py::type_error("fill_bytes: expected a writable bytes-like object");
      // Fills the caller's memory in place; read-only buffers (bytes) raise BufferError here.
      py::buffer_info info = buffer.cast<py::buffer>().request(true);
      if (info.ndim != 1 || info.itemsize != 1 || info.strides[0] != 1)
        throw py::type_error("fill_bytes: expected a contiguous one-dimensional byte buffer");
      uint8_t none = 0;
      g.fill_bytes(info.size ? static_cast<uint8_t*>(info.ptr) : &none, (std::size_t)info.size);
    }, py::arg("buffer"))
    .def("sample", &Pcg32::sample)
    .def("random", &Pcg32::sample);
}
