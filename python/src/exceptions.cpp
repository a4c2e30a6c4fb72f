/**
 * Exception handling for asciify Python bindings.
 *
 * Maps core C++ exceptions to Python exceptions.
 */

#include "exceptions.hpp"

#include <pybind11/pybind11.h>

#include <stdexcept>

namespace py = pybind11;

namespace asciify::python {

static PyObject* AsciifyError = nullptr;

void RegisterExceptions(py::module_& m) {
  AsciifyError =
      PyErr_NewException("asciify.AsciifyError", PyExc_Exception, nullptr);
  py::setattr(m, "AsciifyError", py::handle(AsciifyError));

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const std::out_of_range& e) {
      PyErr_SetString(PyExc_IndexError, e.what());
    } catch (const std::runtime_error& e) {
      PyErr_SetString(AsciifyError, e.what());
    }
  });
}

}  // namespace asciify::python
