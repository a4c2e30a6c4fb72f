/**
 * Exception handling for asciify Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace asciify::python {

/**
 * Register exception types and C++ exception translators with the module.
 *
 * std::out_of_range (bad stage ordinal) surfaces as IndexError through
 * pybind11's built-in translation; std::runtime_error (ICU unavailable)
 * surfaces as asciify.AsciifyError.
 */
void RegisterExceptions(pybind11::module_& m);

}  // namespace asciify::python
