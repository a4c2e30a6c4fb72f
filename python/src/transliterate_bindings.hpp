/**
 * Conversion and stage explainer bindings for asciify Python bindings.
 */

#pragma once

#include <pybind11/pybind11.h>

namespace asciify::python {

/**
 * Bind ConversionStats, ConversionResult and convert/to_ascii.
 */
void BindTransliterate(pybind11::module_& m);

/**
 * Bind Stage, StepResult and stages/apply_stage/select_stage.
 */
void BindStages(pybind11::module_& m);

}  // namespace asciify::python
