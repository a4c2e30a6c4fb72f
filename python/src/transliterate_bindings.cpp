/**
 * Conversion and stage explainer bindings for asciify Python bindings.
 */

#include "transliterate_bindings.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <asciify/stages.hpp>
#include <asciify/transliterate.hpp>

#include <string>

namespace py = pybind11;

namespace asciify::python {

void BindTransliterate(py::module_& m) {
  py::class_<ConversionStats>(m, "ConversionStats", "Length counts of one conversion")
      .def(py::init<>())
      .def_readonly("in_chars", &ConversionStats::in_chars,
                    "Input length in UTF-16 code units")
      .def_readonly("out_chars", &ConversionStats::out_chars,
                    "Output length in ASCII characters")
      .def_property_readonly("removed", &ConversionStats::Removed,
                             "in_chars - out_chars (negative when substitutions expand)")
      .def("__repr__", [](const ConversionStats& s) {
        return "ConversionStats(in_chars=" + std::to_string(s.in_chars) +
               ", out_chars=" + std::to_string(s.out_chars) +
               ", removed=" + std::to_string(s.Removed()) + ")";
      });

  py::class_<ConversionResult>(m, "ConversionResult", "ASCII text and its stats")
      .def_readonly("ascii", &ConversionResult::ascii)
      .def_readonly("stats", &ConversionResult::stats)
      .def("__str__", [](const ConversionResult& r) { return r.ascii; });

  m.def(
      "convert",
      [](const std::string& text) {
        py::gil_scoped_release release;
        return Convert(text);
      },
      py::arg("text"),
      R"doc(
Transliterate text to ASCII.

Args:
    text: Any Unicode string

Returns:
    ConversionResult with .ascii and .stats
)doc");

  m.def(
      "to_ascii",
      [](const std::string& text) {
        py::gil_scoped_release release;
        return ToASCII(text);
      },
      py::arg("text"), "Transliterate text to ASCII and return only the string.");

  m.def(
      "is_ascii", [](const std::string& text) { return IsASCII(text); },
      py::arg("text"), "True if every character is in [0, 127].");
}

void BindStages(py::module_& m) {
  py::class_<Stage>(m, "Stage", "One step of the pipeline explainer")
      .def_readonly("ordinal", &Stage::ordinal)
      .def_property_readonly("label", [](const Stage& s) { return std::string(s.label); })
      .def_property_readonly("description",
                             [](const Stage& s) { return std::string(s.description); })
      .def_readonly("rule_count", &Stage::rule_count)
      .def("__repr__", [](const Stage& s) {
        return "Stage(" + std::to_string(s.ordinal) + ", '" + s.label + "')";
      });

  py::class_<StepResult>(m, "StepResult", "Output of one stage applied to a sample")
      .def_readonly("text", &StepResult::text)
      .def_readonly("description", &StepResult::description);

  m.def("stages", &Stages, "List the seven explainer stages (ordinal 0-6).");

  m.def(
      "apply_stage",
      [](int ordinal, const std::string& sample) {
        py::gil_scoped_release release;
        return ApplyStage(ordinal, sample);
      },
      py::arg("ordinal"), py::arg("sample"),
      R"doc(
Apply stage `ordinal` to `sample`.

Raises:
    IndexError: If ordinal is not in [0, 6]
)doc");

  m.def("select_stage", &SelectStage, py::arg("ordinal"),
        "apply_stage(ordinal, DEMO_SAMPLE).");

  m.attr("DEMO_SAMPLE") = std::string(kDemoSample);
  m.attr("STAGE_COUNT") = kStageCount;
}

}  // namespace asciify::python
