/**
 * Main pybind11 module definition for asciify.
 */

#include <pybind11/pybind11.h>
#include <asciify/version.hpp>

#include "exceptions.hpp"
#include "transliterate_bindings.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_asciify, m) {
  m.doc() = R"doc(
asciify: Unicode to ASCII transliteration.

Decomposes text, substitutes common typographic symbols, strips accents
and drops whatever is still outside ASCII. A seven-stage explainer shows
the intermediate text after each step.

Basic usage:
    import asciify

    result = asciify.convert("Français naïve – 25°")
    print(result.ascii)           # "Francais naive - 25 deg"
    print(result.stats.removed)

    for stage in asciify.stages():
        print(stage.label, asciify.select_stage(stage.ordinal).text)
)doc";

  // Register exceptions first
  asciify::python::RegisterExceptions(m);

  asciify::python::BindTransliterate(m);
  asciify::python::BindStages(m);

  // Version info
  m.attr("__version__") = asciify::Version();

#ifdef ASCIIFY_BUILD_SERVER
  m.attr("SERVER_AVAILABLE") = true;
#else
  m.attr("SERVER_AVAILABLE") = false;
#endif
}
