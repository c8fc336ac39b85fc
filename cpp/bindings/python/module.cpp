#include <pybind11/pybind11.h>
#include <cstdint>
#include <string>
#include <stdexcept>

#include "verhoeff/verhoeff.hpp"

namespace py = pybind11;

// Strict results surface as ValueError carrying the error message.
template <class T>
static T unwrap(verhoeff::Result<T>&& r) {
  if (!r) throw py::value_error(verhoeff::to_string(r.error()));
  return r.value();
}

static int compute_checksum_strict_py(const std::string& input) {
  return unwrap(verhoeff::compute_checksum_strict(input));
}

static bool validate_strict_py(const std::string& input) {
  return unwrap(verhoeff::validate_strict(input));
}

static bool validate_fixed_length_id_py(const std::string& input,
                                        std::size_t required_length) {
  return unwrap(verhoeff::validate_fixed_length_id(input, required_length));
}

PYBIND11_MODULE(verhoeffcore, m) {
  m.doc() = "Verhoeff check digit core (pybind11)";
  m.attr("__version__") = verhoeff::VERHOEFF_VERSION;

  m.def("compute_checksum",
        [](const std::string& s) { return int(verhoeff::compute_checksum(s)); },
        py::arg("input"),
        R"pbdoc(Check digit for a string of ASCII digits; 0 if the input is malformed.)pbdoc");

  m.def("compute_checksum_strict", &compute_checksum_strict_py, py::arg("input"),
        R"pbdoc(
Check digit for a string of ASCII digits.

Raises:
  ValueError: empty input or a non-digit character.
)pbdoc");

  m.def("validate",
        [](const std::string& s) { return verhoeff::validate(s); },
        py::arg("input"),
        R"pbdoc(True iff the trailing digit is the correct check digit; False on malformed input.)pbdoc");

  m.def("validate_strict", &validate_strict_py, py::arg("input"),
        R"pbdoc(Like validate(), but raises ValueError on malformed input.)pbdoc");

  m.def("append_checksum",
        [](const std::string& s) { return verhoeff::append_checksum(s); },
        py::arg("input"),
        R"pbdoc(Input with its check digit appended; malformed input is returned unchanged.)pbdoc");

  m.def("validate_fixed_length_id", &validate_fixed_length_id_py,
        py::arg("input"),
        py::arg("required_length") = verhoeff::AADHAAR_LENGTH,
        R"pbdoc(
Validate an ID of exactly `required_length` digits, check digit last.

Raises:
  ValueError: wrong length (checked first) or a non-digit character.
)pbdoc");

  m.def("validate_aadhaar",
        [](const std::string& s) { return unwrap(verhoeff::validate_aadhaar(s)); },
        py::arg("input"),
        R"pbdoc(validate_fixed_length_id(input, 12).)pbdoc");

  m.def("engine_info", &verhoeff::engine_info);
}
