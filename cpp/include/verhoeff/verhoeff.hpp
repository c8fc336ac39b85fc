// include/verhoeff/verhoeff.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "error.hpp"

namespace verhoeff {

// Bump when the public contract changes (handy for logging/UI).
inline constexpr const char* VERHOEFF_VERSION = "0.1.0";

// Length of an Aadhaar number including its check digit.
inline constexpr std::size_t AADHAAR_LENGTH = 12;

// Check digit for `input` (ASCII digits only). Appending the returned digit
// yields a sequence that validate() accepts.
Result<std::uint8_t> compute_checksum_strict(std::string_view input);

// Permissive form: returns 0 on any malformed input. A 0 here is
// indistinguishable from a genuine check digit of 0; use
// compute_checksum_strict() wherever a failure has to be noticed.
std::uint8_t compute_checksum(std::string_view input);

// Ok(true) iff the trailing digit of `input` is its correct check digit.
// Empty input is reported as ErrorKind::EmptyInput.
Result<bool> validate_strict(std::string_view input);

// Permissive form: false on a wrong check digit and on any malformed input.
bool validate(std::string_view input);

// `input` followed by its check digit. Malformed input comes back unchanged,
// so this cannot signal errors; check with compute_checksum_strict() first.
std::string append_checksum(std::string_view input);

// Fixed-length ID validation: the length is checked before the characters,
// and both before the check digit. A required_length of 0 always fails
// with InvalidLength.
Result<bool> validate_fixed_length_id(std::string_view input,
                                      std::size_t required_length = AADHAAR_LENGTH);

// 12-digit Aadhaar number.
Result<bool> validate_aadhaar(std::string_view input);

// Build fingerprint, e.g. "verhoeff:0.1.0; gmp:6.3.0; gcc:13.2.0".
std::string engine_info();

} // namespace verhoeff
