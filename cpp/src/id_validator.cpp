// src/id_validator.cpp
#include "verhoeff/digits.hpp"
#include "verhoeff/verhoeff.hpp"

namespace verhoeff {

Result<bool> validate_fixed_length_id(std::string_view input,
                                      std::size_t required_length) {
  // Length first: a wrong-length input never reaches the checksum. No input
  // can satisfy a required length of 0.
  if (required_length == 0 || input.size() != required_length)
    return boost::outcome_v2::failure(
        make_invalid_length(input.size(), required_length));

  auto digits = parse_digits(input);
  if (!digits)
    return boost::outcome_v2::failure(digits.error());

  // A single-digit ID has no payload to compute over, so only the full
  // sequence check applies.
  if (required_length == 1)
    return validate_strict(input);

  auto expected = compute_checksum_strict(input.substr(0, required_length - 1));
  if (!expected)
    return boost::outcome_v2::failure(expected.error());
  return boost::outcome_v2::success(expected.value() == digits.value().back());
}

Result<bool> validate_aadhaar(std::string_view input) {
  return validate_fixed_length_id(input, AADHAAR_LENGTH);
}

} // namespace verhoeff
