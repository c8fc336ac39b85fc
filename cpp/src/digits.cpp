// src/digits.cpp
#include "verhoeff/digits.hpp"

#include <algorithm> // std::min
#include <string>

namespace verhoeff {
namespace {

// Byte count of the UTF-8 sequence starting with `lead`; 1 for ASCII and
// for bytes that cannot start a sequence.
inline std::size_t utf8_sequence_length(unsigned char lead) {
  if (lead >= 0xF0 && lead <= 0xF4)
    return 4;
  if (lead >= 0xE0)
    return lead <= 0xEF ? 3 : 1;
  if (lead >= 0xC2)
    return 2;
  return 1;
}

} // namespace

Result<DigitSequence> parse_digits(std::string_view input) {
  if (input.empty())
    return boost::outcome_v2::failure(make_empty_input());

  DigitSequence digits;
  digits.reserve(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if (ch < '0' || ch > '9') {
      const std::size_t n = std::min(
          utf8_sequence_length(static_cast<unsigned char>(ch)), input.size() - i);
      return boost::outcome_v2::failure(
          make_invalid_character(i, std::string(input.substr(i, n))));
    }
    digits.push_back(static_cast<std::uint8_t>(ch - '0'));
  }
  return digits;
}

} // namespace verhoeff
