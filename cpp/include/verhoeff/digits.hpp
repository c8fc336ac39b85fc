// include/verhoeff/digits.hpp
#pragma once
#include <cstdint>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace verhoeff {

using DigitSequence = std::vector<std::uint8_t>;

// Convert ASCII '0'..'9' to values 0..9, same length and order. Fails with
// EmptyInput, or with InvalidCharacter at the first other character
// (whitespace, signs and non-Latin numerals included).
Result<DigitSequence> parse_digits(std::string_view input);

} // namespace verhoeff
