// include/verhoeff/error.hpp
#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>

#include <boost/outcome.hpp>

namespace verhoeff {

enum class ErrorKind {
  InvalidCharacter, // a character outside ASCII '0'..'9'
  EmptyInput,       // zero-length input
  InvalidLength,    // fixed-length ID with the wrong number of characters
};

// Malformed-input report. Only the fields relevant to `kind` are set.
struct Error {
  ErrorKind kind = ErrorKind::EmptyInput;
  std::size_t position = 0;        // InvalidCharacter: byte offset
  std::string character;           // InvalidCharacter: the full UTF-8 sequence
  std::size_t length = 0;          // InvalidLength: actual byte length
  std::size_t expected_length = 0; // InvalidLength: required length
};

Error make_invalid_character(std::size_t position, std::string character);
Error make_empty_input();
Error make_invalid_length(std::size_t actual, std::size_t expected);

bool operator==(const Error& a, const Error& b) noexcept;
bool operator!=(const Error& a, const Error& b) noexcept;

// Human-readable message, e.g. "Input cannot be empty".
std::string to_string(const Error& e);
std::ostream& operator<<(std::ostream& os, const Error& e);

// Value-or-Error. .value() on a failed result throws
// boost::outcome_v2::bad_result_access_with<Error>.
template <class T>
using Result = boost::outcome_v2::checked<T, Error>;

} // namespace verhoeff
