// src/error.cpp
#include "verhoeff/error.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace verhoeff {

Error make_invalid_character(std::size_t position, std::string character) {
  Error e;
  e.kind = ErrorKind::InvalidCharacter;
  e.position = position;
  e.character = std::move(character);
  return e;
}

Error make_empty_input() {
  Error e;
  e.kind = ErrorKind::EmptyInput;
  return e;
}

Error make_invalid_length(std::size_t actual, std::size_t expected) {
  Error e;
  e.kind = ErrorKind::InvalidLength;
  e.length = actual;
  e.expected_length = expected;
  return e;
}

bool operator==(const Error& a, const Error& b) noexcept {
  return a.kind == b.kind && a.position == b.position &&
         a.character == b.character && a.length == b.length &&
         a.expected_length == b.expected_length;
}

bool operator!=(const Error& a, const Error& b) noexcept { return !(a == b); }

namespace {
// Control bytes would garble a terminal; print them as \xNN.
std::string printable(const std::string& s) {
  static const char* hex = "0123456789abcdef";
  std::string out;
  for (unsigned char ch : s) {
    if (ch < 0x20 || ch == 0x7f) {
      out += "\\x";
      out += hex[(ch >> 4) & 0xF];
      out += hex[ch & 0xF];
    } else {
      out += static_cast<char>(ch);
    }
  }
  return out;
}
} // namespace

std::string to_string(const Error& e) {
  switch (e.kind) {
  case ErrorKind::InvalidCharacter:
    return "Invalid character '" + printable(e.character) + "' at position " +
           std::to_string(e.position) + " - only digits allowed";
  case ErrorKind::EmptyInput:
    return "Input cannot be empty";
  case ErrorKind::InvalidLength:
    return "ID numbers must be " + std::to_string(e.expected_length) +
           " digits, got " + std::to_string(e.length) + " digits";
  }
  return "Unknown error";
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
  return os << to_string(e);
}

} // namespace verhoeff
