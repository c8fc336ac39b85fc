// src/bigint.cpp
#include "verhoeff/bigint.hpp"
#include "verhoeff/verhoeff.hpp"

#include <cstring>
#include <string>

namespace verhoeff {
namespace {

// Base-10 text of n, with a leading '-' when negative.
std::string decimal_string(const mpz_t n) {
  // sizeinbase may overshoot by one; +2 covers sign and terminator.
  std::string buf(mpz_sizeinbase(n, 10) + 2, '\0');
  mpz_get_str(&buf[0], 10, n);
  buf.resize(std::strlen(buf.c_str()));
  return buf;
}

} // namespace

Result<std::uint8_t> compute_checksum_strict(const mpz_t n) {
  return compute_checksum_strict(decimal_string(n));
}

Result<bool> validate_strict(const mpz_t n) {
  return validate_strict(decimal_string(n));
}

Result<std::uint8_t> append_checksum(const mpz_t n, mpz_t out) {
  auto check = compute_checksum_strict(n);
  if (!check) {
    mpz_set(out, n);
    return check;
  }
  mpz_mul_ui(out, n, 10);
  mpz_add_ui(out, out, check.value());
  return check;
}

} // namespace verhoeff
