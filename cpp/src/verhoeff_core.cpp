// src/verhoeff_core.cpp
#include "verhoeff/digits.hpp"
#include "verhoeff/tables.hpp"
#include "verhoeff/verhoeff.hpp"

#include <cstdint>
#include <gmp.h>
#include <stdexcept>
#include <string>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}
} // namespace

namespace verhoeff {
namespace {

// Right-to-left fold of `digits` through the tables. `offset` is the
// reverse position of the last digit: 1 when the check digit is still to be
// appended, 0 when it is already the last digit.
std::uint8_t fold(const DigitSequence& digits, unsigned offset) {
  std::uint8_t c = 0;
  std::size_t i = offset;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++i) {
    const std::uint8_t permuted = P_TABLE[i % PERMUTATION_PERIOD][*it];
    c = D_TABLE[c][permuted];

#if defined(VERHOEFF_ENABLE_DEBUG_INVARIANTS) || !defined(NDEBUG)
    if (c > 9)
      throw std::logic_error("Verhoeff invariant violated: accumulator out of range");
#endif
  }
  return c;
}

} // namespace

Result<std::uint8_t> compute_checksum_strict(std::string_view input) {
  auto digits = parse_digits(input);
  if (!digits)
    return boost::outcome_v2::failure(digits.error());
  return boost::outcome_v2::success(INV_TABLE[fold(digits.value(), 1)]);
}

std::uint8_t compute_checksum(std::string_view input) {
  auto r = compute_checksum_strict(input);
  return r ? r.value() : std::uint8_t{0};
}

Result<bool> validate_strict(std::string_view input) {
  auto digits = parse_digits(input);
  if (!digits)
    return boost::outcome_v2::failure(digits.error());
  return boost::outcome_v2::success(fold(digits.value(), 0) == 0);
}

bool validate(std::string_view input) {
  auto r = validate_strict(input);
  return r && r.value();
}

std::string append_checksum(std::string_view input) {
  std::string out(input);
  auto r = compute_checksum_strict(input);
  if (r)
    out.push_back(static_cast<char>('0' + r.value()));
  return out;
}

std::string engine_info() {
  return std::string("verhoeff:") + VERHOEFF_VERSION + "; gmp:" +
         (::gmp_version ? ::gmp_version : "?") + "; " + compiler_info();
}

} // namespace verhoeff
