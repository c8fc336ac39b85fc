// include/verhoeff/bigint.hpp
#pragma once
#include <cstdint>
#include <gmp.h>

#include "error.hpp"

namespace verhoeff {

// Overloads for numeric IDs held as GMP integers. The digit string is the
// base-10 rendering of `n`, so leading zeros cannot be represented; a
// negative value fails with InvalidCharacter('-') at position 0.
Result<std::uint8_t> compute_checksum_strict(const mpz_t n);
Result<bool> validate_strict(const mpz_t n);

// out = n * 10 + check digit; returns the digit. On failure `out` is set to
// `n`. `out` must be initialized and may alias `n`.
Result<std::uint8_t> append_checksum(const mpz_t n, mpz_t out);

} // namespace verhoeff
