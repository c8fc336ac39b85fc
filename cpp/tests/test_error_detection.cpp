#include "verhoeff/verhoeff.hpp"
#include <catch2/catch.hpp>
#include <cstdint>
#include <string>
#include <utility>

TEST_CASE("Every single-digit substitution is detected") {
  using verhoeff::append_checksum; using verhoeff::validate;

  for (auto base : {"12345", "987654321", "1111111", "1234567890", "0"}) {
    const std::string full = append_checksum(base);
    REQUIRE(validate(full));
    for (std::size_t pos = 0; pos < full.size(); ++pos) {
      for (char d = '0'; d <= '9'; ++d) {
        if (d == full[pos]) continue;
        std::string modified = full;
        modified[pos] = d;
        INFO(full << " -> " << modified);
        REQUIRE_FALSE(validate(modified));
      }
    }
  }
}

TEST_CASE("Only the computed check digit validates") {
  for (auto s : {"236", "0101010101", "9090909090", "123123123123", "1123581347"}) {
    const int check = verhoeff::compute_checksum(s);
    for (int d = 0; d < 10; ++d)
      REQUIRE(verhoeff::validate(std::string(s) + char('0' + d)) == (d == check));
  }
}

TEST_CASE("Every adjacent transposition is detected") {
  using verhoeff::append_checksum; using verhoeff::validate;

  for (auto base : {"12345", "987654321", "1234567890", "31415926535897932384"}) {
    const std::string full = append_checksum(base);
    for (std::size_t i = 0; i + 1 < full.size(); ++i) {
      if (full[i] == full[i + 1]) continue;
      std::string swapped = full;
      std::swap(swapped[i], swapped[i + 1]);
      INFO(full << " -> " << swapped);
      REQUIRE_FALSE(validate(swapped));
    }
  }
}

TEST_CASE("Most gap-2 transpositions are detected") {
  const std::string full = verhoeff::append_checksum("1234567890");
  unsigned detected = 0, total = 0;
  for (std::size_t i = 0; i + 2 < full.size(); ++i) {
    if (full[i] == full[i + 2]) continue;
    std::string swapped = full;
    std::swap(swapped[i], swapped[i + 2]);
    ++total;
    if (!verhoeff::validate(swapped)) ++detected;
  }
  REQUIRE(total > 0);
  REQUIRE(detected * 2 > total);
}

TEST_CASE("Pseudo-random inputs round-trip and reject a bumped digit") {
  std::uint32_t seed = 42;
  auto next = [&seed] {
    seed = (seed * 1103515245u + 12345u) % (1u << 31);
    return seed;
  };
  for (int n = 0; n < 100; ++n) {
    const std::size_t len = 10 + next() % 91;
    std::string s;
    for (std::size_t k = 0; k < len; ++k) s += char('0' + next() % 10);

    std::string full = verhoeff::append_checksum(s);
    REQUIRE(verhoeff::validate(full));

    const std::size_t pos = next() % full.size();
    full[pos] = char('0' + (full[pos] - '0' + 1) % 10);
    REQUIRE_FALSE(verhoeff::validate(full));
  }
}
