#include "verhoeff/verhoeff.hpp"
#include <catch2/catch.hpp>
#include <string>

TEST_CASE("Aadhaar-style IDs with a correct check digit pass") {
  using verhoeff::validate_aadhaar;
  for (auto base : {"12345678901", "98765432109", "11111111111", "99999999999",
                    "55555555555", "19900101000", "20001231009", "19500815055"}) {
    const std::string id = verhoeff::append_checksum(base);
    REQUIRE(id.size() == verhoeff::AADHAAR_LENGTH);
    auto r = validate_aadhaar(id);
    REQUIRE(r);
    REQUIRE(r.value());
  }
  auto known = validate_aadhaar("123456789010");
  REQUIRE(known);
  REQUIRE(known.value());
}

TEST_CASE("Wrong check digit is Ok(false), not an error") {
  for (auto id : {"123456789011", "987654321098", "123456789019"}) {
    auto r = verhoeff::validate_aadhaar(id);
    REQUIRE(r);
    REQUIRE_FALSE(r.value());
  }
}

TEST_CASE("Length is checked before characters and checksum") {
  using verhoeff::ErrorKind;

  auto short_id = verhoeff::validate_fixed_length_id("12345");
  REQUIRE_FALSE(short_id);
  REQUIRE(short_id.error() == verhoeff::make_invalid_length(5, 12));
  REQUIRE(verhoeff::to_string(short_id.error()) ==
          "ID numbers must be 12 digits, got 5 digits");

  auto long_id = verhoeff::validate_aadhaar("1234567890123");
  REQUIRE_FALSE(long_id);
  REQUIRE(long_id.error().kind == ErrorKind::InvalidLength);
  REQUIRE(long_id.error().length == 13);

  // Empty input fails the length check, not the parser.
  auto empty = verhoeff::validate_aadhaar("");
  REQUIRE_FALSE(empty);
  REQUIRE(empty.error() == verhoeff::make_invalid_length(0, 12));

  // Formatted input is the wrong length before it is the wrong characters.
  auto dashed = verhoeff::validate_aadhaar("12-34-56-7890");
  REQUIRE_FALSE(dashed);
  REQUIRE(dashed.error().kind == ErrorKind::InvalidLength);
}

TEST_CASE("Right length with a bad character reports the character") {
  for (auto id : {"12345678901a", "12345678901!", "123456789O12"}) {
    auto r = verhoeff::validate_aadhaar(id);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().kind == verhoeff::ErrorKind::InvalidCharacter);
  }
  auto r = verhoeff::validate_aadhaar("123456789O12");
  REQUIRE(r.error().character == "O");
  REQUIRE(r.error().position == 9);
}

TEST_CASE("Other required lengths") {
  const std::string id = verhoeff::append_checksum("8473643095");
  auto ok = verhoeff::validate_fixed_length_id(id, 11);
  REQUIRE(ok);
  REQUIRE(ok.value());

  auto wrong = verhoeff::validate_fixed_length_id(id, 12);
  REQUIRE_FALSE(wrong);
  REQUIRE(wrong.error() == verhoeff::make_invalid_length(11, 12));

  // Length 1: the lone digit is its own check digit.
  auto zero = verhoeff::validate_fixed_length_id("0", 1);
  REQUIRE(zero);
  REQUIRE(zero.value());
  auto five = verhoeff::validate_fixed_length_id("5", 1);
  REQUIRE(five);
  REQUIRE_FALSE(five.value());
}

TEST_CASE("Zero required length fails without throwing") {
  REQUIRE_NOTHROW(verhoeff::validate_fixed_length_id("", 0));
  for (const std::string s : {"", "0", "123456789010"}) {
    auto r = verhoeff::validate_fixed_length_id(s, 0);
    REQUIRE_FALSE(r);
    REQUIRE(r.error() == verhoeff::make_invalid_length(s.size(), 0));
  }
}
