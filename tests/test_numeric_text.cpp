#include <catch2/catch_test_macros.hpp>
#include "../src/numeric_text.hpp"
#include <cstdint>

using namespace reprint;

TEST_CASE("Integers render with a radix prefix", "[numeric_text]") {
    REQUIRE(format_integer(255, Radix::Hex) == "0xff");
    REQUIRE(format_integer(-31, Radix::Hex) == "-0x1f");
    REQUIRE(format_integer(5, Radix::Bin) == "0b101");
    REQUIRE(format_integer(8, Radix::Oct) == "0o10");
    REQUIRE(format_integer(42, Radix::Dec) == "42");
    REQUIRE(format_integer(INT64_MIN, Radix::Dec) == "-9223372036854775808");
    REQUIRE(format_unsigned(UINT64_MAX, Radix::Hex) == "0xffffffffffffffff");
}

TEST_CASE("Floats always show a decimal point", "[numeric_text]") {
    REQUIRE(format_float(1.0) == "1.0");
    REQUIRE(format_float(0.5) == "0.5");
    REQUIRE(format_float(-2.25) == "-2.25");
    REQUIRE(format_float32(1.5f) == "1.5");
    REQUIRE(format_float32(3.0f) == "3.0");
}

TEST_CASE("Big integers render in decimal", "[numeric_text][bigint]") {
    uint64_t two_to_64[] = {0, 1};
    REQUIRE(format_bigint(false, two_to_64, 2) == "18446744073709551616");
    REQUIRE(format_bigint(true, two_to_64, 2) == "-18446744073709551616");
    REQUIRE(format_bigint(false, nullptr, 0) == "0");

    uint64_t small[] = {12345};
    REQUIRE(format_bigint(false, small, 1) == "12345");
}

TEST_CASE("Decimal text parses back into limbs", "[numeric_text][bigint]") {
    bool negative = false;
    std::vector<uint64_t> limbs;

    REQUIRE(parse_bigint("-123456789012345678901234567890", negative, limbs));
    REQUIRE(negative);
    REQUIRE(format_bigint(negative, limbs.data(), limbs.size()) == "-123456789012345678901234567890");

    REQUIRE(parse_bigint("-0", negative, limbs));
    REQUIRE_FALSE(negative);
    REQUIRE(limbs.empty());

    REQUIRE_FALSE(parse_bigint("", negative, limbs));
    REQUIRE_FALSE(parse_bigint("-", negative, limbs));
    REQUIRE_FALSE(parse_bigint("12a", negative, limbs));
}
