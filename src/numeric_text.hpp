#ifndef NUMERIC_TEXT_HPP
#define NUMERIC_TEXT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace reprint {

enum class Radix {
    Bin = 2,
    Oct = 8,
    Dec = 10,
    Hex = 16
};

// "0x", "0o", "0b" or "" for decimal.
const char* radix_prefix(Radix radix);

// Sign, radix prefix, then digits: -0x1f, 0b101, 42.
std::string format_integer(int64_t value, Radix radix);
std::string format_unsigned(uint64_t value, Radix radix);

// Shortest round-trip text, always showing a decimal point unless an exponent,
// infinity or NaN is printed.
std::string format_float(double value);
std::string format_float32(float value);

// Decimal text of a sign-magnitude integer with little-endian 64-bit limbs.
std::string format_bigint(bool negative, const uint64_t* limbs, size_t count);

// Inverse of format_bigint for an optionally signed decimal string.
// Returns false if the text is not a decimal integer.
bool parse_bigint(const std::string& text, bool& negative, std::vector<uint64_t>& limbs);

} // namespace reprint

#endif // NUMERIC_TEXT_HPP
