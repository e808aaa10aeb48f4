#include "numeric_text.hpp"
#include <fmt/core.h>

namespace reprint {

// Largest power of ten that fits in a limb.
static constexpr uint64_t DECIMAL_CHUNK = 10'000'000'000'000'000'000ULL;
static constexpr int DECIMAL_CHUNK_DIGITS = 19;

const char* radix_prefix(Radix radix) {
    switch (radix) {
        case Radix::Bin:
            return "0b";
        case Radix::Oct:
            return "0o";
        case Radix::Hex:
            return "0x";
        case Radix::Dec:
            break;
    }
    return "";
}

static std::string digits(uint64_t magnitude, Radix radix) {
    switch (radix) {
        case Radix::Bin:
            return fmt::format("{:b}", magnitude);
        case Radix::Oct:
            return fmt::format("{:o}", magnitude);
        case Radix::Hex:
            return fmt::format("{:x}", magnitude);
        case Radix::Dec:
            break;
    }
    return fmt::format("{}", magnitude);
}

std::string format_integer(int64_t value, Radix radix) {
    if (value >= 0) {
        return format_unsigned(static_cast<uint64_t>(value), radix);
    }
    // Negate in unsigned arithmetic so INT64_MIN survives.
    uint64_t magnitude = ~static_cast<uint64_t>(value) + 1;
    return fmt::format("-{}{}", radix_prefix(radix), digits(magnitude, radix));
}

std::string format_unsigned(uint64_t value, Radix radix) {
    return fmt::format("{}{}", radix_prefix(radix), digits(value, radix));
}

static std::string ensure_point(std::string text) {
    if (text.find_first_of(".en") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string format_float(double value) {
    return ensure_point(fmt::format("{}", value));
}

std::string format_float32(float value) {
    return ensure_point(fmt::format("{}", value));
}

std::string format_bigint(bool negative, const uint64_t* limbs, size_t count) {
    std::vector<uint64_t> work(limbs, limbs + count);
    while (!work.empty() && work.back() == 0) {
        work.pop_back();
    }
    if (work.empty()) {
        return "0";
    }

    // Repeated division by 10^19 yields base-10^19 chunks, least significant first.
    std::vector<uint64_t> chunks;
    while (!work.empty()) {
        unsigned __int128 remainder = 0;
        for (size_t i = work.size(); i-- > 0;) {
            unsigned __int128 current = (remainder << 64) | work[i];
            work[i] = static_cast<uint64_t>(current / DECIMAL_CHUNK);
            remainder = current % DECIMAL_CHUNK;
        }
        chunks.push_back(static_cast<uint64_t>(remainder));
        while (!work.empty() && work.back() == 0) {
            work.pop_back();
        }
    }

    std::string text = negative ? "-" : "";
    text += fmt::format("{}", chunks.back());
    for (size_t i = chunks.size() - 1; i-- > 0;) {
        text += fmt::format("{:0{}}", chunks[i], DECIMAL_CHUNK_DIGITS);
    }
    return text;
}

bool parse_bigint(const std::string& text, bool& negative, std::vector<uint64_t>& limbs) {
    size_t pos = 0;
    negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        pos++;
    }
    if (pos == text.size()) {
        return false;
    }

    limbs.clear();
    for (; pos < text.size(); pos++) {
        char ch = text[pos];
        if (ch < '0' || ch > '9') {
            return false;
        }
        // limbs = limbs * 10 + digit.
        unsigned __int128 carry = static_cast<unsigned>(ch - '0');
        for (auto& limb : limbs) {
            unsigned __int128 current = static_cast<unsigned __int128>(limb) * 10 + carry;
            limb = static_cast<uint64_t>(current);
            carry = current >> 64;
        }
        if (carry != 0) {
            limbs.push_back(static_cast<uint64_t>(carry));
        }
    }
    while (!limbs.empty() && limbs.back() == 0) {
        limbs.pop_back();
    }
    if (limbs.empty()) {
        negative = false;
    }
    return true;
}

} // namespace reprint
