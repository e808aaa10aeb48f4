#include "parse_value_object.hpp"
#include "numeric_text.hpp"
#include "trace.hpp"
#include "type_registry.hpp"
#include <fmt/core.h>

using json = nlohmann::json;

namespace reprint {

// Immediate numbers carry 62 bits.
static constexpr int64_t IMMEDIATE_MIN = -(int64_t{1} << 61);
static constexpr int64_t IMMEDIATE_MAX = (int64_t{1} << 61) - 1;

// Decode a string holding exactly one UTF-8 encoded code point.
static bool decode_single_code_point(const std::string& text, char32_t& code_point) {
    if (text.empty()) {
        return false;
    }
    auto lead = static_cast<unsigned char>(text[0]);
    size_t count;
    if (lead < 0x80) {
        code_point = lead;
        count = 1;
    } else if ((lead & 0xE0) == 0xC0) {
        code_point = lead & 0x1F;
        count = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        code_point = lead & 0x0F;
        count = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        code_point = lead & 0x07;
        count = 4;
    } else {
        return false;
    }
    if (text.size() != count) {
        return false;
    }
    for (size_t i = 1; i < count; i++) {
        auto next = static_cast<unsigned char>(text[i]);
        if ((next & 0xC0) != 0x80) {
            return false;
        }
        code_point = (code_point << 6) | (next & 0x3F);
    }
    return true;
}

static int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    } else if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    } else if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

ParseValueObject::ParseValueObject(Heap& heap, const std::string& idname)
    : heap_(heap), idname_(idname) {
}

Cell ParseValueObject::parse(const std::string& json_str) {
    if constexpr (TRACE_PARSE_VALUE) {
        fmt::print(stderr, "Planting value: {}\n", idname_);
    }
    try {
        return plant_value(json::parse(json_str));
    } catch (const json::exception& e) {
        throw ValueParseError(fmt::format("{}: JSON parsing error: {}", idname_, e.what()));
    }
}

Cell ParseValueObject::plant_value(const json& j) {
    if constexpr (TRACE_PARSE_VALUE) {
        fmt::print(stderr, "Plant: {}\n", j.dump());
    }
    if (j.is_null()) {
        return make_void();
    } else if (j.is_boolean()) {
        return make_bool(j.get<bool>());
    } else if (j.is_number_unsigned()) {
        uint64_t n = j.get<uint64_t>();
        if (n > static_cast<uint64_t>(IMMEDIATE_MAX)) {
            throw ValueParseError(fmt::format("{}: integer {} does not fit an immediate number", idname_, n));
        }
        return make_tagged_int(static_cast<int64_t>(n));
    } else if (j.is_number_integer()) {
        int64_t n = j.get<int64_t>();
        if (n < IMMEDIATE_MIN || n > IMMEDIATE_MAX) {
            throw ValueParseError(fmt::format("{}: integer {} does not fit an immediate number", idname_, n));
        }
        return make_tagged_int(n);
    } else if (j.is_number_float()) {
        return heap_.allocate_float64(j.get<double>());
    } else if (j.is_string()) {
        return heap_.allocate_string(j.get<std::string>());
    } else if (j.is_array()) {
        return heap_.allocate_list(plant_items("list", j));
    } else if (j.is_object()) {
        return plant_object(j);
    }
    throw ValueParseError(fmt::format("{}: unsupported JSON value {}", idname_, j.dump()));
}

Cell ParseValueObject::plant_object(const json& j) {
    // Records and variants carry extra keys alongside the discriminating one.
    if (j.contains("record")) {
        return plant_record(j);
    }
    if (j.contains("variant")) {
        return plant_variant(j);
    }
    if (j.size() != 1) {
        throw ValueParseError(fmt::format("{}: value object needs exactly one key: {}", idname_, j.dump()));
    }

    const std::string& key = j.begin().key();
    const json& value = j.begin().value();
    if (key == "int8" || key == "int16" || key == "uint8" || key == "uint16"
        || key == "int32" || key == "uint32" || key == "int64" || key == "uint64") {
        return plant_sized(key, value);
    } else if (key == "float32") {
        if (!value.is_number()) {
            throw ValueParseError(fmt::format("{}: float32 needs a number", idname_));
        }
        return heap_.allocate_float32(value.get<float>());
    } else if (key == "float64") {
        if (!value.is_number()) {
            throw ValueParseError(fmt::format("{}: float64 needs a number", idname_));
        }
        return heap_.allocate_float64(value.get<double>());
    } else if (key == "char") {
        return plant_char(value);
    } else if (key == "bytes") {
        return plant_bytes(value);
    } else if (key == "bigint") {
        return plant_bigint(value);
    } else if (key == "rational") {
        return plant_rational(value);
    } else if (key == "tuple") {
        return heap_.allocate_tuple(plant_items(key, value));
    } else if (key == "array") {
        return heap_.allocate_array(plant_items(key, value));
    } else if (key == "list") {
        return heap_.allocate_list(plant_items(key, value));
    } else if (key == "function") {
        return plant_function(value);
    } else if (key == "raw") {
        return plant_raw(value);
    }
    throw ValueParseError(fmt::format("{}: unknown value kind '{}'", idname_, key));
}

int64_t ParseValueObject::integer_in_range(const std::string& key, const json& value, int64_t low, int64_t high) {
    if (!value.is_number_integer()) {
        throw ValueParseError(fmt::format("{}: {} needs an integer", idname_, key));
    }
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(high)) {
        throw ValueParseError(fmt::format("{}: {} out of range: {}", idname_, key, value.dump()));
    }
    int64_t n = value.get<int64_t>();
    if (n < low || n > high) {
        throw ValueParseError(fmt::format("{}: {} out of range: {}", idname_, key, n));
    }
    return n;
}

Cell ParseValueObject::plant_sized(const std::string& key, const json& value) {
    if (key == "int8") {
        return make_short(ShortKind::Int8, integer_in_range(key, value, INT8_MIN, INT8_MAX));
    } else if (key == "int16") {
        return make_short(ShortKind::Int16, integer_in_range(key, value, INT16_MIN, INT16_MAX));
    } else if (key == "uint8") {
        return make_short(ShortKind::Uint8, integer_in_range(key, value, 0, UINT8_MAX));
    } else if (key == "uint16") {
        return make_short(ShortKind::Uint16, integer_in_range(key, value, 0, UINT16_MAX));
    } else if (key == "int32") {
        return heap_.allocate_int32(static_cast<int32_t>(integer_in_range(key, value, INT32_MIN, INT32_MAX)));
    } else if (key == "uint32") {
        return heap_.allocate_uint32(static_cast<uint32_t>(integer_in_range(key, value, 0, UINT32_MAX)));
    } else if (key == "int64") {
        return heap_.allocate_int64(integer_in_range(key, value, INT64_MIN, INT64_MAX));
    }
    // uint64 may exceed the int64 range.
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        throw ValueParseError(fmt::format("{}: uint64 needs a non-negative integer", idname_));
    }
    return heap_.allocate_uint64(value.get<uint64_t>());
}

Cell ParseValueObject::plant_char(const json& value) {
    char32_t code_point = 0;
    if (value.is_string()) {
        if (!decode_single_code_point(value.get<std::string>(), code_point)) {
            throw ValueParseError(fmt::format("{}: char needs exactly one character", idname_));
        }
    } else {
        code_point = static_cast<char32_t>(integer_in_range("char", value, 0, 0x10FFFF));
    }
    return make_char(code_point);
}

Cell ParseValueObject::plant_bytes(const json& value) {
    if (!value.is_string()) {
        throw ValueParseError(fmt::format("{}: bytes needs a hex string", idname_));
    }
    const std::string hex = value.get<std::string>();
    if (hex.size() % 2 != 0) {
        throw ValueParseError(fmt::format("{}: bytes hex string has odd length", idname_));
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_digit(hex[i]);
        int low = hex_digit(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw ValueParseError(fmt::format("{}: bad hex digit in bytes '{}'", idname_, hex));
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return heap_.allocate_bytes(bytes);
}

Cell ParseValueObject::plant_bigint(const json& value) {
    if (!value.is_string()) {
        throw ValueParseError(fmt::format("{}: bigint needs a decimal string", idname_));
    }
    bool negative = false;
    std::vector<uint64_t> limbs;
    if (!parse_bigint(value.get<std::string>(), negative, limbs)) {
        throw ValueParseError(fmt::format("{}: bad bigint '{}'", idname_, value.get<std::string>()));
    }
    return heap_.allocate_bigint(negative, limbs);
}

Cell ParseValueObject::plant_rational(const json& value) {
    if (!value.is_array() || value.size() != 2) {
        throw ValueParseError(fmt::format("{}: rational needs [numerator, denominator]", idname_));
    }
    Cell numerator = plant_bigint(value[0]);
    Cell denominator = plant_bigint(value[1]);
    return heap_.allocate_rational(numerator, denominator);
}

void ParseValueObject::check_keys(const json& j, std::initializer_list<const char*> allowed) {
    for (const auto& item : j.items()) {
        bool known = false;
        for (const char* key : allowed) {
            if (item.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw ValueParseError(fmt::format("{}: unexpected key '{}' in {}", idname_, item.key(), j.dump()));
        }
    }
}

Cell ParseValueObject::plant_record(const json& j) {
    check_keys(j, {"record", "fields"});
    uint64_t type_hash = type_hash_of(j.at("record"));
    std::vector<Cell> fields;
    if (j.contains("fields")) {
        fields = plant_items("fields", j.at("fields"));
    }
    return heap_.allocate_record(type_hash, fields);
}

Cell ParseValueObject::plant_variant(const json& j) {
    check_keys(j, {"variant", "id", "args"});
    uint64_t type_hash = type_hash_of(j.at("variant"));
    auto variant_id = static_cast<uint16_t>(integer_in_range("id", j.at("id"), 0, UINT16_MAX));
    std::vector<Cell> args;
    if (j.contains("args")) {
        args = plant_items("args", j.at("args"));
    }
    return heap_.allocate_variant(type_hash, variant_id, args);
}

Cell ParseValueObject::plant_function(const json& value) {
    return heap_.allocate_function(static_cast<int>(integer_in_range("function", value, 0, UINT16_MAX)));
}

Cell ParseValueObject::plant_raw(const json& value) {
    if (!value.is_number_integer()) {
        throw ValueParseError(fmt::format("{}: raw needs an integer cell word", idname_));
    }
    Cell cell = make_raw_u64(value.get<uint64_t>());
    // A raw word must never point into memory we did not allocate.
    if (classify(cell) == ValueKind::HeapPointer) {
        throw ValueParseError(fmt::format("{}: raw word {:#x} is a heap pointer", idname_, cell.u64));
    }
    return cell;
}

std::vector<Cell> ParseValueObject::plant_items(const std::string& key, const json& value) {
    if (!value.is_array()) {
        throw ValueParseError(fmt::format("{}: {} needs an array", idname_, key));
    }
    std::vector<Cell> items;
    items.reserve(value.size());
    for (const auto& item : value) {
        items.push_back(plant_value(item));
    }
    return items;
}

uint64_t ParseValueObject::type_hash_of(const json& value) {
    if (value.is_string()) {
        const std::string name = value.get<std::string>();
        if (name == "option") {
            return OPTION_TYPE_HASH;
        } else if (name == "result") {
            return RESULT_TYPE_HASH;
        } else if (name == "list") {
            return LIST_TYPE_HASH;
        }
        throw ValueParseError(fmt::format("{}: unknown built-in type '{}'", idname_, name));
    }
    if (!value.is_number_integer()) {
        throw ValueParseError(fmt::format("{}: type hash must be an integer or a built-in name", idname_));
    }
    return value.get<uint64_t>();
}

} // namespace reprint
