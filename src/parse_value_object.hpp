#ifndef PARSE_VALUE_OBJECT_HPP
#define PARSE_VALUE_OBJECT_HPP

#include "heap.hpp"
#include "value.hpp"
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace reprint {

class ValueParseError : public std::runtime_error {
public:
    explicit ValueParseError(const std::string& msg) : std::runtime_error(msg) {}
};

// Builds heap values from JSON value descriptions.
//
// Plain JSON maps onto the obvious values: integers are immediate numbers,
// floats are boxed doubles, null is void, strings are strings and arrays are
// lists. Everything else is an object with one discriminating key, for example
// {"int8": 5}, {"tuple": [1, 2]} or {"variant": "option", "id": 0, "args": [1]}.
class ParseValueObject {
public:
    ParseValueObject(Heap& heap, const std::string& idname);

    // Parse JSON text and plant the value in the heap.
    Cell parse(const std::string& json_str);

    // Plant an already parsed description.
    Cell plant_value(const nlohmann::json& j);

private:
    Cell plant_object(const nlohmann::json& j);
    Cell plant_sized(const std::string& key, const nlohmann::json& value);
    Cell plant_char(const nlohmann::json& value);
    Cell plant_bytes(const nlohmann::json& value);
    Cell plant_bigint(const nlohmann::json& value);
    Cell plant_rational(const nlohmann::json& value);
    Cell plant_record(const nlohmann::json& j);
    Cell plant_variant(const nlohmann::json& j);
    Cell plant_function(const nlohmann::json& value);
    Cell plant_raw(const nlohmann::json& value);
    std::vector<Cell> plant_items(const std::string& key, const nlohmann::json& value);

    // Throws if j has a key outside allowed.
    void check_keys(const nlohmann::json& j, std::initializer_list<const char*> allowed);
    uint64_t type_hash_of(const nlohmann::json& value);
    int64_t integer_in_range(const std::string& key, const nlohmann::json& value, int64_t low, int64_t high);

    Heap& heap_;
    std::string idname_;
};

} // namespace reprint

#endif // PARSE_VALUE_OBJECT_HPP
