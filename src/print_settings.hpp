#ifndef PRINT_SETTINGS_HPP
#define PRINT_SETTINGS_HPP

#include "numeric_text.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace reprint {

class PrintSettingsError : public std::runtime_error {
public:
    explicit PrintSettingsError(const std::string& msg) : std::runtime_error(msg) {}
};

constexpr size_t DEFAULT_WRAP_THRESHOLD = 200;
constexpr int MAX_INDENT_AMOUNT = 1024;

// Rendering policy for one render call.
struct PrintSettings {
    bool colored = true;
    int indent_amount = 2;
    std::optional<int> max_depth;  // Unbounded when empty.
    std::string new_line = "\n";
    bool print_suffix = true;
    int byte_limit = 32;
    bool rainbow_bracket = false;
    Radix radix = Radix::Dec;
    bool force_new_line = false;

    // A container splits when its single-line width reaches its threshold.
    // An empty threshold never splits.
    std::optional<size_t> list_wrap = DEFAULT_WRAP_THRESHOLD;
    std::optional<size_t> array_wrap = DEFAULT_WRAP_THRESHOLD;
    std::optional<size_t> record_wrap = DEFAULT_WRAP_THRESHOLD;
    std::optional<size_t> tuple_wrap = DEFAULT_WRAP_THRESHOLD;
};

// Parse settings from JSON text, starting from the defaults.
// Throws PrintSettingsError on malformed input.
PrintSettings settings_from_json(const std::string& json_str);

// Read and parse a JSON settings file.
PrintSettings load_settings_file(const std::string& path);

// "hex", "dec", "oct" or "bin".
std::optional<Radix> radix_from_name(const std::string& name);

// Decimal depth limit in [0, INT_MAX], or nothing.
std::optional<int> max_depth_from_text(const std::string& text);

} // namespace reprint

#endif // PRINT_SETTINGS_HPP
