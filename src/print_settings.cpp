#include "print_settings.hpp"
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <fmt/core.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace reprint {

std::optional<Radix> radix_from_name(const std::string& name) {
    if (name == "hex") {
        return Radix::Hex;
    } else if (name == "dec") {
        return Radix::Dec;
    } else if (name == "oct") {
        return Radix::Oct;
    } else if (name == "bin") {
        return Radix::Bin;
    }
    return std::nullopt;
}

std::optional<int> max_depth_from_text(const std::string& text) {
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    long long depth = std::strtoll(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || depth > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(depth);
}

static bool read_bool(const json& value, const std::string& key) {
    if (!value.is_boolean()) {
        throw PrintSettingsError(fmt::format("Setting '{}' must be a boolean", key));
    }
    return value.get<bool>();
}

static int64_t read_count(const json& value, const std::string& key, int64_t max = INT64_MAX) {
    if (!value.is_number_integer()) {
        throw PrintSettingsError(fmt::format("Setting '{}' must be an integer", key));
    }
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(max)) {
        throw PrintSettingsError(fmt::format("Setting '{}' must be at most {}, got {}", key, max, value.dump()));
    }
    int64_t n = value.get<int64_t>();
    if (n < 0) {
        throw PrintSettingsError(fmt::format("Setting '{}' must not be negative, got {}", key, n));
    }
    if (n > max) {
        throw PrintSettingsError(fmt::format("Setting '{}' must be at most {}, got {}", key, max, n));
    }
    return n;
}

static std::optional<size_t> read_threshold(const json& value, const std::string& key) {
    if (value.is_null()) {
        return std::nullopt;
    }
    return static_cast<size_t>(read_count(value, key));
}

static void read_wrap(const json& wrap, PrintSettings& settings) {
    if (!wrap.is_object()) {
        throw PrintSettingsError("Setting 'wrap' must be an object");
    }
    for (const auto& [key, value] : wrap.items()) {
        if (key == "list") {
            settings.list_wrap = read_threshold(value, "wrap.list");
        } else if (key == "array") {
            settings.array_wrap = read_threshold(value, "wrap.array");
        } else if (key == "record") {
            settings.record_wrap = read_threshold(value, "wrap.record");
        } else if (key == "tuple") {
            settings.tuple_wrap = read_threshold(value, "wrap.tuple");
        } else {
            throw PrintSettingsError(fmt::format("Unknown wrap setting '{}'", key));
        }
    }
}

PrintSettings settings_from_json(const std::string& json_str) {
    PrintSettings settings;
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            throw PrintSettingsError("Settings must be a JSON object");
        }
        for (const auto& [key, value] : j.items()) {
            if (key == "colored") {
                settings.colored = read_bool(value, key);
            } else if (key == "indent") {
                settings.indent_amount = static_cast<int>(read_count(value, key, MAX_INDENT_AMOUNT));
            } else if (key == "maxDepth") {
                if (value.is_null()) {
                    settings.max_depth.reset();
                } else {
                    settings.max_depth = static_cast<int>(read_count(value, key, INT_MAX));
                }
            } else if (key == "newLine") {
                if (!value.is_string()) {
                    throw PrintSettingsError("Setting 'newLine' must be a string");
                }
                settings.new_line = value.get<std::string>();
            } else if (key == "printSuffix") {
                settings.print_suffix = read_bool(value, key);
            } else if (key == "byteLimit") {
                settings.byte_limit = static_cast<int>(read_count(value, key, INT_MAX));
            } else if (key == "rainbowBracket") {
                settings.rainbow_bracket = read_bool(value, key);
            } else if (key == "radix") {
                if (!value.is_string()) {
                    throw PrintSettingsError("Setting 'radix' must be a string");
                }
                auto radix = radix_from_name(value.get<std::string>());
                if (!radix) {
                    throw PrintSettingsError(fmt::format("Unknown radix '{}'", value.get<std::string>()));
                }
                settings.radix = *radix;
            } else if (key == "forceNewLine") {
                settings.force_new_line = read_bool(value, key);
            } else if (key == "wrap") {
                read_wrap(value, settings);
            } else {
                throw PrintSettingsError(fmt::format("Unknown setting '{}'", key));
            }
        }
    } catch (const json::exception& e) {
        throw PrintSettingsError(fmt::format("JSON parsing error: {}", e.what()));
    }
    return settings;
}

PrintSettings load_settings_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw PrintSettingsError(fmt::format("Failed to open settings file '{}'", path));
    }
    std::stringstream contents;
    contents << in.rdbuf();
    return settings_from_json(contents.str());
}

} // namespace reprint
