#include <fmt/core.h>
#include <string>
#include <vector>
#include <optional>
#include <climits>
#include <cstdlib>
#include "bundle_reader.hpp"
#include "heap.hpp"
#include "parse_value_object.hpp"
#include "print_settings.hpp"
#include "renderer.hpp"
#include "trace.hpp"

struct CommandLineArgs {
    std::optional<std::string> settings_file;
    bool no_color = false;
    bool rainbow = false;
    std::optional<reprint::Radix> radix;
    std::optional<int> max_depth;
    std::string bundle_file;
    std::vector<std::string> value_names;
};

static void print_usage() {
    fmt::print(stderr, "Usage: reprint [OPTIONS] BUNDLE_FILE [VALUE_NAME...]\n");
    fmt::print(stderr, "Options:\n");
    fmt::print(stderr, "  --settings FILE, --settings=FILE  Read print settings from a JSON file\n");
    fmt::print(stderr, "  --no-color                        Disable ANSI colors\n");
    fmt::print(stderr, "  --rainbow                         Color brackets by nesting level\n");
    fmt::print(stderr, "  --radix NAME                      hex, dec, oct or bin\n");
    fmt::print(stderr, "  --max-depth N                     Render deeper values as <item>\n");
}

static std::string require_value(int argc, char* argv[], int i, const std::string& option) {
    if (i + 1 >= argc) {
        fmt::print(stderr, "Error: {} option requires an argument\n", option);
        std::exit(1);
    }
    return argv[i + 1];
}

// Parse command-line arguments according to: reprint [OPTIONS] BUNDLE_FILE [VALUE_NAME...].
CommandLineArgs parse_args(int argc, char* argv[]) {
    CommandLineArgs args;
    int i = 1;

    // Parse options.
    while (i < argc) {
        std::string arg = argv[i];

        if (arg.rfind("--settings=", 0) == 0) {
            args.settings_file = arg.substr(11);  // Length of "--settings=".
            i++;
        }
        else if (arg == "--settings") {
            args.settings_file = require_value(argc, argv, i, arg);
            i += 2;
        }
        else if (arg == "--no-color") {
            args.no_color = true;
            i++;
        }
        else if (arg == "--rainbow") {
            args.rainbow = true;
            i++;
        }
        else if (arg == "--radix") {
            std::string name = require_value(argc, argv, i, arg);
            args.radix = reprint::radix_from_name(name);
            if (!args.radix) {
                fmt::print(stderr, "Error: Unknown radix '{}'\n", name);
                std::exit(1);
            }
            i += 2;
        }
        else if (arg == "--max-depth") {
            std::string n = require_value(argc, argv, i, arg);
            args.max_depth = reprint::max_depth_from_text(n);
            if (!args.max_depth) {
                fmt::print(stderr, "Error: --max-depth needs an integer from 0 to {}, got '{}'\n", INT_MAX, n);
                std::exit(1);
            }
            i += 2;
        }
        // Stop at first non-option argument (the bundle file).
        else if (arg[0] != '-') {
            break;
        }
        else {
            fmt::print(stderr, "Error: Unknown option '{}'\n", arg);
            std::exit(1);
        }
    }

    // Next argument is the bundle file (required).
    if (i >= argc) {
        fmt::print(stderr, "Error: Missing BUNDLE_FILE argument\n");
        print_usage();
        std::exit(1);
    }
    args.bundle_file = argv[i++];

    // Remaining arguments name the values to print.
    while (i < argc) {
        args.value_names.push_back(argv[i++]);
    }

    return args;
}

int main(int argc, char* argv[]) {
    try {
        CommandLineArgs args = parse_args(argc, argv);

        reprint::PrintSettings settings;
        if (args.settings_file) {
            settings = reprint::load_settings_file(*args.settings_file);
        }
        if (args.no_color) {
            settings.colored = false;
        }
        if (args.rainbow) {
            settings.rainbow_bracket = true;
        }
        if (args.radix) {
            settings.radix = *args.radix;
        }
        if (args.max_depth) {
            settings.max_depth = args.max_depth;
        }

        // Open the bundle file and load its type metadata.
        reprint::BundleReader reader(args.bundle_file);
        reprint::HashedTypeTable types;
        size_t count = reader.load_types(types);
        if constexpr (reprint::TRACE_MAIN) {
            fmt::print(stderr, "Loaded {} types from {}\n", count, args.bundle_file);
        }

        std::vector<std::string> names = args.value_names;
        if (names.empty()) {
            names = reader.get_value_names();
        }

        reprint::Heap heap;
        reprint::Renderer renderer(types, settings);
        for (const auto& name : names) {
            reprint::ParseValueObject parser(heap, name);
            reprint::Cell value = parser.parse(reader.get_value(name));
            fmt::print("{}\n", renderer.render(value));
        }

        return 0;

    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
