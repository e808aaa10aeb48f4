#include <catch2/catch_test_macros.hpp>
#include "../src/heap.hpp"
#include "../src/renderer.hpp"
#include "../src/type_registry.hpp"
#include <fmt/core.h>

using namespace reprint;

namespace {

// Registry that knows no types at all.
class EmptyRegistry : public TypeRegistry {
public:
    const MetadataBlock* find_type(uint64_t) const override { return nullptr; }
};

PrintSettings plain_settings() {
    PrintSettings settings;
    settings.colored = false;
    return settings;
}

std::string esc(Category category) {
    return foreground_escape(category_color(category));
}

constexpr uint64_t POINT_HASH = 10;
constexpr uint64_t EMPTY_HASH = 11;
constexpr uint64_t SHAPE_HASH = 20;

HashedTypeTable sample_types() {
    HashedTypeTable types;
    types.add_record(POINT_HASH, "Point", {"x", "y"});
    types.add_record(EMPTY_HASH, "Nothing", {});
    types.add_sum_type(SHAPE_HASH, "Shape", {
        {0, "Circle", 1, std::nullopt},
        {1, "Rect", 2, std::vector<std::string>{"w", "h"}},
        {2, "Dot", 0, std::nullopt},
    });
    return types;
}

} // namespace

TEST_CASE("Scalars render as plain text", "[renderer]") {
    EmptyRegistry types;
    PrintSettings settings = plain_settings();

    REQUIRE(render(make_tagged_int(42), types, settings) == "42");
    REQUIRE(render(make_tagged_int(-3), types, settings) == "-3");
    REQUIRE(render(make_bool(true), types, settings) == "true");
    REQUIRE(render(make_bool(false), types, settings) == "false");
    REQUIRE(render(make_void(), types, settings) == "void");
    REQUIRE(render(make_char(U'a'), types, settings) == "a");
    REQUIRE(render(make_char(U'é'), types, settings) == "\xc3\xa9");
}

TEST_CASE("Sized numbers carry suffixes", "[renderer][numbers]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    REQUIRE(render(make_short(ShortKind::Int8, 5), types, settings) == "5s");
    REQUIRE(render(make_short(ShortKind::Int16, -3), types, settings) == "-3S");
    REQUIRE(render(make_short(ShortKind::Uint8, 200), types, settings) == "200us");
    REQUIRE(render(make_short(ShortKind::Uint16, 7), types, settings) == "7uS");
    REQUIRE(render(heap.allocate_int32(-7), types, settings) == "-7l");
    REQUIRE(render(heap.allocate_uint32(7), types, settings) == "7ul");
    REQUIRE(render(heap.allocate_int64(-9), types, settings) == "-9L");
    REQUIRE(render(heap.allocate_uint64(9), types, settings) == "9uL");
    REQUIRE(render(heap.allocate_float32(1.5f), types, settings) == "1.5f");
    REQUIRE(render(heap.allocate_float64(2.0), types, settings) == "2.0");

    settings.print_suffix = false;
    REQUIRE(render(make_short(ShortKind::Int8, 5), types, settings) == "5");
    REQUIRE(render(heap.allocate_float32(1.5f), types, settings) == "1.5");
}

TEST_CASE("Radix applies to integers and keeps suffixes", "[renderer][numbers]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    settings.radix = Radix::Hex;
    REQUIRE(render(make_short(ShortKind::Int8, 5), types, settings) == "0x5s");
    REQUIRE(render(make_tagged_int(255), types, settings) == "0xff");
    REQUIRE(render(heap.allocate_int32(-16), types, settings) == "-0x10l");

    settings.radix = Radix::Bin;
    REQUIRE(render(make_tagged_int(5), types, settings) == "0b101");

    settings.radix = Radix::Oct;
    REQUIRE(render(make_tagged_int(8), types, settings) == "0o10");

    // Floats are not affected.
    REQUIRE(render(heap.allocate_float64(0.5), types, settings) == "0.5");
}

TEST_CASE("Big integers and rationals render in decimal", "[renderer][numbers]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();
    settings.radix = Radix::Hex;

    Cell big = heap.allocate_bigint(true, {0, 1});
    REQUIRE(render(big, types, settings) == "-18446744073709551616");
    REQUIRE(render(heap.allocate_bigint(false, {}), types, settings) == "0");

    Cell third = heap.allocate_rational(heap.allocate_bigint(false, {1}), heap.allocate_bigint(false, {3}));
    REQUIRE(render(third, types, settings) == "1/3");

    Cell mixed = heap.allocate_rational(make_tagged_int(-2), heap.allocate_bigint(false, {5}));
    REQUIRE(render(mixed, types, settings) == "-2/5");
}

TEST_CASE("Scalar rendering is deterministic", "[renderer]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings;
    Cell values[] = {
        make_tagged_int(7), make_bool(true), make_void(), make_char(U'z'),
        make_short(ShortKind::Uint16, 9), heap.allocate_float32(0.25f),
        heap.allocate_rational(make_tagged_int(1), make_tagged_int(2)),
        heap.allocate_bigint(false, {42, 42}),
    };
    for (Cell value : values) {
        REQUIRE(render(value, types, settings) == render(value, types, settings));
    }
}

TEST_CASE("Top-level strings are raw, nested strings are escaped", "[renderer][strings]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    Cell text = heap.allocate_string("line1\nline2");
    REQUIRE(render(text, types, settings) == "line1\nline2");
    REQUIRE(render(heap.allocate_list({text}), types, settings) == R"(["line1\nline2"])");

    Cell tricky = heap.allocate_string("a\"b\\c\t\b\f\r\v'");
    REQUIRE(render(heap.allocate_list({tricky}), types, settings) == R"(["a\"b\\c\t\b\f\r\v'"])");

    Cell quote = make_char(U'\'');
    REQUIRE(render(quote, types, settings) == "'");
    REQUIRE(render(heap.allocate_list({quote, make_char(U'\n')}), types, settings) == R"(['\'', '\n'])");
}

TEST_CASE("Single element tuples render as boxes", "[renderer][containers]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    Cell boxed = heap.allocate_tuple({make_tagged_int(5)});
    REQUIRE(render(boxed, types, settings) == "box(5)");

    settings.force_new_line = true;
    settings.tuple_wrap = 0;
    REQUIRE(render(boxed, types, settings) == "box(5)");
}

TEST_CASE("Empty containers", "[renderer][containers]") {
    HashedTypeTable types = sample_types();
    Heap heap;
    PrintSettings settings = plain_settings();

    REQUIRE(render(heap.allocate_list({}), types, settings) == "[]");
    REQUIRE(render(heap.allocate_array({}), types, settings) == "[>]");
    REQUIRE(render(heap.allocate_record(EMPTY_HASH, {}), types, settings) == "{ }");
    REQUIRE(render(heap.allocate_tuple({}), types, settings) == "()");

    // Forcing new lines leaves empty containers alone.
    settings.force_new_line = true;
    REQUIRE(render(heap.allocate_list({}), types, settings) == "[]");
    REQUIRE(render(heap.allocate_record(EMPTY_HASH, {}), types, settings) == "{ }");
}

TEST_CASE("Containers use their own punctuation", "[renderer][containers]") {
    HashedTypeTable types = sample_types();
    Heap heap;
    PrintSettings settings = plain_settings();

    Cell one = make_tagged_int(1);
    Cell two = make_tagged_int(2);

    REQUIRE(render(heap.allocate_tuple({one, heap.allocate_string("a")}), types, settings) == R"((1, "a"))");
    REQUIRE(render(heap.allocate_array({one, two, make_tagged_int(3)}), types, settings) == "[>1, 2, 3]");
    REQUIRE(render(heap.allocate_list({one, two}), types, settings) == "[1, 2]");
    REQUIRE(render(heap.allocate_record(POINT_HASH, {one, two}), types, settings) == "{ x: 1, y: 2 }");

    Cell nested = heap.allocate_list({heap.allocate_list({one, two}), heap.allocate_list({})});
    REQUIRE(render(nested, types, settings) == "[[1, 2], []]");

    Heap other;
    REQUIRE(render(other.allocate_function(2), types, settings) == "<lambda>");
}

TEST_CASE("Variants render by name with positional or record payloads", "[renderer][variants]") {
    HashedTypeTable types = sample_types();
    Heap heap;
    PrintSettings settings = plain_settings();

    Cell circle = heap.allocate_variant(SHAPE_HASH, 0, {make_tagged_int(3)});
    Cell rect = heap.allocate_variant(SHAPE_HASH, 1, {make_tagged_int(1), make_tagged_int(2)});
    Cell dot = heap.allocate_variant(SHAPE_HASH, 2, {});

    REQUIRE(render(circle, types, settings) == "Circle(3)");
    REQUIRE(render(rect, types, settings) == "Rect { w: 1, h: 2 }");
    REQUIRE(render(dot, types, settings) == "Dot");
}

TEST_CASE("Option and Result need no metadata", "[renderer][variants]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    REQUIRE(render(heap.allocate_variant(OPTION_TYPE_HASH, 0, {make_tagged_int(5)}), types, settings) == "Some(5)");
    REQUIRE(render(heap.allocate_variant(OPTION_TYPE_HASH, 1, {}), types, settings) == "None");
    REQUIRE(render(heap.allocate_variant(RESULT_TYPE_HASH, 0, {make_void()}), types, settings) == "Ok(void)");
    REQUIRE(render(heap.allocate_variant(RESULT_TYPE_HASH, 1, {heap.allocate_string("x")}), types, settings)
            == R"(Err("x"))");
}

TEST_CASE("Unresolvable shapes render placeholders", "[renderer][errors]") {
    HashedTypeTable types = sample_types();
    Heap heap;
    PrintSettings settings = plain_settings();

    REQUIRE(render(heap.allocate_record(999, {make_tagged_int(1)}), types, settings) == "<record value>");
    // More fields than the metadata names.
    REQUIRE(render(heap.allocate_record(POINT_HASH, {make_tagged_int(1), make_tagged_int(2), make_tagged_int(3)}),
                   types, settings) == "<record value>");
    REQUIRE(render(heap.allocate_variant(999, 0, {}), types, settings) == "<enum value>");
    REQUIRE(render(heap.allocate_variant(SHAPE_HASH, 9, {}), types, settings) == "<enum value>");
    // Arity disagrees with the metadata.
    REQUIRE(render(heap.allocate_variant(SHAPE_HASH, 0, {}), types, settings) == "<enum value>");
    REQUIRE(render(heap.allocate_variant(OPTION_TYPE_HASH, 5, {}), types, settings) == "<enum value>");

    EmptyRegistry nothing;
    REQUIRE(render(heap.allocate_record(POINT_HASH, {}), nothing, settings) == "<record value>");
}

TEST_CASE("Unknown encodings render typed placeholders", "[renderer][errors]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    REQUIRE(render(make_raw_u64(0x2), types, settings) == "<unknown value>");
    REQUIRE(render(make_raw_u64((4ULL << 3) | TAG_SPECIAL), types, settings) == "<unknown constant>");
    REQUIRE(render(make_raw_u64((9ULL << SHORT_KIND_SHIFT) | TAG_SHORT), types, settings) == "<unknown short value>");
    // A surrogate is not a character.
    REQUIRE(render(make_char(0xD800), types, settings) == "<unknown short value>");

    ObjectBuilder builder(heap.get_pool());
    builder.add_u64(0);
    REQUIRE(render(builder.commit(), types, settings) == "<unknown heap value>");

    builder.add_cell(pack_header(Flavour::Boxed, 99, 0, 1));
    builder.add_u64(0);
    REQUIRE(render(builder.commit(), types, settings) == "<unknown number>");

    Cell bad_rational = heap.allocate_rational(heap.allocate_string("1"), make_tagged_int(2));
    REQUIRE(render(bad_rational, types, settings) == "<unknown number>");

    Cell malformed_list = heap.allocate_variant(LIST_TYPE_HASH, 7, {});
    REQUIRE(render(malformed_list, types, settings) == "<enum value>");
}

TEST_CASE("Lists ending in a non-list tail show the tail last", "[renderer][containers]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    Cell improper = heap.allocate_variant(LIST_TYPE_HASH, LIST_CONS_VARIANT, {make_tagged_int(1), make_tagged_int(5)});
    REQUIRE(render(improper, types, settings) == "[1, 5]");
}

TEST_CASE("Deeply nested containers render without repeated measuring", "[renderer][wrap]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    constexpr int LEVELS = 30;
    Cell nested = make_tagged_int(1);
    for (int i = 0; i < LEVELS; i++) {
        nested = heap.allocate_list({nested});
    }
    std::string expected = std::string(LEVELS, '[') + "1" + std::string(LEVELS, ']');
    REQUIRE(render(nested, types, settings) == expected);

    // Split decisions are unchanged: only the outer levels reach the threshold.
    settings.list_wrap = 58;
    std::string wrapped = render(nested, types, settings);
    REQUIRE(wrapped.substr(0, 6) == "[\n  [\n");
    REQUIRE(wrapped.find(std::string(LEVELS - 2, '[') + "1") != std::string::npos);
}

TEST_CASE("Wrap threshold is compared with >=", "[renderer][wrap]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    Cell list = heap.allocate_list({make_tagged_int(1), make_tagged_int(2), make_tagged_int(3)});
    Renderer renderer(types, settings);
    REQUIRE(renderer.measure_width(list, 0, 0) == 9);

    settings.list_wrap = 9;
    REQUIRE(render(list, types, settings) == "[\n  1,\n  2,\n  3\n]");

    settings.list_wrap = 10;
    REQUIRE(render(list, types, settings) == "[1, 2, 3]");

    settings.list_wrap = std::nullopt;
    REQUIRE(render(list, types, settings) == "[1, 2, 3]");
}

TEST_CASE("Force new line splits regardless of width", "[renderer][wrap]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();
    settings.force_new_line = true;
    settings.array_wrap = std::nullopt;

    Cell array = heap.allocate_array({make_tagged_int(1), make_tagged_int(2)});
    REQUIRE(render(array, types, settings) == "[>\n  1,\n  2\n]");
}

TEST_CASE("Nested splits indent by depth", "[renderer][wrap]") {
    HashedTypeTable types = sample_types();
    Heap heap;
    PrintSettings settings = plain_settings();
    settings.list_wrap = std::nullopt;
    settings.tuple_wrap = 0;

    Cell pair = heap.allocate_tuple({make_tagged_int(1), make_tagged_int(2)});
    REQUIRE(render(heap.allocate_list({pair}), types, settings) == "[(\n    1,\n    2\n  )]");

    settings.record_wrap = 0;
    Cell point = heap.allocate_record(POINT_HASH, {make_tagged_int(1), make_tagged_int(2)});
    REQUIRE(render(point, types, settings) == "{\n  x: 1,\n  y: 2\n}");

    Cell circle = heap.allocate_variant(SHAPE_HASH, 0, {make_tagged_int(3)});
    REQUIRE(render(circle, types, settings) == "Circle(\n  3\n)");
}

TEST_CASE("Indent amount and newline are configurable", "[renderer][wrap]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();
    settings.list_wrap = 0;
    settings.indent_amount = 4;
    settings.new_line = "\r\n";

    REQUIRE(render(heap.allocate_list({make_tagged_int(1)}), types, settings) == "[\r\n    1\r\n]");
}

TEST_CASE("Max depth replaces deeper values with <item>", "[renderer][depth]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    settings.max_depth = 0;
    REQUIRE(render(make_tagged_int(5), types, settings) == "5");
    REQUIRE(render(heap.allocate_list({make_tagged_int(1), make_tagged_int(2)}), types, settings)
            == "[<item>, <item>]");
    REQUIRE(render(heap.allocate_tuple({make_tagged_int(1)}), types, settings) == "box(<item>)");

    settings.max_depth = 1;
    Cell nested = heap.allocate_list({heap.allocate_list({make_tagged_int(1)})});
    REQUIRE(render(nested, types, settings) == "[[<item>]]");
}

TEST_CASE("Bytes render as truncated hex groups", "[renderer][bytes]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings = plain_settings();

    std::vector<uint8_t> bytes;
    for (int i = 0; i < 40; i++) {
        bytes.push_back(static_cast<uint8_t>(i));
    }
    std::string expected = "<bytes:";
    for (int i = 0; i < 32; i++) {
        expected += fmt::format(" {:02x}", i);
    }
    expected += " ...>";
    REQUIRE(render(heap.allocate_bytes(bytes), types, settings) == expected);

    REQUIRE(render(heap.allocate_bytes({0x0a, 0xff, 0x00}), types, settings) == "<bytes: 0a ff 00>");

    settings.byte_limit = 2;
    REQUIRE(render(heap.allocate_bytes({0x0a, 0xff, 0x00}), types, settings) == "<bytes: 0a ff ...>");
}

TEST_CASE("Colored output emits escapes only on color changes", "[renderer][color]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings;

    REQUIRE(render(make_tagged_int(1), types, settings) == esc(Category::Number) + "1\x1b[0m");

    Cell list = heap.allocate_list({make_tagged_int(1), make_tagged_int(2)});
    std::string expected = esc(Category::Default) + "["
                         + esc(Category::Number) + "1"
                         + esc(Category::Default) + ", "
                         + esc(Category::Number) + "2"
                         + esc(Category::Default) + "]"
                         + "\x1b[0m";
    REQUIRE(render(list, types, settings) == expected);

    settings.colored = false;
    REQUIRE(render(list, types, settings).find('\x1b') == std::string::npos);
}

TEST_CASE("Rainbow brackets cycle by nesting level", "[renderer][color]") {
    EmptyRegistry types;
    Heap heap;
    PrintSettings settings;
    settings.rainbow_bracket = true;

    auto slot = [](size_t i) { return foreground_escape(rainbow_color(i)); };

    Cell inner = heap.allocate_list({make_tagged_int(1)});
    Cell outer = heap.allocate_list({inner});
    std::string expected = slot(0) + "[" + slot(1) + "[" + esc(Category::Number) + "1"
                         + slot(1) + "]" + slot(0) + "]" + "\x1b[0m";
    REQUIRE(render(outer, types, settings) == expected);

    // Four levels wrap back to the first palette slot.
    Cell deep = heap.allocate_list({heap.allocate_list({heap.allocate_list({heap.allocate_list({})})})});
    std::string wrapped = slot(0) + "[" + slot(1) + "[" + slot(2) + "[" + slot(3) + "[]"
                        + slot(2) + "]" + slot(1) + "]" + slot(0) + "]" + "\x1b[0m";
    REQUIRE(rainbow_palette_size() == 3);
    REQUIRE(render(deep, types, settings) == wrapped);
}
