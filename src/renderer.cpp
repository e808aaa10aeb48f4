#include "renderer.hpp"
#include "heap.hpp"
#include "numeric_text.hpp"
#include "trace.hpp"
#include <algorithm>
#include <bit>
#include <fmt/core.h>

namespace reprint {

static constexpr std::string_view DEPTH_PLACEHOLDER = "<item>";

// C-style two-character escapes for control characters, backslash and the quote in use.
static std::string escape_text(std::string_view text, char quote) {
    std::string escaped;
    escaped.reserve(text.size() + 2);
    escaped += quote;
    for (char ch : text) {
        switch (ch) {
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            case '\v': escaped += "\\v"; break;
            case '\\': escaped += "\\\\"; break;
            default:
                if (ch == quote) {
                    escaped += '\\';
                }
                escaped += ch;
                break;
        }
    }
    escaped += quote;
    return escaped;
}

// UTF-8 encoding of a Unicode scalar value; nothing for surrogates or out of range values.
static std::optional<std::string> encode_utf8(uint64_t code_point) {
    std::string out;
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point >= 0xD800 && code_point <= 0xDFFF) {
        return std::nullopt;
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        return std::nullopt;
    }
    return out;
}

static const Cell* object_of(Cell value) {
    return static_cast<const Cell*>(as_detagged_ptr(value));
}

Renderer::Renderer(const TypeRegistry& registry, const PrintSettings& settings)
    : registry_(registry), settings_(settings) {
}

std::string Renderer::render(Cell value) const {
    width_cache_.clear();
    RenderBuffer out(settings_.colored);
    render_value(out, value, 0, 0, LineMode::Auto);
    width_cache_.clear();
    out.finish();
    return out.take();
}

size_t Renderer::measure_width(Cell value, int depth, size_t bracket_index) const {
    width_cache_.clear();
    size_t width = cached_width(value, depth, bracket_index);
    width_cache_.clear();
    return width;
}

size_t Renderer::cached_width(Cell value, int depth, size_t bracket_index) const {
    WidthKey key{value.u64, depth, bracket_index};
    auto it = width_cache_.find(key);
    if (it != width_cache_.end()) {
        return it->second;
    }
    // Dry run: colorless, discarded once measured.
    RenderBuffer scratch(false);
    render_value(scratch, value, depth, bracket_index, LineMode::SingleLine);
    width_cache_.emplace(key, scratch.size());
    return scratch.size();
}

void Renderer::render_value(RenderBuffer& out, Cell value, int depth, size_t bracket, LineMode mode) const {
    if (settings_.max_depth && depth > *settings_.max_depth) {
        out.write(Category::Default, DEPTH_PLACEHOLDER);
        return;
    }

    if constexpr (TRACE_RENDER) {
        fmt::print(stderr, "render: depth {} bracket {} value {}\n", depth, bracket, cell_to_string(value));
    }

    switch (classify(value)) {
        case ValueKind::ImmediateNumber:
            out.write(Category::Number, format_integer(as_detagged_int(value), settings_.radix));
            break;
        case ValueKind::Constant:
            render_constant(out, value);
            break;
        case ValueKind::ShortInline:
            render_short(out, value, depth);
            break;
        case ValueKind::HeapPointer:
            dispatch_heap(out, value, depth, bracket, mode);
            break;
        case ValueKind::Unknown:
            out.write(Category::Unknown, "<unknown value>");
            break;
    }
}

void Renderer::render_constant(RenderBuffer& out, Cell value) const {
    switch (classify_constant(value)) {
        case ConstantKind::True:
            out.write(Category::True, "true");
            break;
        case ConstantKind::False:
            out.write(Category::False, "false");
            break;
        case ConstantKind::Void:
            out.write(Category::Void, "void");
            break;
        case ConstantKind::Unknown:
            out.write(Category::Unknown, "<unknown constant>");
            break;
    }
}

std::string Renderer::suffix(std::string_view text) const {
    return settings_.print_suffix ? std::string(text) : std::string();
}

void Renderer::render_short(RenderBuffer& out, Cell value, int depth) const {
    switch (classify_short(value)) {
        case ShortKind::Char: {
            auto text = encode_utf8(short_unsigned_payload(value));
            if (!text) {
                out.write(Category::Unknown, "<unknown short value>");
            } else if (depth == 0) {
                out.write(Category::Char, *text);
            } else {
                out.write(Category::Char, escape_text(*text, '\''));
            }
            break;
        }
        case ShortKind::Int8:
            out.write(Category::Number,
                      format_integer(static_cast<int8_t>(short_signed_payload(value)), settings_.radix) + suffix("s"));
            break;
        case ShortKind::Int16:
            out.write(Category::Number,
                      format_integer(static_cast<int16_t>(short_signed_payload(value)), settings_.radix) + suffix("S"));
            break;
        case ShortKind::Uint8:
            out.write(Category::Number,
                      format_unsigned(static_cast<uint8_t>(short_unsigned_payload(value)), settings_.radix) + suffix("us"));
            break;
        case ShortKind::Uint16:
            out.write(Category::Number,
                      format_unsigned(static_cast<uint16_t>(short_unsigned_payload(value)), settings_.radix) + suffix("uS"));
            break;
        case ShortKind::Unknown:
            out.write(Category::Unknown, "<unknown short value>");
            break;
    }
}

void Renderer::dispatch_heap(RenderBuffer& out, Cell value, int depth, size_t bracket, LineMode mode) const {
    const Cell* object = object_of(value);
    ObjectHeader header = unpack_header(object[0]);

    switch (static_cast<Flavour>(header.flavour)) {
        case Flavour::String:
            render_string(out, object, header.length, depth);
            return;
        case Flavour::Bytes:
            render_bytes(out, object, header.length);
            return;
        case Flavour::Tuple:
            render_tuple(out, value, object, header.length, depth, bracket, mode);
            return;
        case Flavour::Array:
            render_array(out, value, object, header.length, depth, bracket, mode);
            return;
        case Flavour::Record:
            render_record(out, value, object, header.length, depth, bracket, mode);
            return;
        case Flavour::Variant:
            // Lists are cons cells of the built-in list type and print as [a, b, c].
            if (object[1].u64 == LIST_TYPE_HASH) {
                render_list(out, value, depth, bracket, mode);
            } else {
                render_variant(out, value, object, header.aux, header.length, depth, bracket, mode);
            }
            return;
        case Flavour::Boxed:
            render_boxed_number(out, object, header.subtag, header.aux, header.length);
            return;
        case Flavour::Function:
            out.write(Category::Lambda, "<lambda>");
            return;
    }
    out.write(Category::Unknown, "<unknown heap value>");
}

void Renderer::render_string(RenderBuffer& out, const Cell* object, uint32_t length, int depth) const {
    std::string_view text(reinterpret_cast<const char*>(&object[1]), length);
    if (depth == 0) {
        out.write(Category::String, text);
    } else {
        out.write(Category::String, escape_text(text, '"'));
    }
}

void Renderer::render_bytes(RenderBuffer& out, const Cell* object, uint32_t length) const {
    const uint8_t* data = reinterpret_cast<const uint8_t*>(&object[1]);
    size_t shown = std::min<size_t>(length, static_cast<size_t>(std::max(settings_.byte_limit, 0)));

    std::string text = "<bytes: ";
    for (size_t i = 0; i < shown; i++) {
        if (i > 0) {
            text += ' ';
        }
        text += fmt::format("{:02x}", data[i]);
    }
    if (shown < length) {
        text += " ...";
    }
    text += '>';
    out.write(Category::Bytes, text);
}

bool Renderer::should_split(Cell value, size_t count, std::optional<size_t> threshold,
                            int depth, size_t bracket, LineMode mode) const {
    if (mode == LineMode::SingleLine || count == 0) {
        return false;
    }
    if (settings_.force_new_line) {
        return true;
    }
    if (!threshold) {
        return false;
    }
    size_t width = cached_width(value, depth, bracket);
    if constexpr (TRACE_WRAP) {
        fmt::print(stderr, "wrap: depth {} width {} threshold {}\n", depth, width, *threshold);
    }
    return width >= *threshold;
}

void Renderer::write_bracket(RenderBuffer& out, std::string_view text, size_t bracket) const {
    if (settings_.rainbow_bracket) {
        out.write(rainbow_color(bracket), text);
    } else {
        out.write(Category::Default, text);
    }
}

void Renderer::write_line_break(RenderBuffer& out, int indent_level) const {
    out.write_plain(settings_.new_line);
    out.write_plain(std::string(static_cast<size_t>(settings_.indent_amount) * indent_level, ' '));
}

void Renderer::render_items(RenderBuffer& out, std::string_view open, std::string_view close,
                            const Cell* items, size_t count, bool split, int depth, size_t bracket) const {
    write_bracket(out, open, bracket);
    for (size_t i = 0; i < count; i++) {
        if (split) {
            write_line_break(out, depth + 1);
        }
        render_value(out, items[i], depth + 1, bracket + 1, LineMode::Auto);
        if (i + 1 < count) {
            out.write(Category::Default, split ? "," : ", ");
        }
    }
    if (split) {
        write_line_break(out, depth);
    }
    write_bracket(out, close, bracket);
}

void Renderer::render_fields(RenderBuffer& out, const std::vector<std::string>& names,
                             const Cell* values, bool split, int depth, size_t bracket) const {
    write_bracket(out, "{", bracket);
    if (names.empty()) {
        out.write_plain(" ");
        write_bracket(out, "}", bracket);
        return;
    }
    if (!split) {
        out.write_plain(" ");
    }
    for (size_t i = 0; i < names.size(); i++) {
        if (split) {
            write_line_break(out, depth + 1);
        }
        out.write(Category::RecordKey, names[i]);
        out.write(Category::Default, ": ");
        render_value(out, values[i], depth + 1, bracket + 1, LineMode::Auto);
        if (i + 1 < names.size()) {
            out.write(Category::Default, split ? "," : ", ");
        }
    }
    if (split) {
        write_line_break(out, depth);
    } else {
        out.write_plain(" ");
    }
    write_bracket(out, "}", bracket);
}

void Renderer::render_tuple(RenderBuffer& out, Cell value, const Cell* object, uint32_t arity,
                            int depth, size_t bracket, LineMode mode) const {
    if (arity == 1) {
        // A box never splits.
        out.write(Category::Box, "box");
        write_bracket(out, "(", bracket);
        render_value(out, object[1], depth + 1, bracket + 1, LineMode::Auto);
        write_bracket(out, ")", bracket);
        return;
    }
    bool split = should_split(value, arity, settings_.tuple_wrap, depth, bracket, mode);
    render_items(out, "(", ")", &object[1], arity, split, depth, bracket);
}

void Renderer::render_array(RenderBuffer& out, Cell value, const Cell* object, uint32_t length,
                            int depth, size_t bracket, LineMode mode) const {
    bool split = should_split(value, length, settings_.array_wrap, depth, bracket, mode);
    render_items(out, "[>", "]", &object[1], length, split, depth, bracket);
}

void Renderer::render_record(RenderBuffer& out, Cell value, const Cell* object, uint32_t arity,
                             int depth, size_t bracket, LineMode mode) const {
    uint64_t type_hash = object[1].u64;
    const MetadataBlock* block = registry_.find_type(type_hash);
    std::optional<std::vector<std::string>> names;
    if (block != nullptr) {
        names = field_names(*block, arity);
    }
    if (!names) {
        out.write(Category::Unknown, "<record value>");
        return;
    }
    bool split = should_split(value, arity, settings_.record_wrap, depth, bracket, mode);
    render_fields(out, *names, &object[2], split, depth, bracket);
}

void Renderer::render_variant(RenderBuffer& out, Cell value, const Cell* object, uint16_t variant_id,
                              uint32_t arity, int depth, size_t bracket, LineMode mode) const {
    uint64_t type_hash = object[1].u64;

    VariantInfo info;
    if (auto name = builtin_variant_name(type_hash, variant_id)) {
        info.name = *name;
        info.arity = arity;
    } else {
        const MetadataBlock* block = registry_.find_type(type_hash);
        std::optional<VariantInfo> found;
        if (block != nullptr) {
            found = variant_info(*block, variant_id);
        }
        if (!found || found->arity != arity) {
            out.write(Category::Unknown, "<enum value>");
            return;
        }
        info = std::move(*found);
    }

    out.write(Category::SumType, info.name);
    if (arity == 0) {
        return;
    }
    if (info.record_fields) {
        bool split = should_split(value, arity, settings_.record_wrap, depth, bracket, mode);
        out.write_plain(" ");
        render_fields(out, *info.record_fields, &object[2], split, depth, bracket);
    } else {
        bool split = should_split(value, arity, settings_.tuple_wrap, depth, bracket, mode);
        render_items(out, "(", ")", &object[2], arity, split, depth, bracket);
    }
}

void Renderer::render_list(RenderBuffer& out, Cell value, int depth, size_t bracket, LineMode mode) const {
    std::vector<Cell> items;
    Cell node = value;
    while (true) {
        if (classify(node) != ValueKind::HeapPointer) {
            // Improper tail, shown as a final element.
            items.push_back(node);
            break;
        }
        const Cell* object = object_of(node);
        ObjectHeader header = unpack_header(object[0]);
        if (static_cast<Flavour>(header.flavour) != Flavour::Variant || object[1].u64 != LIST_TYPE_HASH) {
            items.push_back(node);
            break;
        }
        if (header.aux == LIST_EMPTY_VARIANT && header.length == 0) {
            break;
        }
        if (header.aux != LIST_CONS_VARIANT || header.length != 2) {
            out.write(Category::Unknown, "<enum value>");
            return;
        }
        items.push_back(object[2]);
        node = object[3];
    }

    bool split = should_split(value, items.size(), settings_.list_wrap, depth, bracket, mode);
    render_items(out, "[", "]", items.data(), items.size(), split, depth, bracket);
}

std::optional<std::string> Renderer::decimal_text(Cell half) const {
    if (classify(half) == ValueKind::ImmediateNumber) {
        return fmt::format("{}", as_detagged_int(half));
    }
    if (classify(half) != ValueKind::HeapPointer) {
        return std::nullopt;
    }
    const Cell* object = object_of(half);
    ObjectHeader header = unpack_header(object[0]);
    if (static_cast<Flavour>(header.flavour) != Flavour::Boxed
        || static_cast<NumberTag>(header.subtag) != NumberTag::BigInt) {
        return std::nullopt;
    }
    std::vector<uint64_t> limbs(header.length);
    for (uint32_t i = 0; i < header.length; i++) {
        limbs[i] = object[1 + i].u64;
    }
    return format_bigint(header.aux != 0, limbs.data(), limbs.size());
}

void Renderer::render_boxed_number(RenderBuffer& out, const Cell* object, uint8_t subtag,
                                   uint16_t aux, uint32_t length) const {
    auto tag = static_cast<NumberTag>(subtag);
    if (tag != NumberTag::BigInt && length < (tag == NumberTag::Rational ? 2u : 1u)) {
        out.write(Category::Unknown, "<unknown number>");
        return;
    }

    switch (tag) {
        case NumberTag::Int32:
            out.write(Category::Number,
                      format_integer(static_cast<int32_t>(object[1].i64), settings_.radix) + suffix("l"));
            return;
        case NumberTag::Uint32:
            out.write(Category::Number,
                      format_unsigned(static_cast<uint32_t>(object[1].u64), settings_.radix) + suffix("ul"));
            return;
        case NumberTag::Int64:
            out.write(Category::Number, format_integer(object[1].i64, settings_.radix) + suffix("L"));
            return;
        case NumberTag::Uint64:
            out.write(Category::Number, format_unsigned(object[1].u64, settings_.radix) + suffix("uL"));
            return;
        case NumberTag::Float32: {
            float value = std::bit_cast<float>(static_cast<uint32_t>(object[1].u64));
            out.write(Category::Number, format_float32(value) + suffix("f"));
            return;
        }
        case NumberTag::Float64:
            out.write(Category::Number, format_float(object[1].f64));
            return;
        case NumberTag::Rational: {
            auto numerator = decimal_text(object[1]);
            auto denominator = decimal_text(object[2]);
            if (!numerator || !denominator) {
                break;
            }
            out.write(Category::Number, fmt::format("{}/{}", *numerator, *denominator));
            return;
        }
        case NumberTag::BigInt: {
            std::vector<uint64_t> limbs(length);
            for (uint32_t i = 0; i < length; i++) {
                limbs[i] = object[1 + i].u64;
            }
            out.write(Category::Number, format_bigint(aux != 0, limbs.data(), limbs.size()));
            return;
        }
    }
    out.write(Category::Unknown, "<unknown number>");
}

std::string render(Cell value, const TypeRegistry& registry, const PrintSettings& settings) {
    Renderer renderer(registry, settings);
    return renderer.render(value);
}

} // namespace reprint
