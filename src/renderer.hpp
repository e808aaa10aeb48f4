#ifndef RENDERER_HPP
#define RENDERER_HPP

#include "print_settings.hpp"
#include "render_buffer.hpp"
#include "type_registry.hpp"
#include "value.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reprint {

// Renders tagged values as text. Rendering never throws on bad input: anything
// that cannot be identified is written as a placeholder naming the stage that
// failed to classify it.
//
// Depth, bracket color index and line mode are passed explicitly down the
// recursion. Widths measured while deciding line splits are cached for the
// duration of one render call, so each nested container is measured once.
class Renderer {
private:
    // SingleLine is used by the dry-run that measures a container before
    // deciding whether to split it. It applies to the outermost container only.
    enum class LineMode {
        Auto,
        SingleLine
    };

    struct WidthKey {
        uint64_t word;
        int depth;
        size_t bracket;

        bool operator==(const WidthKey& other) const {
            return word == other.word && depth == other.depth && bracket == other.bracket;
        }
    };

    struct WidthKeyHash {
        size_t operator()(const WidthKey& key) const {
            size_t h = std::hash<uint64_t>{}(key.word);
            h ^= std::hash<int>{}(key.depth) + 0x9e3779b9 + (h << 6) + (h >> 2);
            h ^= std::hash<size_t>{}(key.bracket) + 0x9e3779b9 + (h << 6) + (h >> 2);
            return h;
        }
    };

    const TypeRegistry& registry_;
    const PrintSettings& settings_;
    mutable std::unordered_map<WidthKey, size_t, WidthKeyHash> width_cache_;

    void render_value(RenderBuffer& out, Cell value, int depth, size_t bracket, LineMode mode) const;
    void render_constant(RenderBuffer& out, Cell value) const;
    void render_short(RenderBuffer& out, Cell value, int depth) const;

    void dispatch_heap(RenderBuffer& out, Cell value, int depth, size_t bracket, LineMode mode) const;
    void render_string(RenderBuffer& out, const Cell* object, uint32_t length, int depth) const;
    void render_bytes(RenderBuffer& out, const Cell* object, uint32_t length) const;
    void render_tuple(RenderBuffer& out, Cell value, const Cell* object, uint32_t arity,
                      int depth, size_t bracket, LineMode mode) const;
    void render_array(RenderBuffer& out, Cell value, const Cell* object, uint32_t length,
                      int depth, size_t bracket, LineMode mode) const;
    void render_record(RenderBuffer& out, Cell value, const Cell* object, uint32_t arity,
                       int depth, size_t bracket, LineMode mode) const;
    void render_variant(RenderBuffer& out, Cell value, const Cell* object, uint16_t variant_id,
                        uint32_t arity, int depth, size_t bracket, LineMode mode) const;
    void render_list(RenderBuffer& out, Cell value, int depth, size_t bracket, LineMode mode) const;
    void render_boxed_number(RenderBuffer& out, const Cell* object, uint8_t subtag,
                             uint16_t aux, uint32_t length) const;
    std::optional<std::string> decimal_text(Cell half) const;

    // Positional items: "(a, b)", "[a, b]" and the like.
    void render_items(RenderBuffer& out, std::string_view open, std::string_view close,
                      const Cell* items, size_t count, bool split, int depth, size_t bracket) const;
    // Named fields: "{ k: v }".
    void render_fields(RenderBuffer& out, const std::vector<std::string>& names,
                       const Cell* values, bool split, int depth, size_t bracket) const;

    // measure_width without clearing the cache.
    size_t cached_width(Cell value, int depth, size_t bracket) const;
    bool should_split(Cell value, size_t count, std::optional<size_t> threshold,
                      int depth, size_t bracket, LineMode mode) const;
    void write_bracket(RenderBuffer& out, std::string_view text, size_t bracket) const;
    void write_line_break(RenderBuffer& out, int indent_level) const;
    std::string suffix(std::string_view text) const;

public:
    Renderer(const TypeRegistry& registry, const PrintSettings& settings);

    // Render a root value at depth 0, appending the reset escape when colored.
    std::string render(Cell value) const;

    // Width of the colorless single-line rendering of value at the given depth
    // and bracket index. Nested containers still make their own wrap decisions.
    size_t measure_width(Cell value, int depth, size_t bracket_index) const;
};

std::string render(Cell value, const TypeRegistry& registry, const PrintSettings& settings = PrintSettings{});

} // namespace reprint

#endif // RENDERER_HPP
