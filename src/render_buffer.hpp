#ifndef RENDER_BUFFER_HPP
#define RENDER_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace reprint {

// Semantic color categories.
enum class Category {
    Default,
    Number,
    String,
    Char,
    True,
    False,
    Void,
    Lambda,
    Bytes,
    Box,
    SumType,
    RecordKey,
    Unknown
};

// 24-bit colors as 0xRRGGBB.
uint32_t category_color(Category category);

// Rainbow bracket colors cycle through a fixed palette.
size_t rainbow_palette_size();
uint32_t rainbow_color(size_t bracket_index);

// ESC[38;2;R;G;Bm for the given color.
std::string foreground_escape(uint32_t color);

inline constexpr std::string_view RESET_ESCAPE = "\x1b[0m";

// Accumulates rendered text. Remembers the last color written so that an
// escape is only emitted when the color changes.
class RenderBuffer {
private:
    std::string text_;
    std::optional<uint32_t> current_color_;
    bool colored_;

public:
    explicit RenderBuffer(bool colored);

    // Write text in a color. Colorless buffers ignore the color.
    void write(uint32_t color, std::string_view text);
    void write(Category category, std::string_view text) { write(category_color(category), text); }

    // Write text without touching the color state (whitespace, newlines).
    void write_plain(std::string_view text);

    // Append the reset escape if this buffer is colored.
    void finish();

    size_t size() const { return text_.size(); }
    const std::string& text() const { return text_; }
    std::string take() { return std::move(text_); }
};

} // namespace reprint

#endif // RENDER_BUFFER_HPP
