#include "render_buffer.hpp"
#include <array>
#include <fmt/color.h>
#include <fmt/core.h>

namespace reprint {

static const std::array<uint32_t, 3> RAINBOW_PALETTE = {
    0xFFD700,  // Gold.
    0xDA70D6,  // Orchid.
    0x179FFF   // Blue.
};

uint32_t category_color(Category category) {
    switch (category) {
        case Category::Default:
            return 0xCCCCCC;
        case Category::Number:
            return 0x99CC99;
        case Category::String:
            return 0xCC99CC;
        case Category::Char:
            return 0xCC9966;
        case Category::True:
            return 0x66CC99;
        case Category::False:
            return 0xCC6666;
        case Category::Void:
            return 0x999999;
        case Category::Lambda:
            return 0xFFCC66;
        case Category::Bytes:
            return 0x6699CC;
        case Category::Box:
            return 0x66CCCC;
        case Category::SumType:
            return 0x99CCFF;
        case Category::RecordKey:
            return 0xCCCC99;
        case Category::Unknown:
            return 0xFF6666;
    }
    return 0xCCCCCC;
}

size_t rainbow_palette_size() {
    return RAINBOW_PALETTE.size();
}

uint32_t rainbow_color(size_t bracket_index) {
    return RAINBOW_PALETTE[bracket_index % RAINBOW_PALETTE.size()];
}

std::string foreground_escape(uint32_t color) {
    fmt::rgb rgb(color);
    return fmt::format("\x1b[38;2;{};{};{}m", rgb.r, rgb.g, rgb.b);
}

RenderBuffer::RenderBuffer(bool colored)
    : colored_(colored) {
}

void RenderBuffer::write(uint32_t color, std::string_view text) {
    if (text.empty()) {
        return;
    }
    if (colored_ && current_color_ != color) {
        text_ += foreground_escape(color);
        current_color_ = color;
    }
    text_ += text;
}

void RenderBuffer::write_plain(std::string_view text) {
    text_ += text;
}

void RenderBuffer::finish() {
    if (colored_) {
        text_ += RESET_ESCAPE;
        current_color_.reset();
    }
}

} // namespace reprint
