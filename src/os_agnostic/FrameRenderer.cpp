/**
 * @file FrameRenderer.cpp
 * @brief Scaled bitmap-glyph blitting into an RGB565 frame.
 */

#include "FrameRenderer.hpp"
#include "BitmapFont.hpp"

#include <string_view>

static void drawGlyph(Frame& frame, int x, int y, int scale, char32_t cp, std::uint16_t color) {
    const std::uint8_t* columns = font5x7::glyph(cp);
    for (int col = 0; col < font5x7::kWidth; ++col) {
        const std::uint8_t bits = columns[col];
        for (int row = 0; row < font5x7::kHeight; ++row) {
            if (bits & (1u << row)) {
                frame.fillRect(x + col * scale, y + row * scale, scale, scale, color);
            }
        }
    }
}

static void drawLine(Frame& frame, const LayoutLine& line, int x, int y, int scale, std::uint16_t color) {
    const int advance = font5x7::kAdvance * scale;
    std::string_view text(line.text);
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char32_t cp = font5x7::nextCodepoint(text, pos);
        const int cells = font5x7::cellsFor(cp);
        if (cells == 0) continue;
        if (x >= frame.width()) break;   // rest of the line is off the right edge

        // Wide glyphs sit in their middle cell.
        const int gx = x + (cells / 2) * advance;
        if (gx + advance > 0 && cp != U' ') {
            drawGlyph(frame, gx, y, scale, cp, color);
        }
        x += cells * advance;
    }
}

Frame renderFrame(const TextLayout& layout, std::int64_t offset, const DisplayConfig& config) {
    Frame frame(config.viewportWidth, config.viewportHeight, config.background.toRgb565());
    frame.offset = offset;

    const std::uint16_t ink = config.foreground.toRgb565();
    const int scale = font5x7::scaleFor(config.fontSize);
    const int glyphHeight = font5x7::kHeight * scale;
    // Centre the glyph cell within the font size box; spacing sits below it.
    const int baselinePad = config.fontSize > glyphHeight ? (config.fontSize - glyphHeight) / 2 : 0;

    std::int64_t y = offset;
    for (const auto& line : layout.lines) {
        const std::int64_t top = y;
        y += line.height;

        if (top >= frame.height()) break;   // this line and every later one are below
        if (top + line.height <= 0) continue;
        if (line.text.empty()) continue;

        const int x = (frame.width() - line.width) / 2;
        drawLine(frame, line, x, static_cast<int>(top) + baselinePad, scale, ink);
    }

    return frame;
}
