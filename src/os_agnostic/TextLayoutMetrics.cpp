/**
 * @file TextLayoutMetrics.cpp
 * @brief Bitmap-font metrics.
 */

#include "TextLayoutMetrics.hpp"
#include "BitmapFont.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

// Widths are summed in 64 bits and saturate at INT_MAX.
static int saturate(std::int64_t v) {
    constexpr std::int64_t top = std::numeric_limits<int>::max();
    return static_cast<int>(std::min(v, top));
}

FontMetrics::FontMetrics(const DisplayConfig& config)
    : glyphScale(font5x7::scaleFor(config.fontSize)),
      glyphAdvance(saturate(std::int64_t{font5x7::kAdvance} * glyphScale)),
      height(saturate(std::max<std::int64_t>(std::int64_t{config.fontSize} + config.lineSpacing,
                                             std::int64_t{font5x7::kHeight} * glyphScale))),
      maxWidth(0)
{
    if (config.maxCharsPerLine > 0) {
        maxWidth = saturate(std::int64_t{config.maxCharsPerLine} * glyphAdvance);
    } else {
        maxWidth = config.viewportWidth - 2 * config.margin;
    }
    // Always room for at least one glyph, otherwise nothing could ever be placed.
    maxWidth = std::max(maxWidth, glyphAdvance);
}

int FontMetrics::measure(std::string_view text) const {
    std::int64_t cells = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        cells += font5x7::cellsFor(font5x7::nextCodepoint(text, pos));
    }
    return saturate(cells * glyphAdvance);
}
