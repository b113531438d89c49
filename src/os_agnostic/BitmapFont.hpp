/**
 * @file BitmapFont.hpp
 * @brief Built-in 5x7 ASCII bitmap font used for measuring and drawing text.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace font5x7 {

constexpr int kWidth = 5;     // glyph columns
constexpr int kHeight = 7;    // glyph rows
constexpr int kSpacing = 1;   // blank columns after each glyph, before scaling
constexpr int kAdvance = kWidth + kSpacing;
constexpr int kEmojiCells = 3;  // an emoji occupies three character cells

/** @brief Variation selectors and the zero-width joiner: no ink, no advance. */
inline bool isZeroWidth(char32_t cp) {
    return (cp >= 0xFE00 && cp <= 0xFE0F) || cp == 0x200D;
}

/** @brief Pictographic ranges drawn as the emoji placeholder glyph. */
bool isEmoji(char32_t cp);

/** @brief Character cells @p cp advances the pen by: 0, 1 or kEmojiCells. */
inline int cellsFor(char32_t cp) {
    if (isZeroWidth(cp)) return 0;
    return isEmoji(cp) ? kEmojiCells : 1;
}

/**
 * @brief Column data for one code point (5 bytes, LSB is the top row).
 *
 * Emoji map to a placeholder face, anything else outside printable ASCII
 * maps to the '?' glyph; tab maps to space.
 */
const std::uint8_t* glyph(char32_t cp);

/** @brief Whole-pixel scale for a requested font size (never below 1). */
inline int scaleFor(int fontSize) {
    const int s = fontSize / kHeight;
    return s < 1 ? 1 : s;
}

/**
 * @brief Decode the next UTF-8 code point starting at @p pos and advance @p pos.
 *
 * Malformed sequences consume one byte and yield U+FFFD.
 */
char32_t nextCodepoint(std::string_view s, std::size_t& pos);

/** @brief Number of code points in a UTF-8 string. */
std::size_t codepointCount(std::string_view s);

} // namespace font5x7
