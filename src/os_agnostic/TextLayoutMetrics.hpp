/**
 * @file TextLayoutMetrics.hpp
 * @brief Measurement seam between the layout engine and a font backend.
 */

#pragma once

#include "DisplayConfig.hpp"
#include <string_view>

/**
 * @brief What the layout engine needs to know about a font.
 *
 * The engine never loads fonts itself; whoever owns the font supplies one
 * of these.
 */
class TextLayoutMetrics {
public:
    virtual ~TextLayoutMetrics() = default;

    /** @brief Rendered width of @p text in pixels. */
    virtual int measure(std::string_view text) const = 0;

    /** @brief Vertical pixels consumed by one line, spacing included. */
    virtual int lineHeight() const = 0;

    /** @brief Widest a wrapped line may be, in pixels. */
    virtual int maxLineWidth() const = 0;
};

/**
 * @brief Metrics for the built-in 5x7 bitmap font at a given config.
 *
 * Monospaced, so a width of N characters is exactly N advances and
 * maxCharsPerLine wraps by character count.
 */
class FontMetrics : public TextLayoutMetrics {
public:
    explicit FontMetrics(const DisplayConfig& config);

    int measure(std::string_view text) const override;
    int lineHeight() const override { return height; }
    int maxLineWidth() const override { return maxWidth; }

    int scale() const { return glyphScale; }
    int advance() const { return glyphAdvance; }

private:
    int glyphScale;
    int glyphAdvance;
    int height;
    int maxWidth;
};
