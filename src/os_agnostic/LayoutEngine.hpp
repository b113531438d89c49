/**
 * @file LayoutEngine.hpp
 * @brief Wraps submitted text into display lines.
 */

#pragma once

#include "TextLayoutMetrics.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief One wrapped display line with its measured size.
 */
struct LayoutLine {
    std::string text;
    int width{0};
    int height{0};
};

/**
 * @brief Immutable result of laying out one submission.
 */
struct TextLayout {
    std::vector<LayoutLine> lines;
    std::int64_t totalHeight{0};  // a long file can outgrow int
};

/**
 * @brief Lay @p text out against @p metrics.
 *
 * Hard newlines split paragraphs first and blank lines are kept as empty
 * lines. Each paragraph is then wrapped on whitespace so no line is wider
 * than metrics.maxLineWidth(); a word that alone is too wide is cut at the
 * width boundary. Total over every input: the empty string yields a single
 * empty line.
 */
TextLayout layoutText(const std::string& text, const TextLayoutMetrics& metrics);
