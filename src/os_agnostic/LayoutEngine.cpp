/**
 * @file LayoutEngine.cpp
 * @brief Paragraph splitting, word wrapping and hard splitting of long words.
 */

#include "LayoutEngine.hpp"
#include "BitmapFont.hpp"

#include <cctype>
#include <string_view>

static bool isBlank(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

static std::vector<std::string> splitParagraphs(const std::string& text) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (true) {
        const auto nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return out;
}

static std::vector<std::string> splitWords(const std::string& line) {
    std::vector<std::string> words;
    std::string cur;
    for (char ch : line) {
        if (isBlank(ch)) {
            if (!cur.empty()) words.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) words.push_back(std::move(cur));
    return words;
}

/**
 * @brief Cut @p word into chunks no wider than the limit, one code point at a time.
 *
 * Every chunk but the last is appended to @p out; the remainder is returned so
 * the next word can still join it.
 */
static std::string hardSplit(const std::string& word, const TextLayoutMetrics& metrics,
                             std::vector<std::string>& out) {
    const int limit = metrics.maxLineWidth();
    std::string chunk;
    std::size_t pos = 0;
    while (pos < word.size()) {
        const std::size_t begin = pos;
        font5x7::nextCodepoint(word, pos);
        const std::string_view cp(word.data() + begin, pos - begin);

        std::string candidate = chunk;
        candidate.append(cp);
        // Zero-width marks (variation selectors, joiners) stay with the glyph before them.
        const int width = metrics.measure(candidate);
        if (chunk.empty() || width <= limit || width == metrics.measure(chunk)) {
            chunk = std::move(candidate);
        } else {
            out.push_back(std::move(chunk));
            chunk.assign(cp);
        }
    }
    return chunk;
}

static void wrapParagraph(const std::string& paragraph, const TextLayoutMetrics& metrics,
                          std::vector<std::string>& out) {
    const auto words = splitWords(paragraph);
    if (words.empty()) {
        out.emplace_back();  // blank line keeps paragraph spacing
        return;
    }

    const int limit = metrics.maxLineWidth();
    std::string current;

    for (const auto& word : words) {
        std::string candidate = current.empty() ? word : current + " " + word;
        if (metrics.measure(candidate) <= limit) {
            current = std::move(candidate);
            continue;
        }

        if (!current.empty()) {
            out.push_back(std::move(current));
            current.clear();
        }

        if (metrics.measure(word) <= limit) {
            current = word;
        } else {
            current = hardSplit(word, metrics, out);
        }
    }

    if (!current.empty()) out.push_back(std::move(current));
}

TextLayout layoutText(const std::string& text, const TextLayoutMetrics& metrics) {
    std::vector<std::string> wrapped;
    for (const auto& paragraph : splitParagraphs(text)) {
        wrapParagraph(paragraph, metrics, wrapped);
    }

    TextLayout layout;
    layout.lines.reserve(wrapped.size());
    const int lineHeight = metrics.lineHeight();
    for (auto& line : wrapped) {
        LayoutLine l;
        l.width = metrics.measure(line);
        l.height = lineHeight;
        l.text = std::move(line);
        layout.totalHeight += l.height;
        layout.lines.push_back(std::move(l));
    }
    return layout;
}
