/**
 * @file DisplayConfig.hpp
 * @brief Display geometry, typography, cadence and colours for one scroll session.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief 8-bit RGB colour.
 */
struct Color {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    /** @brief Pack into the RGB565 layout the ST7789 panel expects. */
    std::uint16_t toRgb565() const {
        return static_cast<std::uint16_t>(((r & 0xF8) << 8) | ((g & 0xFC) << 3) | (b >> 3));
    }

    /** @brief Expand an RGB565 pixel back to 8-bit channels (low bits replicated). */
    static Color fromRgb565(std::uint16_t px);

    /**
     * @brief Parse "#rrggbb", "rrggbb", "#rgb" or a basic colour name.
     * @return The colour, or std::nullopt when the string is not recognised.
     */
    static std::optional<Color> parse(const std::string& text);

    /** @brief Format as "#rrggbb". */
    std::string toHex() const;

    bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

/**
 * @brief Immutable settings a scroll controller runs with.
 *
 * The defaults mirror the Waveshare 2" panel in landscape (320x240) and are
 * tuning constants only.
 */
struct DisplayConfig {
    // Upper bounds validate() enforces so pixel arithmetic stays inside int.
    static constexpr int kMaxViewport = 8192;
    static constexpr int kMaxCharsPerLine = 4096;

    // >>> GEOMETRY
    int viewportWidth{320};
    int viewportHeight{240};
    int margin{10};                 // horizontal padding on each side when fitting the viewport

    // >>> TYPOGRAPHY
    int fontSize{28};               // glyph rendering size in pixels
    int lineSpacing{6};             // extra pixels between lines
    int maxCharsPerLine{0};         // wrap width in characters; 0 fits the viewport

    // >>> CADENCE
    int scrollSpeed{2};             // pixels advanced per frame
    std::chrono::milliseconds frameInterval{30};

    // >>> COLOURS
    Color foreground{255, 255, 255};
    Color background{0, 0, 0};

    // >>> FAULT POLICY
    int maxConsecutiveFailures{100}; // failed deliveries in a row before the sink is declared dead; 0 = never

    /**
     * @brief Check the values a controller relies on.
     * @return A human readable complaint, or std::nullopt when the config is usable.
     */
    std::optional<std::string> validate() const;

    /** @brief One-line summary for the console's `config` command. */
    std::string describe() const;
};

/**
 * @brief Per-submission overrides; any subset of the recognised options.
 */
struct ConfigOverrides {
    std::optional<int> fontSize;
    std::optional<int> scrollSpeed;
    std::optional<std::chrono::milliseconds> frameInterval;
    std::optional<int> maxCharsPerLine;
    std::optional<Color> foregroundColor;
    std::optional<Color> backgroundColor;

    bool empty() const {
        return !fontSize && !scrollSpeed && !frameInterval && !maxCharsPerLine
            && !foregroundColor && !backgroundColor;
    }

    /** @brief Return @p base with every present override applied. */
    DisplayConfig applyTo(const DisplayConfig& base) const;
};
