/**
 * @file DisplayConfig.cpp
 * @brief Colour parsing, config validation and override merging.
 */

#include "DisplayConfig.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

static int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

Color Color::fromRgb565(std::uint16_t px) {
    const std::uint8_t r5 = static_cast<std::uint8_t>((px >> 11) & 0x1F);
    const std::uint8_t g6 = static_cast<std::uint8_t>((px >> 5) & 0x3F);
    const std::uint8_t b5 = static_cast<std::uint8_t>(px & 0x1F);
    return Color{
        static_cast<std::uint8_t>((r5 << 3) | (r5 >> 2)),
        static_cast<std::uint8_t>((g6 << 2) | (g6 >> 4)),
        static_cast<std::uint8_t>((b5 << 3) | (b5 >> 2))
    };
}

std::optional<Color> Color::parse(const std::string& text) {
    std::string s;
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    if (s.empty()) return std::nullopt;

    struct Named { const char* name; Color color; };
    static const Named names[] = {
        {"black",   {0, 0, 0}},
        {"white",   {255, 255, 255}},
        {"red",     {255, 0, 0}},
        {"green",   {0, 255, 0}},
        {"blue",    {0, 0, 255}},
        {"yellow",  {255, 255, 0}},
        {"cyan",    {0, 255, 255}},
        {"magenta", {255, 0, 255}},
        {"orange",  {255, 165, 0}},
        {"gray",    {128, 128, 128}},
        {"grey",    {128, 128, 128}},
    };
    for (const auto& n : names) {
        if (s == n.name) return n.color;
    }

    if (s.front() == '#') s.erase(0, 1);

    if (s.size() == 3) {
        int d[3];
        for (int i = 0; i < 3; ++i) {
            d[i] = hexDigit(s[i]);
            if (d[i] < 0) return std::nullopt;
        }
        return Color{
            static_cast<std::uint8_t>(d[0] * 17),
            static_cast<std::uint8_t>(d[1] * 17),
            static_cast<std::uint8_t>(d[2] * 17)
        };
    }

    if (s.size() == 6) {
        int d[6];
        for (int i = 0; i < 6; ++i) {
            d[i] = hexDigit(s[i]);
            if (d[i] < 0) return std::nullopt;
        }
        return Color{
            static_cast<std::uint8_t>(d[0] * 16 + d[1]),
            static_cast<std::uint8_t>(d[2] * 16 + d[3]),
            static_cast<std::uint8_t>(d[4] * 16 + d[5])
        };
    }

    return std::nullopt;
}

std::string Color::toHex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return buf;
}

std::optional<std::string> DisplayConfig::validate() const {
    if (viewportWidth <= 0 || viewportHeight <= 0) {
        return "viewport must be at least 1x1 pixels";
    }
    if (viewportWidth > kMaxViewport || viewportHeight > kMaxViewport) {
        return "viewport cannot exceed " + std::to_string(kMaxViewport) + " pixels per side";
    }
    if (margin < 0) return "margin cannot be negative";
    if (margin > viewportWidth) return "margin cannot exceed the viewport width";
    if (fontSize <= 0) return "font size must be positive";
    if (fontSize > viewportHeight) {
        return "font size cannot exceed the viewport height (" + std::to_string(viewportHeight) + "px)";
    }
    if (lineSpacing < 0) return "line spacing cannot be negative";
    if (lineSpacing > viewportHeight) return "line spacing cannot exceed the viewport height";
    if (maxCharsPerLine < 0) return "max chars per line cannot be negative (0 fits the viewport)";
    if (maxCharsPerLine > kMaxCharsPerLine) {
        return "max chars per line cannot exceed " + std::to_string(kMaxCharsPerLine);
    }
    if (scrollSpeed <= 0) return "scroll speed must be at least 1 pixel per frame";
    if (scrollSpeed > viewportHeight) {
        return "scroll speed cannot exceed the viewport height (" + std::to_string(viewportHeight) + "px)";
    }
    if (frameInterval.count() < 0) return "frame interval cannot be negative";
    if (maxConsecutiveFailures < 0) return "failure threshold cannot be negative";
    return std::nullopt;
}

std::string DisplayConfig::describe() const {
    std::ostringstream os;
    os << viewportWidth << "x" << viewportHeight
       << " font=" << fontSize
       << " speed=" << scrollSpeed << "px"
       << " interval=" << frameInterval.count() << "ms"
       << " width=" << (maxCharsPerLine > 0 ? std::to_string(maxCharsPerLine) : std::string("fit"))
       << " fg=" << foreground.toHex()
       << " bg=" << background.toHex();
    return os.str();
}

DisplayConfig ConfigOverrides::applyTo(const DisplayConfig& base) const {
    DisplayConfig out = base;
    if (fontSize)        out.fontSize = *fontSize;
    if (scrollSpeed)     out.scrollSpeed = *scrollSpeed;
    if (frameInterval)   out.frameInterval = *frameInterval;
    if (maxCharsPerLine) out.maxCharsPerLine = *maxCharsPerLine;
    if (foregroundColor) out.foreground = *foregroundColor;
    if (backgroundColor) out.background = *backgroundColor;
    return out;
}
