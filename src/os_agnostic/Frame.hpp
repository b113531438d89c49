/**
 * @file Frame.hpp
 * @brief One complete RGB565 image at the display's fixed dimensions.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/*
 * Frame
 * -------------------------------------------------------------
 * - Row-major 16-bit RGB565 pixels, width * height of them
 * - Built by the frame renderer, handed to a FrameSink
 * - offset/session tag the frame with where it came from
 */
class Frame {
public:
    Frame() = default;
    Frame(int width, int height, std::uint16_t fill = 0x0000);

    int width() const  { return w; }
    int height() const { return h; }

    const std::vector<std::uint16_t>& pixels() const { return px; }
    std::uint16_t* data() { return px.data(); }

    std::uint16_t at(int x, int y) const { return px[static_cast<std::size_t>(y) * w + x]; }

    void clear(std::uint16_t color);

    // Pixels outside the frame are ignored.
    void drawPixel(int x, int y, std::uint16_t color);
    void fillRect(int x, int y, int rw, int rh, std::uint16_t color);

    // >>> PROVENANCE
    std::int64_t offset{0};       // scroll offset this frame was rendered at
    std::uint64_t session{0};     // id of the session that delivered it, 0 if none

    bool operator==(const Frame& o) const {
        return w == o.w && h == o.h && offset == o.offset && session == o.session && px == o.px;
    }
    bool operator!=(const Frame& o) const { return !(*this == o); }

private:
    int w{0};
    int h{0};
    std::vector<std::uint16_t> px;
};
