#include "Frame.hpp"

#include <algorithm>

Frame::Frame(int width, int height, std::uint16_t fill)
    : w(std::max(0, width)),
      h(std::max(0, height)),
      px(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), fill) {}

void Frame::clear(std::uint16_t color) {
    std::fill(px.begin(), px.end(), color);
}

void Frame::drawPixel(int x, int y, std::uint16_t color) {
    if (x < 0 || y < 0 || x >= w || y >= h) return;
    px[static_cast<std::size_t>(y) * w + x] = color;
}

void Frame::fillRect(int x, int y, int rw, int rh, std::uint16_t color) {
    const int x0 = std::max(0, x);
    const int y0 = std::max(0, y);
    const int x1 = std::min(w, x + rw);
    const int y1 = std::min(h, y + rh);
    for (int yy = y0; yy < y1; ++yy) {
        std::uint16_t* row = px.data() + static_cast<std::size_t>(yy) * w;
        std::fill(row + x0, row + std::max(x0, x1), color);
    }
}
