/**
 * @file TerminalSink.cpp
 * @brief Renders frames as ANSI half-block art above the console prompt.
 */

#include "TerminalSink.hpp"
#include "DisplayConfig.hpp"

#include <algorithm>
#include <sstream>

#if defined(_WIN32)
#include <windows.h>

/**
 * @brief Allows Windows to support virtual terminals (for ANSI codes).
 */
static void enableVirtualTerminal() {
    static bool done = false;
    if (done) return;
    done = true;

    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE) return;

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode)) return;

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    SetConsoleMode(hOut, dwMode);
}

#else
// No-op on non-Windows platforms
static void enableVirtualTerminal() {}
#endif

/**
 * @brief Average the RGB565 pixels of one block of the frame.
 */
static Color averageBlock(const Frame& frame, int x0, int y0, int x1, int y1) {
    x1 = std::min(x1, frame.width());
    y1 = std::min(y1, frame.height());
    if (x0 >= x1 || y0 >= y1) return Color{};

    unsigned long r = 0, g = 0, b = 0, n = 0;
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            const Color c = Color::fromRgb565(frame.at(x, y));
            r += c.r;
            g += c.g;
            b += c.b;
            ++n;
        }
    }
    return Color{
        static_cast<std::uint8_t>(r / n),
        static_cast<std::uint8_t>(g / n),
        static_cast<std::uint8_t>(b / n)
    };
}

int TerminalSink::rowsFor(int width, int height) const {
    if (width <= 0 || height <= 0) return 0;
    const int block = std::max(1, (width + cols - 1) / cols);
    const int samplesDown = (height + block - 1) / block;
    return (samplesDown + 1) / 2;
}

std::vector<std::string> TerminalSink::toRows(const Frame& frame) const {
    std::vector<std::string> rows;
    const int rowCount = rowsFor(frame.width(), frame.height());
    if (rowCount == 0) return rows;

    const int block = std::max(1, (frame.width() + cols - 1) / cols);
    const int across = (frame.width() + block - 1) / block;
    rows.reserve(rowCount);

    for (int row = 0; row < rowCount; ++row) {
        std::ostringstream line;
        const int topY = row * 2 * block;
        for (int cell = 0; cell < across; ++cell) {
            const int x = cell * block;
            const Color upper = averageBlock(frame, x, topY, x + block, topY + block);
            const Color lower = averageBlock(frame, x, topY + block, x + block, topY + 2 * block);
            line << "\x1b[38;2;" << int(upper.r) << ';' << int(upper.g) << ';' << int(upper.b) << 'm'
                 << "\x1b[48;2;" << int(lower.r) << ';' << int(lower.g) << ';' << int(lower.b) << 'm'
                 << "\xE2\x96\x80";  // U+2580 upper half block
        }
        line << "\x1b[0m";
        rows.push_back(line.str());
    }
    return rows;
}

/**
 * @brief Paint one frame into the rows reserved above the prompt.
 *
 * Builds the art first, then takes coutMutex only for the write. Frames
 * arriving before the command handler has reserved rows are accepted and
 * dropped.
 */
DeliveryStatus TerminalSink::deliver(const Frame& frame) {
    enableVirtualTerminal();

    const auto rows = toRows(frame);

    std::lock_guard<std::mutex> lock(ctx.coutMutex);
    // Read under the lock: the command handler resizes the area while holding it.
    const int reserved = ctx.getPreviewRows();
    if (reserved <= 0 || !ctx.getHasPromptLine()) return DeliveryStatus::success();

    const int shown = std::min<int>(reserved, static_cast<int>(rows.size()));
    for (int i = 0; i < shown; ++i) {
        // Row i sits (reserved - i) lines above the prompt anchor.
        out << "\x1b[u"
            << "\x1b[" << (reserved - i) << "F"
            << "\r\x1b[2K"
            << rows[static_cast<std::size_t>(i)];
    }
    out << "\x1b[u" << std::flush;

    if (!out) {
        out.clear();
        return DeliveryStatus::failure("terminal stream rejected the frame");
    }
    return DeliveryStatus::success();
}
