/**
 * @file TerminalSink.hpp
 * @brief Paints scroll frames into the console, above the prompt.
 */
#pragma once

#include "Context.hpp"
#include "FrameSink.hpp"

#include <iostream>
#include <string>
#include <vector>

/**
 * @brief Low-resolution live preview of the display in a truecolor terminal.
 *
 * Each frame is box-averaged down to @c columns cells across; every cell is
 * an upper-half block whose foreground and background colours carry two
 * vertically stacked samples, so samples stay square. The preview occupies
 * the rows the command handler reserved above the prompt
 * (ScrollerContext::getPreviewRows) and is painted under coutMutex.
 */
class TerminalSink : public FrameSink {
public:
    /**
     * @param c       Shared console context (output lock, prompt anchor).
     * @param os      Stream the preview is written to.
     * @param columns Preview width in terminal cells.
     */
    explicit TerminalSink(ScrollerContext& c, std::ostream& os = std::cout, int columns = 40)
        : ctx(c), out(os), cols(columns < 1 ? 1 : columns) {}

    DeliveryStatus deliver(const Frame& frame) override;

    /** @brief Terminal rows a frame of @p width x @p height needs at this column count. */
    int rowsFor(int width, int height) const;

    /** @brief The cell art for @p frame, one string per terminal row, without cursor movement. */
    std::vector<std::string> toRows(const Frame& frame) const;

private:
    ScrollerContext& ctx;
    std::ostream& out;
    int cols;
};
