/**
 * @file KeyboardHandler.hpp
 * @brief Reads keystrokes and hands finished lines to the command queue.
 */

#pragma once

#include "Context.hpp"
#include <functional>
#include <string>

/**
 * @brief Owns the prompt line and turns keystrokes into command lines.
 *
 * Polls a platform-specific Scanner. Printable keys edit the buffer shown on
 * the prompt; Enter sends the buffer to the sink set with setSink(); Ctrl+C
 * and Ctrl+D request exit. Arrow keys and other escape sequences are
 * swallowed so they never end up inside a command.
 */
class KeyboardHandler : public Handler {
public:
    explicit KeyboardHandler(ScrollerContext& c) : Handler(c) {}

    /** @brief Keyboard thread body. */
    void operator()();

    /**
     * @brief Configures the function to execute upon entering a complete command.
     * @param sink A function that takes a line of completed input.
     */
    void setSink(std::function<void(std::string)> sink) {
        deliver = std::move(sink);
    }

    /**
     * @brief Apply one key to @p buffer.
     *
     * @return true when the key completed a line (Enter); the line is moved
     *         into @p line and the buffer is cleared.
     */
    bool feed(int ch, std::string& buffer, std::string& line);

private:
    std::function<void(std::string)> deliver;  // holds the command sink callback
    int escapeState{0};                        // 0 normal, 1 after ESC, 2 inside a CSI/SS3 sequence
};
