/**
 * @file KeyboardHandler.cpp
 * @brief Keyboard handler using the OS-dependent Scanner for per-key responsiveness.
 */

#include "KeyboardHandler.hpp"
#include "../os_dependent/Scanner.hpp"
#include <iostream>

/**
 * @brief Print the prompt and save the cursor anchor, once.
 *
 * Everything else (command feedback, the terminal preview) positions itself
 * relative to this saved anchor.
 */
static void ensurePromptAnchor(ScrollerContext& ctx) {
    if (!ctx.getHasPromptLine()) {
        std::lock_guard<std::mutex> lock(ctx.coutMutex);

        std::cout << "\n"
                  << "> "       // print prompt
                  << "\x1b[s"   // save anchor at end of prompt
                  << std::flush;

        ctx.setHasPromptLine(true);
    }
}

/**
 * @brief Redraw the prompt line with the current buffer and re-save the anchor.
 */
static void redrawPrompt(ScrollerContext& ctx, const std::string& buf) {
    std::lock_guard<std::mutex> lock(ctx.coutMutex);

    std::cout << "\x1b[u"         // restore to prompt anchor
              << "\r\x1b[2K> "    // clear prompt line and print prompt symbol
              << buf
              << "\x1b[s"         // re-save anchor at end-of-line
              << std::flush;

    ctx.setHasPromptLine(true);
}

bool KeyboardHandler::feed(int ch, std::string& buffer, std::string& line) {
    // Drop "ESC [ ... final" and "ESC O x" sequences (arrow keys, Home, F1...).
    if (escapeState == 1) {
        escapeState = (ch == '[' || ch == 'O') ? 2 : 0;
        return false;
    }
    if (escapeState == 2) {
        if (ch >= 0x40 && ch <= 0x7E) escapeState = 0;
        return false;
    }

    switch (ch) {
        case '\r':
        case '\n':
            line = std::move(buffer);
            buffer.clear();
            return true;

        case 27:    // ESC
            escapeState = 1;
            return false;

        case 21:    // Ctrl+U clears the line
            buffer.clear();
            return false;

        case 127:
        case 8:     // Backspace; pops a whole UTF-8 sequence
            while (!buffer.empty()) {
                const auto last = static_cast<unsigned char>(buffer.back());
                buffer.pop_back();
                if ((last & 0xC0) != 0x80) break;
            }
            return false;

        case '\t':
            buffer.push_back(' ');
            return false;

        default:
            // Printable ASCII and UTF-8 bytes from the terminal.
            if ((ch >= 32 && ch < 127) || (ch >= 0x80 && ch <= 0xFF)) {
                buffer.push_back(static_cast<char>(ch));
            }
            return false;
    }
}

/**
 * @brief The keyboard handler's main loop.
 *
 * Waits for key input through the Scanner, edits the prompt buffer and
 * delivers it on Enter. Ctrl+C and Ctrl+D raise the exit flag.
 */
void KeyboardHandler::operator()() {
    // >>> JOIN INIT PHASE
    ctx.phase_barrier.arrive_and_wait();

    Scanner scan;
    std::string buffer;

    ensurePromptAnchor(ctx);

    while (!ctx.exitRequested.load()) {
        // If something else cleared the prompt, re-anchor
        if (!ctx.getHasPromptLine()) {
            ensurePromptAnchor(ctx);
        }

        int ch = scan.poll();  // waits a few ms at most
        if (ch < 0) continue;

        if (ch == 3 || ch == 4) {  // Ctrl+C, Ctrl+D
            ctx.exitRequested.store(true);
            break;
        }

        std::string line;
        const std::size_t before = buffer.size();
        if (feed(ch, buffer, line)) {
            if (deliver) deliver(std::move(line));
        } else if (buffer.size() != before || ch == 21) {
            redrawPrompt(ctx, buffer);
        }
    }

    // Clear prompt line on exit
    {
        std::lock_guard<std::mutex> lock(ctx.coutMutex);
        std::cout << "\x1b[u"     // return to prompt anchor
                  << "\r\x1b[2K"  // clear that line
                  << std::flush;
    }

    ctx.setHasPromptLine(false);

    // >>> THREAD EXIT
    ctx.stop_latch.count_down();
}
