/**
 * @file CommandHandler.hpp
 * @brief Command runner for the scroller console.
 *
 * This class reads command strings from a queue (usually pushed by the keyboard
 * thread) and runs them. Text submissions go to the SessionManager; the set_*
 * commands edit the overrides applied to the next submission.
 *
 * Commands:
 *   - help
 *   - show <text> / set_text <text>
 *   - load_file <path>
 *   - stop
 *   - status
 *   - config
 *   - set_speed <px>
 *   - set_interval <ms>
 *   - set_font <size>
 *   - set_width <chars>
 *   - set_colors <fg> [bg]
 *   - reset_config
 *   - exit
 */

#pragma once

#include "Context.hpp"
#include "DisplayConfig.hpp"
#include "SessionManager.hpp"
#include "TextFileReader.hpp"

#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <queue>
#include <string>

/**
 * @class CommandHandler
 * @brief Consumes command lines and executes them, one by one.
 *
 * How to use:
 *  - Build it with the shared ScrollerContext and the SessionManager.
 *  - Run operator() on its own thread so it can block/wake on the queue.
 *  - Call enqueue() from any producer (like the keyboard thread).
 */
class CommandHandler : public Handler {
public:
    /**
     * @param c        Shared context with the output lock and prompt state.
     * @param sessions Where text submissions go.
     * @param os       Console stream for feedback.
     */
    CommandHandler(ScrollerContext& c, SessionManager& sessions, std::ostream& os = std::cout)
        : Handler(c), sessions(sessions), out(os) {}

    /**
     * @brief Main loop that waits for commands and executes them.
     *
     * Blocks on a condition variable when the queue is empty. Exits when
     * ctx.exitRequested becomes true.
     */
    void operator()(); // consumer loop

    /**
     * @brief Push a new command line into the queue.
     *
     * Thread-safe. Multiple producers can call this at the same time.
     *
     * @param cmd Raw command, e.g. "set_speed 3".
     */
    void enqueue(std::string cmd);

    /** @brief Wake the consumer loop so it can notice exitRequested. */
    void wake() { queueCv.notify_all(); }

    /**
     * @brief Parse one command line and do the action, on the calling thread.
     * @param line Full command line including any arguments.
     */
    void execute(const std::string& line);

    /**
     * @brief How many terminal rows the preview needs while text is scrolling.
     * @param rows Rows to reserve above the prompt (0 disables the preview).
     */
    void setPreviewRows(int rows) { previewRows = rows; }

    const ConfigOverrides& pendingOverrides() const { return overrides; }

    /** @brief Turn "\n", "\t" and "\\" escapes typed at the prompt into real characters. */
    static std::string unescape(const std::string& text);

private:

    // >>> QUEUE STATE

    std::mutex queueMutex;                  // Protects access to the queue.
    std::condition_variable queueCv;        // Signals the consumer that there is work to do (or we are exiting)
    std::queue<std::string> commandQueue;   // Ensure command strings follow FIFO

    // >>> COLLABORATORS

    SessionManager& sessions;
    TextFileReader files;
    std::ostream& out;

    // >>> CONSOLE-SIDE CONFIG

    ConfigOverrides overrides;   // applied to every submission from here on
    int previewRows{0};

    // >>> HELPERS

    void submitText(const std::string& line, const std::string& text);
    void applyOverride(const std::string& line, const std::string& what);
    void paint(const std::string& line, const std::function<void(std::ostream&)>& feedback);
    void paintMessage(const std::string& line, const std::string& msg);
};
