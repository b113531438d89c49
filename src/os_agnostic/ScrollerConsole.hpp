/**
 * @file ScrollerConsole.hpp
 * @brief Mainly handles the starting and shutting down of all threads.
 */

#pragma once

#include "CommandHandler.hpp"
#include "Context.hpp"
#include "DisplayConfig.hpp"
#include "KeyboardHandler.hpp"
#include "Logger.hpp"
#include "SessionManager.hpp"
#include "TerminalSink.hpp"

#include <thread>
#include <vector>

/**
 * @brief The top-level console that connects everything.
 *
 * Oversees setup and shutdown of the keyboard and command threads, and owns
 * the scroll engine they drive: the SessionManager and the TerminalSink it
 * paints into. Render threads come and go with sessions; the console threads
 * live for the whole run.
*/
class ScrollerConsole {
public:

    // Constructs the console and initializes connections of the handlers.
    explicit ScrollerConsole(const DisplayConfig& config = DisplayConfig{});

    /**
     * @brief starts the console system and keeps it running until it shuts down.
     *
     * Launches every worker thread, including the supervisor thread that
     * watches for the exit signal. Stops scrolling and joins everything at
     * shutdown.
     */
    void run();

private:
    ScrollerContext ctx;                    // shared state across all handlers
    Logger logger;                          // writes through ctx.coutMutex
    TerminalSink preview;                   // frame sink painting above the prompt
    SessionManager sessions;                // the single active scroll session
    KeyboardHandler keyboard;               // captures inputs from keystrokes
    CommandHandler command;                 // processes and executes the corresponding actions of commands
    std::vector<std::thread> threads;       // all handler and supervisor threads
};
