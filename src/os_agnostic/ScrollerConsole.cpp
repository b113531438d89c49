/**
 * @file ScrollerConsole.cpp
 * @brief Mainly handles the starting and shutting down of all threads.
 */

#include "ScrollerConsole.hpp"
#include <chrono>
#include <iostream>

/**
 * @brief Wires up internal handlers and builds the console.
 *
 * The session manager renders into the terminal preview; the keyboard feeds
 * finished lines to the command processor.
 */
ScrollerConsole::ScrollerConsole(const DisplayConfig& config):
    ctx(),
    logger(std::cout, ctx.coutMutex, LogLevel::Warn),  // info lines would break the prompt layout
    preview(ctx),
    sessions(config, preview, logger),
    keyboard(ctx),
    command(ctx, sessions)
{
    // Start log lines on a fresh row; the prompt may be sitting on the current one.
    logger.setLinePrefix("\r\x1b[2K");
    command.setPreviewRows(preview.rowsFor(config.viewportWidth, config.viewportHeight));

    // Commands entered by the user are given to the command processor via the keyboard.
    keyboard.setSink([this](std::string cmd) {
        command.enqueue(std::move(cmd));
    });
}

/**
 * @brief manages the lifecycle until shutdown, launches all worker threads.
 *
 * Launches a supervisor thread along with the keyboard and command handlers.
 * The supervisor idles until shutdown is requested, then stops the active
 * session and wakes the command thread so it can leave its queue wait.
 */
void ScrollerConsole::run() {
    // Launch core handler threads
    threads.emplace_back(std::ref(keyboard));
    threads.emplace_back(std::ref(command));

    // A third participant in the barrier: the supervisor thread
    threads.emplace_back([this] {
        // >>> JOIN INIT PHASE
        ctx.phase_barrier.arrive_and_wait();

        // Supervisor loop: spin until exit is requested
        while (!ctx.exitRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        sessions.shutdown();
        command.wake();

        // Count down to let others know we're done
        ctx.stop_latch.count_down();
    });

    // Wait until all threads finish gracefully
    ctx.stop_latch.wait();
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}
