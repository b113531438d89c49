/**
 * @file Context.hpp
 * @brief Shares the console's state with every handler thread.
 */

#pragma once

#include <atomic>
#include <barrier>
#include <latch>
#include <mutex>

// >>> GLOBAL PARTICIPANT COUNT
#define NUM_CONSOLE_HANDLERS 3  // keyboard, command, supervisor

// >>> BARRIER COMPLETION (kept noexcept for MSVC compatibility)
struct PhaseCompletion {
    void operator()() noexcept {}
};

/**
 * @brief Thread-safe context shared by all console handlers.
 *
 * Holds the start/stop synchronisation, the console output lock and the
 * prompt bookkeeping the terminal preview paints around. The scroll engine
 * itself lives in SessionManager; nothing here is touched by render threads
 * except coutMutex and the prompt flag.
 */
struct ScrollerContext {
public:

    // >>> PHASE & SHUTDOWN SYNC

    /** @brief Before beginning, all participating threads are synched with this barrier. */
    std::barrier<PhaseCompletion> phase_barrier{NUM_CONSOLE_HANDLERS};

    /** @brief Latch (threads call count_down()) to orchestrate smooth shutdown. */
    std::latch stop_latch{NUM_CONSOLE_HANDLERS};

    // >>> CONSOLE OUTPUT GUARD

    std::mutex coutMutex; // Serialises prompt redraws, command feedback, log lines and preview frames.

    // >>> GLOBAL EXIT FLAG

    std::atomic<bool> exitRequested{false}; // Used to alert all threads to shutdown.

    // >>> PROMPT

    /** @brief Configure the flag to know whether the prompt is visible. */
    void setHasPromptLine(bool v) {
        hasPromptLine.store(v);
    }

    /** @brief Verify whether the console prompt is visible at the moment. */
    bool getHasPromptLine() const {
        return hasPromptLine.load();
    }

    // >>> PREVIEW AREA

    /** @brief Rows reserved above the prompt for the terminal preview (0 while idle). */
    void setPreviewRows(int rows) {
        previewRows.store(rows);
    }

    int getPreviewRows() const {
        return previewRows.load();
    }

private:
    std::atomic<bool> hasPromptLine{false};
    std::atomic<int> previewRows{0};
};

/**
 * @brief For any handler requiring access to the context's shared state.
 *
 * This is extended by the console handlers (KeyboardHandler, CommandHandler).
 */
class Handler {
public:
    explicit Handler(ScrollerContext& c) : ctx(c) {}
    virtual ~Handler() = default;

protected:
    ScrollerContext& ctx;
};
