/**
 * @file SessionManager.hpp
 * @brief Owns the one active scroll session and swaps it on every submission.
 */

#pragma once

#include "DisplayConfig.hpp"
#include "FrameSink.hpp"
#include "Logger.hpp"
#include "ScrollController.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

enum class SubmissionStatus {
    Accepted,
    Rejected     // invalid overrides or shut down; the running session was left alone
};

/**
 * @brief What submit() tells its caller.
 */
struct SubmissionResult {
    SubmissionStatus status{SubmissionStatus::Accepted};
    std::uint64_t sessionId{0};          // 0 when rejected
    std::size_t lineCount{0};
    std::string message;                 // reason for a rejection
    std::optional<std::string> previousFault; // the replaced session had given up on the display

    bool accepted() const { return status == SubmissionStatus::Accepted; }
};

/**
 * @brief Snapshot of the active session for status reporting.
 */
struct SessionStatus {
    bool active{false};
    std::uint64_t sessionId{0};
    ControllerState state{ControllerState::Terminated};
    ControllerStats stats;
    std::size_t lineCount{0};
    std::optional<std::string> fault;
    DisplayConfig config;
};

/**
 * @brief Serialises submissions and guarantees a single writer to the sink.
 *
 * Every submit() takes the same mutex, cancels and joins the running
 * controller, and only then starts the next one. Callers on other threads
 * simply queue on the mutex.
 */
class SessionManager {
public:
    SessionManager(const DisplayConfig& base, FrameSink& sink, Logger& log);

    /** @brief Stops the active session. */
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Replace whatever is scrolling with @p text.
     *
     * Returns once the new controller is started; does not wait for its
     * first frame. No frame from the previous session is delivered after
     * this returns.
     */
    SubmissionResult submit(const std::string& text, const ConfigOverrides& overrides = {});

    /** @brief Stop scrolling without starting anything. No-op when idle. */
    void stop();

    /**
     * @brief Stop scrolling for good.
     *
     * Every submit() that has not taken the session lock yet is rejected,
     * so a submission racing the shutdown cannot start a new session.
     */
    void shutdown();

    SessionStatus status() const;

    /** @brief Text of the active session, if any. */
    std::optional<std::string> activeText() const;

    const DisplayConfig& baseConfig() const { return base; }

private:
    void teardownLocked();

    const DisplayConfig base;
    FrameSink& sink;
    Logger& log;

    // >>> ACTIVE SESSION (guarded by sessionMutex)
    mutable std::mutex sessionMutex;
    std::unique_ptr<ScrollController> active;
    std::string currentText;
    std::uint64_t nextId{1};
    std::optional<std::string> unreportedFault;
    bool closed{false};
};
