/**
 * @file ScrollController.hpp
 * @brief Background render loop that scrolls one text layout until cancelled.
 */

#pragma once

#include "DisplayConfig.hpp"
#include "FrameSink.hpp"
#include "LayoutEngine.hpp"
#include "Logger.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

/**
 * @brief Lifecycle of one controller instance.
 *
 * Running -> Cancelling when cancel() is called, Cancelling -> Terminated
 * when the loop notices at its next frame sleep. A controller whose sink has
 * failed too many times in a row goes straight from Running to Terminated.
 */
enum class ControllerState {
    Running,
    Cancelling,
    Terminated
};

const char* controllerStateName(ControllerState state);

/**
 * @brief Counters sampled from a controller.
 */
struct ControllerStats {
    std::uint64_t framesDelivered{0};
    std::uint64_t deliveryFailures{0};
    std::uint64_t cycles{0};              // times the text scrolled fully off and wrapped
    int consecutiveFailures{0};
    std::int64_t offset{0};               // offset of the next frame to render
};

/**
 * @brief Scrolls one TextLayout across a FrameSink on a dedicated thread.
 *
 * Each iteration renders the current offset, delivers it, moves the offset up
 * by scrollSpeed and sleeps frameInterval. Once the text is entirely above
 * the viewport the offset restarts at the viewport height. The frame sleep is
 * the only place cancellation is observed, so a frame that has started
 * rendering is always delivered whole.
 */
class ScrollController {
public:
    /**
     * @param sessionId Stamped onto every delivered frame.
     * @param layout    Owned by this controller for its whole life.
     * @param config    Copied; must already be valid.
     * @param sink      Borrowed; only this controller writes to it while Running.
     * @param log       Borrowed logger for delivery problems.
     */
    ScrollController(std::uint64_t sessionId, TextLayout layout, const DisplayConfig& config,
                     FrameSink& sink, Logger& log);

    /** @brief Cancels and joins if still running. */
    ~ScrollController();

    ScrollController(const ScrollController&) = delete;
    ScrollController& operator=(const ScrollController&) = delete;

    /** @brief Launch the render thread. Calling it twice has no effect. */
    void start();

    /**
     * @brief Ask the loop to stop and block until it is Terminated.
     *
     * Safe to call from any thread other than the render thread, any number
     * of times; a no-op once Terminated.
     */
    void cancel();

    /** @brief Block until the controller reaches Terminated. */
    void wait();

    /** @brief The render thread body. */
    void operator()();

    ControllerState state() const;
    ControllerStats stats() const;

    /** @brief Why the controller stopped itself, if it did. */
    std::optional<std::string> fault() const;

    std::uint64_t id() const { return sessionId; }
    const TextLayout& layout() const { return textLayout; }
    const DisplayConfig& config() const { return settings; }

    /** @brief Offset of the first frame and of every frame after a wrap. */
    int startOffset() const { return settings.viewportHeight; }

private:
    bool deliverFrame(const Frame& frame, std::string& error);
    void finish();

    const std::uint64_t sessionId;
    const TextLayout textLayout;
    const DisplayConfig settings;
    FrameSink& sink;
    Logger& log;

    // >>> STATE (guarded by mtx)
    mutable std::mutex mtx;
    std::condition_variable cv;      // wakes the frame sleep and anyone in wait()
    ControllerState current{ControllerState::Running};
    ControllerStats counters;
    std::optional<std::string> faultReason;
    bool started{false};

    std::mutex joinMutex;
    std::thread worker;
};
