/**
 * @file ScrollController.cpp
 * @brief Render, deliver, advance, sleep; until cancelled.
 */

#include "ScrollController.hpp"
#include "FrameRenderer.hpp"

#include <exception>
#include <functional>
#include <utility>

const char* controllerStateName(ControllerState state) {
    switch (state) {
        case ControllerState::Running:    return "running";
        case ControllerState::Cancelling: return "cancelling";
        case ControllerState::Terminated: return "terminated";
    }
    return "?";
}

ScrollController::ScrollController(std::uint64_t id, TextLayout layout, const DisplayConfig& config,
                                   FrameSink& frameSink, Logger& logger)
    : sessionId(id),
      textLayout(std::move(layout)),
      settings(config),
      sink(frameSink),
      log(logger)
{
    counters.offset = startOffset();
}

ScrollController::~ScrollController() {
    cancel();
}

void ScrollController::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (started || current != ControllerState::Running) return;
    started = true;
    worker = std::thread(std::ref(*this));
}

void ScrollController::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!started) {
            // Never ran; nothing to wait for.
            current = ControllerState::Terminated;
        } else if (current == ControllerState::Running) {
            current = ControllerState::Cancelling;
        }
    }
    cv.notify_all();

    wait();

    std::lock_guard<std::mutex> lock(joinMutex);
    if (worker.joinable()) worker.join();
}

void ScrollController::wait() {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return current == ControllerState::Terminated; });
}

ControllerState ScrollController::state() const {
    std::lock_guard<std::mutex> lock(mtx);
    return current;
}

ControllerStats ScrollController::stats() const {
    std::lock_guard<std::mutex> lock(mtx);
    return counters;
}

std::optional<std::string> ScrollController::fault() const {
    std::lock_guard<std::mutex> lock(mtx);
    return faultReason;
}

bool ScrollController::deliverFrame(const Frame& frame, std::string& error) {
    try {
        DeliveryStatus status = sink.deliver(frame);
        if (!status.ok) {
            error = status.error.empty() ? "sink reported failure" : status.error;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    } catch (...) {
        error = "sink threw a non-standard exception";
        return false;
    }
}

void ScrollController::finish() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        current = ControllerState::Terminated;
    }
    cv.notify_all();
}

void ScrollController::operator()() {
    const std::string component = "session " + std::to_string(sessionId);
    log.debug(component, "scrolling " + std::to_string(textLayout.lines.size()) + " lines, "
                         + std::to_string(textLayout.totalHeight) + "px tall");

    std::int64_t offset = startOffset();

    std::unique_lock<std::mutex> lock(mtx);
    while (current == ControllerState::Running) {
        lock.unlock();

        // >>> RENDER + DELIVER (never interrupted)
        Frame frame = renderFrame(textLayout, offset, settings);
        frame.session = sessionId;
        std::string error;
        const bool ok = deliverFrame(frame, error);

        offset -= settings.scrollSpeed;
        bool wrapped = false;
        if (offset < -textLayout.totalHeight) {
            offset = startOffset();
            wrapped = true;
        }

        // >>> BOOKKEEPING
        int streak = 0;
        int recoveredAfter = 0;
        bool faulted = false;
        lock.lock();
        if (ok) {
            recoveredAfter = counters.consecutiveFailures;
            ++counters.framesDelivered;
            counters.consecutiveFailures = 0;
        } else {
            ++counters.deliveryFailures;
            streak = ++counters.consecutiveFailures;
            const int limit = settings.maxConsecutiveFailures;
            if (limit > 0 && streak >= limit) {
                faultReason = "display unavailable after " + std::to_string(streak)
                              + " consecutive failed frames (last error: " + error + ")";
                faulted = true;
            }
        }
        if (wrapped) ++counters.cycles;
        counters.offset = offset;
        lock.unlock();

        // Logged outside mtx so a reader holding the console lock can still query stats.
        if (recoveredAfter > 0) {
            log.info(component, "display recovered after " + std::to_string(recoveredAfter) + " missed frames");
        }
        if (streak == 1) {
            log.warn(component, "frame delivery failed: " + error);
        } else if (streak > 1) {
            log.debug(component, "frame delivery failed again: " + error);
        }
        if (faulted) {
            log.error(component, "display unavailable after " + std::to_string(streak)
                                 + " consecutive failed frames, giving up");
            break;
        }

        // >>> SUSPENSION POINT
        lock.lock();
        cv.wait_for(lock, settings.frameInterval,
                    [this] { return current != ControllerState::Running; });
    }
    if (lock.owns_lock()) lock.unlock();

    log.debug(component, "stopped");
    finish();
}
