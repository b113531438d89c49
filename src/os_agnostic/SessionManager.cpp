/**
 * @file SessionManager.cpp
 * @brief Cancel-then-start session swapping behind one mutex.
 */

#include "SessionManager.hpp"
#include "LayoutEngine.hpp"
#include "TextLayoutMetrics.hpp"

#include <utility>

SessionManager::SessionManager(const DisplayConfig& config, FrameSink& frameSink, Logger& logger)
    : base(config), sink(frameSink), log(logger) {}

SessionManager::~SessionManager() {
    stop();
}

// Caller holds sessionMutex.
void SessionManager::teardownLocked() {
    if (!active) return;

    active->cancel();  // blocks until the render thread has exited
    if (auto why = active->fault()) {
        unreportedFault = std::move(why);
    }
    log.debug("sessions", "session " + std::to_string(active->id()) + " torn down after "
                          + std::to_string(active->stats().framesDelivered) + " frames");
    active.reset();
    currentText.clear();
}

SubmissionResult SessionManager::submit(const std::string& text, const ConfigOverrides& overrides) {
    SubmissionResult result;

    const DisplayConfig config = overrides.applyTo(base);
    if (auto problem = config.validate()) {
        result.status = SubmissionStatus::Rejected;
        result.message = *problem;
        log.warn("sessions", "submission rejected: " + *problem);
        return result;
    }

    std::lock_guard<std::mutex> lock(sessionMutex);
    if (closed) {
        result.status = SubmissionStatus::Rejected;
        result.message = "shutting down";
        return result;
    }

    teardownLocked();
    result.previousFault = std::move(unreportedFault);
    unreportedFault.reset();

    FontMetrics metrics(config);
    TextLayout layout = layoutText(text, metrics);
    result.lineCount = layout.lines.size();
    result.sessionId = nextId++;

    active = std::make_unique<ScrollController>(result.sessionId, std::move(layout), config, sink, log);
    currentText = text;
    active->start();

    log.info("sessions", "session " + std::to_string(result.sessionId) + " started ("
                         + std::to_string(result.lineCount) + " lines)");
    return result;
}

void SessionManager::stop() {
    std::lock_guard<std::mutex> lock(sessionMutex);
    teardownLocked();
}

void SessionManager::shutdown() {
    std::lock_guard<std::mutex> lock(sessionMutex);
    closed = true;
    teardownLocked();
}

SessionStatus SessionManager::status() const {
    std::lock_guard<std::mutex> lock(sessionMutex);
    SessionStatus s;
    s.config = base;
    if (!active) {
        s.fault = unreportedFault;
        return s;
    }
    s.active = true;
    s.sessionId = active->id();
    s.state = active->state();
    s.stats = active->stats();
    s.lineCount = active->layout().lines.size();
    s.fault = active->fault();
    s.config = active->config();
    return s;
}

std::optional<std::string> SessionManager::activeText() const {
    std::lock_guard<std::mutex> lock(sessionMutex);
    if (!active) return std::nullopt;
    return currentText;
}
