#include "os_agnostic/SessionManager.hpp"
#include "TestSinks.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <sstream>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

DisplayConfig fastConfig() {
    DisplayConfig c;
    c.viewportWidth = 48;
    c.viewportHeight = 24;
    c.fontSize = 7;
    c.lineSpacing = 1;
    c.frameInterval = 1ms;
    return c;
}

class SessionManagerTest : public ::testing::Test {
protected:
    std::ostringstream out;
    std::mutex outMutex;
    Logger log{out, outMutex, LogLevel::Debug};
    RecordingSink sink;
};

} // namespace

TEST_F(SessionManagerTest, IdsIncreaseWithEachAcceptedSubmission) {
    SessionManager sessions(fastConfig(), sink, log);
    const auto a = sessions.submit("first");
    const auto b = sessions.submit("second");
    EXPECT_TRUE(a.accepted());
    EXPECT_TRUE(b.accepted());
    EXPECT_EQ(a.sessionId, 1u);
    EXPECT_EQ(b.sessionId, 2u);
    EXPECT_EQ(sessions.status().sessionId, 2u);
}

TEST_F(SessionManagerTest, OldSessionIsSilentOnceSubmitReturns) {
    SessionManager sessions(fastConfig(), sink, log);
    sessions.submit("session A");
    ASSERT_TRUE(sink.waitForSession(1, 5));

    sessions.submit("session B");
    const auto fromA = sink.countFor(1);
    ASSERT_TRUE(sink.waitForSession(2, 5));
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(sink.countFor(1), fromA);

    bool seenB = false;
    for (const auto& r : sink.snapshot()) {
        if (r.session == 2) seenB = true;
        if (seenB) EXPECT_EQ(r.session, 2u);
    }
    EXPECT_FALSE(sink.sawOverlap());
}

TEST_F(SessionManagerTest, ConcurrentSubmittersNeverInterleaveSessions) {
    SessionManager sessions(fastConfig(), sink, log);

    std::vector<std::thread> submitters;
    for (int t = 0; t < 4; ++t) {
        submitters.emplace_back([&sessions, t] {
            for (int i = 0; i < 10; ++i) {
                sessions.submit("thread " + std::to_string(t) + " message " + std::to_string(i));
                std::this_thread::sleep_for(1ms);
            }
        });
    }
    for (auto& th : submitters) th.join();
    ASSERT_TRUE(sink.waitForSession(40, 1));
    sessions.stop();

    std::uint64_t previous = 0;
    for (const auto& r : sink.snapshot()) {
        EXPECT_GE(r.session, previous);
        previous = r.session;
    }
    EXPECT_EQ(previous, 40u);
    EXPECT_FALSE(sink.sawOverlap());
}

TEST_F(SessionManagerTest, RejectedOverridesLeaveTheRunningSessionAlone) {
    SessionManager sessions(fastConfig(), sink, log);
    sessions.submit("keep me");
    ASSERT_TRUE(sink.waitForSession(1, 2));

    ConfigOverrides bad;
    bad.scrollSpeed = 0;
    const auto result = sessions.submit("replacement", bad);
    EXPECT_FALSE(result.accepted());
    EXPECT_EQ(result.sessionId, 0u);
    EXPECT_FALSE(result.message.empty());

    const auto before = sink.countFor(1);
    ASSERT_TRUE(sink.waitForSession(1, before + 2));

    const auto status = sessions.status();
    EXPECT_TRUE(status.active);
    EXPECT_EQ(status.sessionId, 1u);
    EXPECT_EQ(sessions.activeText(), std::optional<std::string>("keep me"));

    // The rejected submission did not consume an id.
    EXPECT_EQ(sessions.submit("next").sessionId, 2u);
}

TEST_F(SessionManagerTest, OverridesApplyToThatSessionOnly) {
    SessionManager sessions(fastConfig(), sink, log);

    ConfigOverrides o;
    o.scrollSpeed = 5;
    o.foregroundColor = Color{255, 0, 0};
    sessions.submit("red", o);
    EXPECT_EQ(sessions.status().config.scrollSpeed, 5);
    EXPECT_EQ(sessions.status().config.foreground, (Color{255, 0, 0}));

    sessions.submit("plain");
    EXPECT_EQ(sessions.status().config.scrollSpeed, fastConfig().scrollSpeed);
    EXPECT_EQ(sessions.baseConfig().scrollSpeed, fastConfig().scrollSpeed);
}

TEST_F(SessionManagerTest, StopIsANoOpWhenIdle) {
    SessionManager sessions(fastConfig(), sink, log);
    sessions.stop();
    sessions.stop();
    EXPECT_FALSE(sessions.status().active);
    EXPECT_FALSE(sessions.activeText());
    EXPECT_EQ(sink.count(), 0u);
}

TEST_F(SessionManagerTest, StopSilencesTheSink) {
    SessionManager sessions(fastConfig(), sink, log);
    sessions.submit("going");
    ASSERT_TRUE(sink.waitForFrames(3));
    sessions.stop();

    const auto settled = sink.count();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(sink.count(), settled);
    EXPECT_FALSE(sessions.status().active);
}

TEST_F(SessionManagerTest, ShutdownRejectsEveryLaterSubmission) {
    SessionManager sessions(fastConfig(), sink, log);
    sessions.submit("running");
    ASSERT_TRUE(sink.waitForSession(1, 1));

    sessions.shutdown();
    EXPECT_FALSE(sessions.status().active);

    const auto late = sessions.submit("too late");
    EXPECT_FALSE(late.accepted());
    EXPECT_EQ(late.message, "shutting down");
    EXPECT_FALSE(sessions.status().active);
}

TEST_F(SessionManagerTest, SubmitterRacingShutdownCannotRestartScrolling) {
    SessionManager sessions(fastConfig(), sink, log);

    std::atomic<int> accepted{0};
    std::thread submitter([&] {
        while (sessions.submit("spam").accepted()) ++accepted;
    });
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (accepted.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    sessions.shutdown();
    submitter.join();

    EXPECT_FALSE(sessions.status().active);
    const auto settled = sink.count();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(sink.count(), settled);
}

TEST_F(SessionManagerTest, EmptyTextStillStartsASession) {
    SessionManager sessions(fastConfig(), sink, log);
    const auto result = sessions.submit("");
    EXPECT_TRUE(result.accepted());
    EXPECT_EQ(result.lineCount, 1u);
    EXPECT_TRUE(sink.waitForSession(result.sessionId, 1));
}

TEST_F(SessionManagerTest, FaultOfReplacedSessionIsReported) {
    FailingSink dead(3);  // enough to trip the threshold once, then healthy
    auto config = fastConfig();
    config.maxConsecutiveFailures = 3;
    SessionManager sessions(config, dead, log);

    sessions.submit("doomed");
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (sessions.status().state != ControllerState::Terminated
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(sessions.status().state, ControllerState::Terminated);
    EXPECT_TRUE(sessions.status().fault);

    const auto next = sessions.submit("try again");
    EXPECT_TRUE(next.accepted());
    ASSERT_TRUE(next.previousFault);
    EXPECT_NE(next.previousFault->find("panel not responding"), std::string::npos);

    // Reported once only.
    EXPECT_FALSE(sessions.submit("and again").previousFault);
}
