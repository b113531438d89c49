#include "os_agnostic/Logger.hpp"

#include <gtest/gtest.h>

#include <sstream>

TEST(Logger, DropsLinesBelowThreshold) {
    std::ostringstream os;
    std::mutex m;
    Logger log(os, m, LogLevel::Warn);

    log.debug("scroll", "hidden");
    log.info("scroll", "hidden too");
    EXPECT_TRUE(os.str().empty());

    log.warn("scroll", "shown");
    log.error("scroll", "also shown");
    EXPECT_NE(os.str().find("[warn] scroll: shown\n"), std::string::npos);
    EXPECT_NE(os.str().find("[error] scroll: also shown\n"), std::string::npos);
}

TEST(Logger, PlainLinesUnlessAPrefixIsConfigured) {
    std::ostringstream os;
    std::mutex m;
    Logger log(os, m);

    log.info("input", "plain");
    EXPECT_EQ(os.str(), "[info] input: plain\n");

    os.str("");
    log.setLinePrefix("\r\x1b[2K");
    log.info("input", "cleared");
    EXPECT_EQ(os.str(), "\r\x1b[2K[info] input: cleared\n");
}

TEST(Logger, ThresholdCanBeLowered) {
    std::ostringstream os;
    std::mutex m;
    Logger log(os, m);
    EXPECT_EQ(log.threshold(), LogLevel::Info);

    log.debug("session", "before");
    log.setThreshold(LogLevel::Debug);
    log.debug("session", "after");

    EXPECT_EQ(os.str().find("before"), std::string::npos);
    EXPECT_NE(os.str().find("[debug] session: after"), std::string::npos);
}

TEST(Logger, LevelNames) {
    EXPECT_STREQ(Logger::levelName(LogLevel::Debug), "debug");
    EXPECT_STREQ(Logger::levelName(LogLevel::Info), "info");
    EXPECT_STREQ(Logger::levelName(LogLevel::Warn), "warn");
    EXPECT_STREQ(Logger::levelName(LogLevel::Error), "error");
}
