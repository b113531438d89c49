#include "os_agnostic/CommandHandler.hpp"
#include "TestSinks.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace std::chrono_literals;

namespace {

DisplayConfig fastConfig() {
    DisplayConfig c;
    c.viewportWidth = 48;
    c.viewportHeight = 24;
    c.fontSize = 7;
    c.lineSpacing = 1;
    c.maxCharsPerLine = 32;
    c.frameInterval = 1ms;
    return c;
}

class CommandHandlerTest : public ::testing::Test {
protected:
    std::string run(const std::string& line) {
        console.str("");
        command.execute(line);
        return console.str();
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    ScrollerContext ctx;
    std::ostringstream logStream;
    std::mutex logMutex;
    Logger log{logStream, logMutex, LogLevel::Debug};
    RecordingSink sink;
    SessionManager sessions{fastConfig(), sink, log};
    std::ostringstream console;
    CommandHandler command{ctx, sessions, console};
};

} // namespace

TEST_F(CommandHandlerTest, ShowStartsASessionAndEchoesTheCommand) {
    const auto out = run("show Hello World");
    EXPECT_TRUE(contains(out, "> show Hello World\n"));
    EXPECT_TRUE(contains(out, "Scrolling 1 line (session 1)."));
    EXPECT_EQ(sessions.activeText(), std::optional<std::string>("Hello World"));
    EXPECT_TRUE(sink.waitForSession(1, 1));
}

TEST_F(CommandHandlerTest, SetTextUnescapesAndStripsQuotes) {
    const auto out = run("set_text \"one\\ntwo\"");
    EXPECT_TRUE(contains(out, "Scrolling 2 lines (session 1)."));
    EXPECT_EQ(sessions.activeText(), std::optional<std::string>("one\ntwo"));
}

TEST_F(CommandHandlerTest, CommandNamesAreCaseInsensitive) {
    EXPECT_TRUE(contains(run("SHOW hi"), "Scrolling 1 line"));
}

TEST_F(CommandHandlerTest, SetSpeedRestartsTheRunningText) {
    run("show moving");
    const auto out = run("set_speed 5");
    EXPECT_TRUE(contains(out, "Speed set to 5 px/frame. Restarted scrolling."));

    const auto status = sessions.status();
    EXPECT_EQ(status.sessionId, 2u);
    EXPECT_EQ(status.config.scrollSpeed, 5);
    EXPECT_EQ(sessions.activeText(), std::optional<std::string>("moving"));
}

TEST_F(CommandHandlerTest, SetSpeedWhileIdleOnlyRecordsTheOverride) {
    const auto out = run("set_speed 4");
    EXPECT_TRUE(contains(out, "Speed set to 4 px/frame."));
    EXPECT_FALSE(contains(out, "Restarted"));
    EXPECT_FALSE(sessions.status().active);
    ASSERT_TRUE(command.pendingOverrides().scrollSpeed);
    EXPECT_EQ(*command.pendingOverrides().scrollSpeed, 4);
    EXPECT_TRUE(contains(run("config"), "speed=4px"));
}

TEST_F(CommandHandlerTest, NumericCommandsExplainUsage) {
    EXPECT_TRUE(contains(run("set_speed"), "Usage: set_speed <px>"));
    EXPECT_TRUE(contains(run("set_interval fast"), "Usage: set_interval <ms>"));
    EXPECT_TRUE(contains(run("set_font 12 14"), "Usage: set_font <size>"));
    EXPECT_TRUE(contains(run("set_width x"), "Usage: set_width <chars>"));
}

TEST_F(CommandHandlerTest, InvalidValuesNeverReachTheSession) {
    run("show steady");
    const auto out = run("set_speed 0");
    EXPECT_TRUE(contains(out, "Invalid value:"));
    EXPECT_FALSE(command.pendingOverrides().scrollSpeed);
    EXPECT_EQ(sessions.status().sessionId, 1u);

    EXPECT_TRUE(contains(run("set_interval -5"), "Invalid value:"));
    EXPECT_TRUE(contains(run("set_font 0"), "Invalid value:"));
    EXPECT_TRUE(contains(run("set_font 1000000000"), "Invalid value:"));
    EXPECT_TRUE(contains(run("set_width 1000000000"), "Invalid value:"));
    EXPECT_TRUE(contains(run("set_speed 1000000000"), "Invalid value:"));
}

TEST_F(CommandHandlerTest, SetWidthZeroFitsTheDisplay) {
    EXPECT_TRUE(contains(run("set_width 0"), "Width set to fit the display."));
    EXPECT_TRUE(contains(run("set_width 12"), "Width set to 12 characters."));
}

TEST_F(CommandHandlerTest, SetColorsAcceptsOptionalBackground) {
    EXPECT_TRUE(contains(run("set_colors red"), "Colours set to #ff0000."));
    EXPECT_FALSE(command.pendingOverrides().backgroundColor);

    EXPECT_TRUE(contains(run("set_colours #00ff00 navy"), "Unknown colour: navy"));
    EXPECT_TRUE(contains(run("set_colors yellow #000080"), "Colours set to #ffff00 on #000080."));
    EXPECT_EQ(command.pendingOverrides().backgroundColor, (Color{0, 0, 128}));

    EXPECT_TRUE(contains(run("set_colors"), "Usage: set_colors <fg> [bg]"));
    EXPECT_TRUE(contains(run("set_colors mauve"), "Unknown colour: mauve"));
}

TEST_F(CommandHandlerTest, ResetConfigDropsOverrides) {
    run("set_speed 9");
    run("set_colors red");
    EXPECT_TRUE(contains(run("reset_config"), "Overrides cleared."));
    EXPECT_TRUE(command.pendingOverrides().empty());
}

TEST_F(CommandHandlerTest, StopReportsWhetherAnythingWasScrolling) {
    run("show bye");
    EXPECT_TRUE(contains(run("stop"), "Scrolling stopped."));
    EXPECT_TRUE(contains(run("stop"), "Nothing is scrolling."));
    EXPECT_FALSE(sessions.status().active);
}

TEST_F(CommandHandlerTest, StatusDescribesTheSession) {
    EXPECT_TRUE(contains(run("status"), "Idle."));

    run("show a\\nb\\nc");
    ASSERT_TRUE(sink.waitForSession(1, 1));
    const auto out = run("status");
    EXPECT_TRUE(contains(out, "Session 1: running, 3 lines"));
    EXPECT_TRUE(contains(out, "frames delivered"));
}

TEST_F(CommandHandlerTest, LoadFileReportsMissingFiles) {
    EXPECT_TRUE(contains(run("load_file /definitely/not/here.txt"), "Error: cannot open file"));
    EXPECT_TRUE(contains(run("load_file"), "Error: no file given"));
    EXPECT_FALSE(sessions.status().active);
}

TEST_F(CommandHandlerTest, LoadFileScrollsTheContents) {
    const std::string path = ::testing::TempDir() + "textscroll_credits.txt";
    {
        std::ofstream f(path);
        f << "Directed by\nSomeone\n";
    }
    const auto out = run("load_file " + path);
    std::remove(path.c_str());

    EXPECT_TRUE(contains(out, "Scrolling 3 lines"));
    EXPECT_EQ(sessions.activeText(), std::optional<std::string>("Directed by\nSomeone\n"));
}

TEST_F(CommandHandlerTest, UnknownCommandsPointToHelp) {
    EXPECT_TRUE(contains(run("dance"), "Unknown command. Type 'help'."));
    EXPECT_TRUE(contains(run("help"), "load_file <path>"));
}

TEST_F(CommandHandlerTest, ExitStopsScrollingAndRaisesTheFlag) {
    run("show last words");
    const auto out = run("exit");
    EXPECT_TRUE(contains(out, "Exiting..."));
    EXPECT_TRUE(ctx.exitRequested.load());
    EXPECT_FALSE(sessions.status().active);
}

TEST_F(CommandHandlerTest, PreviewRowsAreReservedOnlyWhileScrolling) {
    command.setPreviewRows(4);
    run("status");
    EXPECT_EQ(ctx.getPreviewRows(), 0);

    run("show visible");
    EXPECT_EQ(ctx.getPreviewRows(), 4);
    EXPECT_TRUE(ctx.getHasPromptLine());

    run("stop");
    EXPECT_EQ(ctx.getPreviewRows(), 0);
}

TEST(CommandHandlerUnescape, TranslatesKnownEscapesOnly) {
    EXPECT_EQ(CommandHandler::unescape("a\\nb"), "a\nb");
    EXPECT_EQ(CommandHandler::unescape("tab\\there"), "tab\there");
    EXPECT_EQ(CommandHandler::unescape("back\\\\slash"), "back\\slash");
    EXPECT_EQ(CommandHandler::unescape("keep \\q and trailing \\"), "keep \\q and trailing \\");
}
