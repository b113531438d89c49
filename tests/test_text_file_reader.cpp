#include "os_agnostic/TextFileReader.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace {

std::string writeTemp(const std::string& name, const std::string& body) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream f(path, std::ios::binary);
    f << body;
    return path;
}

} // namespace

TEST(TextFileReader, ReadsTheWholeFileUntouched) {
    const auto path = writeTemp("textscroll_reader.txt", "line one\r\nline two\n");
    TextFileReader reader;
    std::string content, error;
    EXPECT_TRUE(reader.load(path, content, error));
    EXPECT_EQ(content, "line one\r\nline two\n");
    std::remove(path.c_str());
}

TEST(TextFileReader, EmptyFileIsEmptyText) {
    const auto path = writeTemp("textscroll_empty.txt", "");
    TextFileReader reader;
    std::string content = "stale", error;
    EXPECT_TRUE(reader.load(path, content, error));
    EXPECT_TRUE(content.empty());
    std::remove(path.c_str());
}

TEST(TextFileReader, MissingFileAndEmptyPathFail) {
    TextFileReader reader;
    std::string content = "untouched", error;

    EXPECT_FALSE(reader.load("/no/such/dir/file.txt", content, error));
    EXPECT_NE(error.find("cannot open file"), std::string::npos);
    EXPECT_EQ(content, "untouched");

    EXPECT_FALSE(reader.load("", content, error));
    EXPECT_EQ(error, "no file given");
}

TEST(TextFileReader, RefusesFilesOverTheLimit) {
    const auto path = writeTemp("textscroll_big.txt", std::string(64, 'x'));
    TextFileReader reader(16);
    std::string content, error;
    EXPECT_FALSE(reader.load(path, content, error));
    EXPECT_NE(error.find("file too large"), std::string::npos);
    EXPECT_TRUE(content.empty());
    std::remove(path.c_str());
}
