#include "os_agnostic/BitmapFont.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string_view>

TEST(BitmapFont, ScaleNeverDropsBelowOne) {
    EXPECT_EQ(font5x7::scaleFor(1), 1);
    EXPECT_EQ(font5x7::scaleFor(7), 1);
    EXPECT_EQ(font5x7::scaleFor(13), 1);
    EXPECT_EQ(font5x7::scaleFor(14), 2);
    EXPECT_EQ(font5x7::scaleFor(28), 4);
}

TEST(BitmapFont, SpaceIsBlankAndLettersHaveInk) {
    const std::uint8_t* space = font5x7::glyph(U' ');
    const std::uint8_t* a = font5x7::glyph(U'A');
    int spaceInk = 0;
    int aInk = 0;
    for (int c = 0; c < font5x7::kWidth; ++c) {
        spaceInk += space[c];
        aInk += a[c];
    }
    EXPECT_EQ(spaceInk, 0);
    EXPECT_GT(aInk, 0);
}

TEST(BitmapFont, TabDrawsAsSpace) {
    EXPECT_EQ(std::memcmp(font5x7::glyph(U'\t'), font5x7::glyph(U' '), font5x7::kWidth), 0);
}

TEST(BitmapFont, UnknownCodePointsDrawAsQuestionMark) {
    const std::uint8_t* q = font5x7::glyph(U'?');
    EXPECT_EQ(std::memcmp(font5x7::glyph(0xE9), q, font5x7::kWidth), 0);
    EXPECT_EQ(std::memcmp(font5x7::glyph(0x4E2D), q, font5x7::kWidth), 0);
    EXPECT_EQ(std::memcmp(font5x7::glyph(0x01), q, font5x7::kWidth), 0);
}

TEST(BitmapFont, CellWidths) {
    EXPECT_EQ(font5x7::cellsFor(U'a'), 1);
    EXPECT_EQ(font5x7::cellsFor(0xE9), 1);
    EXPECT_EQ(font5x7::cellsFor(0xFE0F), 0);
    EXPECT_EQ(font5x7::cellsFor(0xFE00), 0);
    EXPECT_EQ(font5x7::cellsFor(0x200D), 0);
    EXPECT_EQ(font5x7::cellsFor(0x2764), font5x7::kEmojiCells);   // heavy black heart
    EXPECT_EQ(font5x7::cellsFor(0x1F600), font5x7::kEmojiCells);
    EXPECT_EQ(font5x7::cellsFor(0x1F1FA), font5x7::kEmojiCells);  // regional indicator
}

TEST(BitmapFont, EmojiHaveTheirOwnPlaceholder) {
    const std::uint8_t* face = font5x7::glyph(0x1F600);
    EXPECT_EQ(std::memcmp(font5x7::glyph(0x2764), face, font5x7::kWidth), 0);
    EXPECT_NE(std::memcmp(face, font5x7::glyph(U'?'), font5x7::kWidth), 0);
}

TEST(BitmapFont, DecodesMultiByteSequences) {
    const std::string_view s = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";  // a, e-acute, euro, emoji
    std::size_t pos = 0;
    EXPECT_EQ(font5x7::nextCodepoint(s, pos), U'a');
    EXPECT_EQ(pos, 1u);
    EXPECT_EQ(font5x7::nextCodepoint(s, pos), char32_t{0xE9});
    EXPECT_EQ(pos, 3u);
    EXPECT_EQ(font5x7::nextCodepoint(s, pos), char32_t{0x20AC});
    EXPECT_EQ(pos, 6u);
    EXPECT_EQ(font5x7::nextCodepoint(s, pos), char32_t{0x1F600});
    EXPECT_EQ(pos, s.size());
    EXPECT_EQ(font5x7::codepointCount(s), 4u);
}

TEST(BitmapFont, MalformedBytesConsumeOneByteEach) {
    const std::string_view truncated = "\xC3";
    std::size_t pos = 0;
    EXPECT_EQ(font5x7::nextCodepoint(truncated, pos), char32_t{0xFFFD});
    EXPECT_EQ(pos, 1u);

    const std::string_view stray = "\x80\xFFz";
    EXPECT_EQ(font5x7::codepointCount(stray), 3u);

    const std::string_view badContinuation = "\xE2(x";
    pos = 0;
    EXPECT_EQ(font5x7::nextCodepoint(badContinuation, pos), char32_t{0xFFFD});
    EXPECT_EQ(pos, 1u);
    EXPECT_EQ(font5x7::nextCodepoint(badContinuation, pos), U'(');
}
