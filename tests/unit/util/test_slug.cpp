#include <gtest/gtest.h>

#include <string>

#include "noter/util/slug.hpp"
#include "test_helpers.hpp"

namespace noter::util {

namespace {

std::string slug(std::string_view text) {
    auto result = slugify(text);
    EXPECT_TRUE(result.has_value()) << result.error().message();
    return result.value_or("");
}

}  // namespace

TEST(SlugTest, LowercasesAndJoinsWords) {
    EXPECT_EQ(slug("Premodern East Asia"), "premodern-east-asia");
    EXPECT_EQ(slug("Binomial Heaps"), "binomial-heaps");
}

TEST(SlugTest, CollapsesPunctuationRuns) {
    EXPECT_EQ(slug("C++ & Data/Structures"), "c-data-structures");
    EXPECT_EQ(slug("Week 3: Graphs, Trees"), "week-3-graphs-trees");
    EXPECT_EQ(slug("tabs\tand\nnewlines"), "tabs-and-newlines");
}

TEST(SlugTest, TrimsLeadingAndTrailingSeparators) {
    EXPECT_EQ(slug("  --Hello--  "), "hello");
    EXPECT_EQ(slug("...Intro"), "intro");
}

TEST(SlugTest, EmptyWhenNothingUsable) {
    EXPECT_EQ(slug(""), "");
    EXPECT_EQ(slug("   "), "");
    EXPECT_EQ(slug("!?/--"), "");
}

TEST(SlugTest, KeepsAccentedLetters) {
    EXPECT_EQ(slug("Café Crème"), "café-crème");
    EXPECT_EQ(slug("ÉTUDES"), "études");
}

TEST(SlugTest, ComposesCombiningMarks) {
    // "e" followed by U+0301 COMBINING ACUTE ACCENT
    EXPECT_EQ(slug("Caf\x65\xcc\x81"), "caf\xc3\xa9");
}

TEST(SlugTest, DropsLeadingCombiningMark) {
    EXPECT_EQ(slug("\xcc\x81" "abc"), "abc");
}

TEST(SlugTest, KeepsNonLatinScripts) {
    EXPECT_EQ(slug("東アジア 史"), "東アジア-史");
}

TEST(SlugTest, InvalidUtf8ActsAsSeparator) {
    EXPECT_EQ(slug("ab\xff" "cd"), "ab-cd");
}

TEST(SlugTest, TruncatesToMaxBytes) {
    auto result = slug(std::string(150, 'a'));
    EXPECT_EQ(result.size(), kMaxSlugBytes);
}

TEST(SlugTest, TruncatesOnCodePointBoundary) {
    std::string title = "a";
    for (int i = 0; i < 60; ++i) {
        title += "é";
    }
    auto result = slug(title);
    EXPECT_EQ(result.size(), kMaxSlugBytes - 1);
    auto again = slugify(result);
    ASSERT_OK(again);
    EXPECT_EQ(*again, result);
}

TEST(SlugTest, TruncationDropsTrailingSeparator) {
    std::string title(99, 'a');
    title += " bcd";
    EXPECT_EQ(slug(title), std::string(99, 'a'));
}

TEST(SlugTest, IsIdempotent) {
    const char* samples[] = {
        "Premodern East Asia", "  Mixed CASE and   spaces ", "C++ / Rust?", "Café Crème",
        "東アジア 史", "already-a-slug", "ab\xff" "cd",
        "T\xcc\x88", "J\xcc\x8c", "H\xcc\x88\xcc\xb1", "W\xcc\x8a", "Y\xcc\x8a",
        "\xc4\xb0\xcc\x80",
    };
    for (const char* sample : samples) {
        auto once = slug(sample);
        EXPECT_EQ(slug(once), once) << "for input: " << sample;
    }
}

TEST(SlugTest, ComposesAfterLowercasing) {
    // Only the lower-case letter has a precomposed form
    EXPECT_EQ(slug("T\xcc\x88"), "\xe1\xba\x97");
    EXPECT_EQ(slug("J\xcc\x8c"), "\xc7\xb0");
    EXPECT_EQ(slug("Week T\xcc\x88"), "week-\xe1\xba\x97");
    // Dotted capital I lowercases to a plain i, which then takes the grave
    EXPECT_EQ(slug("\xc4\xb0\xcc\x80"), "\xc3\xac");
}

TEST(SlugTest, IsIdempotentForCombiningMarks) {
    for (char base = 'A'; base <= 'z'; ++base) {
        if (base > 'Z' && base < 'a') {
            continue;
        }
        for (unsigned mark = 0x300; mark <= 0x36F; ++mark) {
            std::string text(1, base);
            text += static_cast<char>(0xC0 | (mark >> 6));
            text += static_cast<char>(0x80 | (mark & 0x3F));

            auto once = slug(text);
            EXPECT_EQ(slug(once), once) << "for U+" << std::hex << mark << " on " << base;
        }
    }
}

TEST(SlugTest, NeverContainsWhitespaceOrSlash) {
    const char* samples[] = {"a b", "a/b", "a\\b", " / ", "x\t\ny", "dir/../up"};
    for (const char* sample : samples) {
        auto result = slug(sample);
        EXPECT_EQ(result.find_first_of(" \t\n/"), std::string::npos) << "for input: " << sample;
    }
}

}  // namespace noter::util
