/// @file tests/phone/test_cleaner.cpp
/// @brief Unit tests for Cleaner (formatting filter and letter scan).
///
/// Test categories:
///   - Each formatting byte is removed
///   - Every other byte is kept in order
///   - Letter scan is ASCII-only
///   - all_digits() on empty, digit and mixed input

#include <gtest/gtest.h>
#include "phone/cleaner.hpp"

#include <string>

using namespace nanp::phone;

// ─── strip ───────────────────────────────────────────────────────────────────

TEST(Cleaner, StripRemovesParenthesesDashesAndDots) {
    EXPECT_EQ(Cleaner::strip("(303) 555-1212"), "3035551212");
    EXPECT_EQ(Cleaner::strip("303.555.1212"),   "3035551212");
}

TEST(Cleaner, StripRemovesEveryWhitespaceKind) {
    EXPECT_EQ(Cleaner::strip(" 3\t0\n3\v5\f5\r5 "), "303555");
}

TEST(Cleaner, StripIgnoresStructure) {
    // Unbalanced or misplaced punctuation is deleted all the same.
    EXPECT_EQ(Cleaner::strip(")30(3-.-555))1212("), "3035551212");
}

TEST(Cleaner, StripKeepsOtherSymbols) {
    EXPECT_EQ(Cleaner::strip("+1 (303) 555-12#*"), "+130355512#*");
    EXPECT_EQ(Cleaner::strip("a|b_c"), "a|b_c");
}

TEST(Cleaner, StripEmptyAndAllFormatting) {
    EXPECT_EQ(Cleaner::strip(""), "");
    EXPECT_EQ(Cleaner::strip("( ) - . \t"), "");
}

TEST(Cleaner, StripKeepsNonAsciiBytes) {
    const std::string raw = "30\xC3\xA9-5";
    EXPECT_EQ(Cleaner::strip(raw), "30\xC3\xA9" "5");
}

// ─── contains_letter ─────────────────────────────────────────────────────────

TEST(Cleaner, ContainsLetterDetectsBothCases) {
    EXPECT_TRUE(Cleaner::contains_letter("303555121a"));
    EXPECT_TRUE(Cleaner::contains_letter("Z303555121"));
}

TEST(Cleaner, ContainsLetterFalseForDigitsAndSymbols) {
    EXPECT_FALSE(Cleaner::contains_letter("3035551212"));
    EXPECT_FALSE(Cleaner::contains_letter("#*+@!_[]{}"));
    EXPECT_FALSE(Cleaner::contains_letter(""));
}

TEST(Cleaner, ContainsLetterIgnoresNonAscii) {
    EXPECT_FALSE(Cleaner::contains_letter("\xC3\xA9\xC3\xB1"));
}

// ─── all_digits ──────────────────────────────────────────────────────────────

TEST(Cleaner, AllDigits) {
    EXPECT_TRUE(Cleaner::all_digits("0123456789"));
    EXPECT_FALSE(Cleaner::all_digits(""));
    EXPECT_FALSE(Cleaner::all_digits("012345678#"));
    EXPECT_FALSE(Cleaner::all_digits("+123456789"));
}

TEST(Cleaner, CharacterClassesAreConstexpr) {
    static_assert(Cleaner::is_formatting('('));
    static_assert(!Cleaner::is_formatting('+'));
    static_assert(Cleaner::is_ascii_letter('q'));
    static_assert(!Cleaner::is_ascii_letter('7'));
    SUCCEED();
}
