/// @file tests/phone/test_derived_views.cpp
/// @brief Unit tests for area_code() and pretty().

#include <gtest/gtest.h>
#include "nanp/phone.hpp"

#include <string>
#include <vector>

using namespace nanp::phone;

// ─── area_code ───────────────────────────────────────────────────────────────

TEST(AreaCode, FromDashedNumber) {
    EXPECT_EQ(area_code("123-456-7890"), "123");
}

TEST(AreaCode, IgnoresCountryCode) {
    EXPECT_EQ(area_code("+1 (303) 555-1212"), "303");
    EXPECT_EQ(area_code("1 303 555 1212"),    "303");
}

TEST(AreaCode, InvalidIsZeros) {
    EXPECT_EQ(area_code("867.5309"), "000");
    EXPECT_EQ(area_code("1800FLOWERS"), "000");
}

TEST(AreaCode, SymbolsPassThrough) {
    EXPECT_EQ(area_code("#*3 555 1212"), "#*3");
}

// ─── pretty ──────────────────────────────────────────────────────────────────

TEST(Pretty, FromDashedNumber) {
    EXPECT_EQ(pretty("123-456-7890"), "(123) 456-7890");
}

TEST(Pretty, FromInternationalNumber) {
    EXPECT_EQ(pretty("+1 (303) 555-1212"), "(303) 555-1212");
}

TEST(Pretty, InvalidIsZeros) {
    EXPECT_EQ(pretty("867.5309"), "(000) 000-0000");
}

TEST(Pretty, AlreadyPrettyIsUnchanged) {
    EXPECT_EQ(pretty("(303) 555-1212"), "(303) 555-1212");
}

// ─── Consistency with canonicalize ───────────────────────────────────────────

TEST(DerivedViews, SlicesOfCanonicalForm) {
    const std::vector<std::string> inputs = {
        "", "867.5309", "123-456-7890", "+1 (303) 555-1212",
        "11234567890", "21234567890", "303-555-12#*", "abc",
    };
    for (const auto& raw : inputs) {
        const std::string c = canonicalize(raw);
        EXPECT_EQ(area_code(raw), c.substr(0, 3)) << "input: " << raw;
        EXPECT_EQ(pretty(raw),
                  "(" + c.substr(0, 3) + ") " + c.substr(3, 3) + "-" + c.substr(6, 4))
            << "input: " << raw;
    }
}
