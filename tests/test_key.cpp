/**
 * @file test_key.cpp
 * @brief Unit tests for collection keys (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "fluent/Key.hpp"

#include <unordered_set>

using namespace fluent;

// ============================================================================
// Normalization
// ============================================================================

TEST(KeyTest, CanonicalIntegerStringsBecomeIntegers) {
    EXPECT_TRUE(Key("7").is_int());
    EXPECT_EQ(Key("7"), Key(7));
    EXPECT_EQ(Key("-3"), Key(-3));
    EXPECT_EQ(Key("0"), Key(0));
}

TEST(KeyTest, NonCanonicalStringsStayStrings) {
    for (const char* text : {"07", "-0", "+7", "7.0", " 7", "", "-"}) {
        EXPECT_TRUE(Key(text).is_string()) << "'" << text << "'";
    }
}

TEST(KeyTest, OverflowingIntegerStringStaysString) {
    EXPECT_TRUE(Key("99999999999999999999").is_string());
}

TEST(KeyTest, IsIntegerKey) {
    EXPECT_TRUE(is_integer_key("12"));
    EXPECT_TRUE(is_integer_key("-4"));
    EXPECT_FALSE(is_integer_key("012"));
    EXPECT_FALSE(is_integer_key("1e3"));
    EXPECT_FALSE(is_integer_key("abc"));
}

// ============================================================================
// Conversions
// ============================================================================

TEST(KeyTest, FromValue) {
    auto from_int = Key::from_value(Value(5));
    ASSERT_TRUE(from_int.has_value());
    EXPECT_EQ(*from_int, Key(5));

    auto from_string = Key::from_value(Value("5"));
    ASSERT_TRUE(from_string.has_value());
    EXPECT_EQ(*from_string, Key(5));

    EXPECT_FALSE(Key::from_value(Value(1.5)).has_value());
    EXPECT_FALSE(Key::from_value(Value(true)).has_value());
    EXPECT_FALSE(Key::from_value(Value(nullptr)).has_value());
    EXPECT_FALSE(Key::from_value(Value::array()).has_value());
}

TEST(KeyTest, StrAndToValue) {
    EXPECT_EQ(Key(42).str(), "42");
    EXPECT_EQ(Key("name").str(), "name");
    EXPECT_EQ(Key(42).to_value(), Value(42));
    EXPECT_EQ(Key("name").to_value(), Value("name"));
}

// ============================================================================
// Ordering and hashing
// ============================================================================

TEST(KeyTest, IntegersOrderBeforeStrings) {
    EXPECT_LT(Key(100), Key("a"));
    EXPECT_LT(Key(2), Key(10));
    EXPECT_LT(Key("a"), Key("b"));
}

TEST(KeyTest, IntegerAndStringWithSameTextDiffer) {
    EXPECT_NE(Key(1), Key("a"));
    EXPECT_NE(Key("01"), Key(1));
}

TEST(KeyTest, HashSetDeduplicatesNormalizedKeys) {
    std::unordered_set<Key> keys{Key(1), Key("1"), Key("one")};
    EXPECT_EQ(keys.size(), 2u);
}
