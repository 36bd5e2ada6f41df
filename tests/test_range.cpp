/**
 * @file test_range.cpp
 * @brief Unit tests for integer, float and character ranges (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "fluent/Errors.hpp"
#include "fluent/Helpers.hpp"

#include <cstdint>
#include <limits>

using namespace fluent;

// ============================================================================
// Integer ranges
// ============================================================================

TEST(IntegerRangeTest, InclusiveBounds) {
    EXPECT_EQ(range(1, 5).to_array(), Value::parse("[1, 2, 3, 4, 5]"));
    EXPECT_EQ(range(3, 3).to_array(), Value::parse("[3]"));
}

TEST(IntegerRangeTest, Step) {
    EXPECT_EQ(range(0, 10, 3).to_array(), Value::parse("[0, 3, 6, 9]"));
}

TEST(IntegerRangeTest, DescendsWhenStartExceedsEnd) {
    EXPECT_EQ(range(5, 1).to_array(), Value::parse("[5, 4, 3, 2, 1]"));
    EXPECT_EQ(range(10, 0, 4).to_array(), Value::parse("[10, 6, 2]"));
}

TEST(IntegerRangeTest, OnlyStepMagnitudeCounts) {
    EXPECT_EQ(range(1, 3, -1).to_array(), Value::parse("[1, 2, 3]"));
}

TEST(IntegerRangeTest, NumericStringBounds) {
    Value values = range("1", "3").to_array();
    EXPECT_EQ(values, Value::parse("[1, 2, 3]"));
    EXPECT_TRUE(values[0].is_number_integer());
}

TEST(IntegerRangeTest, ElementsAreIntegers) {
    EXPECT_TRUE(range(1, 2).first().is_number_integer());
}

TEST(IntegerRangeTest, SpanWiderThanInt64) {
    const std::int64_t bound = 6000000000000000000;
    LazyCollection wide = range(Value(-bound), Value(bound), Value(std::int64_t{3000000000000000000}));
    Value values = wide.to_array();
    ASSERT_EQ(values.size(), 5u);
    EXPECT_EQ(values[0], -bound);
    EXPECT_EQ(values[2], 0);
    EXPECT_EQ(values[4], bound);
    EXPECT_EQ(wide.keys().to_array(), Value::parse("[0, 1, 2, 3, 4]"));
}

TEST(IntegerRangeTest, StopsAtInt64Limit) {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    Value values = range(Value(0), Value(max), Value(max)).to_array();
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values[1], max);
}

TEST(IntegerRangeTest, NearbyLargeBoundsKeepDirection) {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    Value values = range(Value(max), Value(max - 2)).to_array();
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[2], max - 2);
}

TEST(IntegerRangeTest, StepBeyondInt64Throws) {
    const Value huge = Value::parse("9223372036854775808");
    EXPECT_THROW(range(0, 10, huge), InvalidArgumentError);
    EXPECT_THROW(range_from(0, huge), InvalidArgumentError);
    EXPECT_THROW(range(Value::parse("18446744073709551615"), 0), InvalidArgumentError);
}

// ============================================================================
// Float ranges
// ============================================================================

TEST(FloatRangeTest, FloatStep) {
    EXPECT_EQ(range(0, 1, 0.25).to_array(), Value::parse("[0.0, 0.25, 0.5, 0.75, 1.0]"));
}

TEST(FloatRangeTest, ToleratesRepresentationErrorAtUpperBound) {
    Value values = range(0, 0.3, 0.1).to_array();
    ASSERT_EQ(values.size(), 4u);
    EXPECT_NEAR(values[3].get<double>(), 0.3, 1e-12);
}

TEST(FloatRangeTest, ComputedFromStartNotAccumulated) {
    Value values = range(0, 1, 0.1).to_array();
    ASSERT_EQ(values.size(), 11u);
    EXPECT_DOUBLE_EQ(values[7].get<double>(), 7 * 0.1);
}

TEST(FloatRangeTest, FractionalStringStep) {
    EXPECT_EQ(range(1, 2, "0.5").to_array(), Value::parse("[1.0, 1.5, 2.0]"));
}

TEST(FloatRangeTest, Descending) {
    EXPECT_EQ(range(1.0, 0, 0.5).to_array(), Value::parse("[1.0, 0.5, 0.0]"));
}

// ============================================================================
// Character ranges
// ============================================================================

TEST(CharRangeTest, Letters) {
    EXPECT_EQ(range("a", "e").to_array(), Value::parse(R"(["a", "b", "c", "d", "e"])"));
}

TEST(CharRangeTest, DescendingWithStep) {
    EXPECT_EQ(range("e", "a", 2).to_array(), Value::parse(R"(["e", "c", "a"])"));
}

// ============================================================================
// Errors
// ============================================================================

TEST(RangeErrorTest, ZeroStep) {
    EXPECT_THROW(range(1, 5, 0), InvalidArgumentError);
    EXPECT_THROW(range_from(1, 0), InvalidArgumentError);
}

TEST(RangeErrorTest, NonNumericBounds) {
    EXPECT_THROW(range("a", "zz"), InvalidArgumentError);
    EXPECT_THROW(range(1, Value::parse("[2]")), InvalidArgumentError);
    EXPECT_THROW(range(1, 5, "x"), InvalidArgumentError);
}

// ============================================================================
// Endless ranges
// ============================================================================

TEST(RangeFromTest, CountsUp) {
    EXPECT_EQ(range_from(5).take(3).to_array(), Value::parse("[5, 6, 7]"));
}

TEST(RangeFromTest, NegativeStepCountsDown) {
    EXPECT_EQ(range_from(0, -2).take(3).to_array(), Value::parse("[0, -2, -4]"));
}

TEST(RangeFromTest, FloatStep) {
    EXPECT_EQ(range_from(0, 0.5).take(3).to_array(), Value::parse("[0.0, 0.5, 1.0]"));
}

TEST(RangeFromTest, RestartsOnEveryIteration) {
    LazyCollection naturals = range_from(1);
    EXPECT_EQ(naturals.take(2).to_array(), Value::parse("[1, 2]"));
    EXPECT_EQ(naturals.take(2).to_array(), Value::parse("[1, 2]"));
    EXPECT_EQ(naturals.first(), 1);
}

// ============================================================================
// Eager ranges
// ============================================================================

TEST(CollectionRangeTest, Materializes) {
    Collection c = Collection::range(1, 9, 4);
    EXPECT_EQ(c.to_array(), Value::parse("[1, 5, 9]"));
    EXPECT_EQ(c.count(), 3u);
}

TEST(CollectionRangeTest, ProducerDrivesLazyCollection) {
    LazyCollection squares = lazy_collect(range_producer(1, 4))
        .map([](const Value& v) { return v.get<int>() * v.get<int>(); });
    EXPECT_EQ(squares.to_array(), Value::parse("[1, 4, 9, 16]"));
}
