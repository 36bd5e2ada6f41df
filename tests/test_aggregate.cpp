/**
 * @file test_aggregate.cpp
 * @brief Unit tests for Collection aggregates (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "fluent/Helpers.hpp"

#include <cstdint>
#include <limits>

using namespace fluent;

class AggregateTest : public ::testing::Test {
protected:
    Collection orders = collect(Value::parse(R"([
        {"id": 1, "total": 10, "status": "paid"},
        {"id": 2, "total": "20", "status": "open"},
        {"id": 3, "total": 30.5, "status": "paid"},
        {"id": 4, "status": "void"}
    ])"));
};

// ============================================================================
// sum / avg
// ============================================================================

TEST(SumTest, IntegersStayIntegers) {
    Value total = collect(Value::parse("[1, 2, 3]")).sum();
    EXPECT_TRUE(total.is_number_integer());
    EXPECT_EQ(total, 6);
}

TEST(SumTest, EmptyIsZero) {
    EXPECT_EQ(collect().sum(), 0);
}

TEST(SumTest, SkipsNonNumericValues) {
    EXPECT_EQ(collect(Value::parse(R"([1, "x", null, "2"])")).sum(), 3);
}

TEST_F(AggregateTest, SumByPathReadsNumericStrings) {
    EXPECT_DOUBLE_EQ(orders.sum("total").get<double>(), 60.5);
}

TEST_F(AggregateTest, SumByCallable) {
    Value ids = orders.sum([](const Value& order) { return order["id"]; });
    EXPECT_EQ(ids, 10);
}

TEST(SumTest, IntegerOverflowFallsBackToFloat) {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    Value total = collect(Value::parse("[9223372036854775807, 1]")).sum();
    EXPECT_TRUE(total.is_number_float());
    EXPECT_DOUBLE_EQ(total.get<double>(), static_cast<double>(max) + 1.0);

    Value negative = collect(Value::parse("[-9223372036854775808, -1]")).sum();
    EXPECT_TRUE(negative.is_number_float());
    EXPECT_DOUBLE_EQ(negative.get<double>(), -9223372036854775808.0 - 1.0);
}

TEST(SumTest, UnsignedAboveInt64IsNotWrapped) {
    Value total = collect(Value::parse("[18446744073709551615, 1]")).sum();
    EXPECT_TRUE(total.is_number_float());
    EXPECT_DOUBLE_EQ(total.get<double>(), 18446744073709551616.0);
}

TEST(AvgTest, ExactMeanIsInteger) {
    EXPECT_EQ(collect(Value::parse("[1, 2, 3]")).avg(), 2);
    EXPECT_DOUBLE_EQ(collect(Value::parse("[1, 2]")).avg().get<double>(), 1.5);
}

TEST(AvgTest, EmptyIsNull) {
    EXPECT_TRUE(collect().avg().is_null());
}

TEST(AvgTest, ExtremeValuesDoNotOverflow) {
    Value mean = collect(Value::parse("[9223372036854775807, 9223372036854775807]")).avg();
    EXPECT_DOUBLE_EQ(mean.get<double>(), 9223372036854775807.0);

    EXPECT_EQ(collect(Value::parse("[-9223372036854775808]")).avg(),
              std::numeric_limits<std::int64_t>::min());
}

TEST(MedianTest, ExtremeCentralValuesDoNotOverflow) {
    Value middle = collect(Value::parse("[9223372036854775807, 9223372036854775806]")).median();
    EXPECT_DOUBLE_EQ(middle.get<double>(), 9223372036854775806.5);
}

TEST_F(AggregateTest, AvgOverItemsThePathResolvesIn) {
    Value mean = orders.avg("total");
    EXPECT_NEAR(mean.get<double>(), 60.5 / 3, 1e-9);
}

TEST_F(AggregateTest, AvgWithNoResolvedPathIsNull) {
    EXPECT_TRUE(orders.avg("discount").is_null());
}

// ============================================================================
// min / max
// ============================================================================

TEST(MinMaxTest, Numbers) {
    Collection c = collect(Value::parse("[5, 3, 9]"));
    EXPECT_EQ(c.min(), 3);
    EXPECT_EQ(c.max(), 9);
}

TEST(MinMaxTest, SkipsNulls) {
    Collection c = collect(Value::parse("[null, 4, null, 2]"));
    EXPECT_EQ(c.min(), 2);
    EXPECT_EQ(c.max(), 4);
}

TEST(MinMaxTest, EmptyIsNull) {
    EXPECT_TRUE(collect().min().is_null());
    EXPECT_TRUE(collect().max().is_null());
}

TEST_F(AggregateTest, MinMaxByPathCompareLoosely) {
    EXPECT_EQ(orders.min("total"), 10);
    EXPECT_EQ(orders.max("total"), 30.5);
}

// ============================================================================
// median / mode
// ============================================================================

TEST(MedianTest, OddCountIsMiddleValue) {
    Value middle = collect(Value::parse("[3, 1, 2]")).median();
    EXPECT_TRUE(middle.is_number_integer());
    EXPECT_EQ(middle, 2);
}

TEST(MedianTest, EvenCountIsMeanOfCentralValues) {
    EXPECT_DOUBLE_EQ(collect(Value::parse("[1, 2, 3, 4]")).median().get<double>(), 2.5);
    EXPECT_EQ(collect(Value::parse("[1, 3, 5, 7]")).median(), 4);
}

TEST(MedianTest, IgnoresNonNumericAndEmpty) {
    EXPECT_EQ(collect(Value::parse(R"(["a", 7, null])")).median(), 7);
    EXPECT_TRUE(collect().median().is_null());
}

TEST_F(AggregateTest, MedianByPath) {
    EXPECT_EQ(orders.median("total"), 20);
}

TEST(ModeTest, ReturnsAllTiedValues) {
    EXPECT_EQ(collect(Value::parse("[1, 1, 2, 2, 3]")).mode(), Value::parse("[1, 2]"));
    EXPECT_EQ(collect(Value::parse("[4, 5, 5]")).mode(), Value::parse("[5]"));
}

TEST(ModeTest, EmptyIsEmptyArray) {
    EXPECT_EQ(collect().mode(), Value::array());
}

TEST_F(AggregateTest, ModeByPath) {
    EXPECT_EQ(orders.mode("status"), Value::parse(R"(["paid"])"));
}

// ============================================================================
// count / count_by
// ============================================================================

TEST_F(AggregateTest, CountByPathCountsResolvedItems) {
    EXPECT_EQ(orders.count(), 4u);
    EXPECT_EQ(orders.count("total"), 3u);
}

TEST_F(AggregateTest, CountByCallableCountsTruthyResults) {
    std::size_t paid = orders.count([](const Value& order) { return order["status"] == "paid"; });
    EXPECT_EQ(paid, 2u);
}

TEST_F(AggregateTest, CountBy) {
    EXPECT_EQ(orders.count_by("status").to_array(),
              Value::parse(R"({"paid": 2, "open": 1, "void": 1})"));
}

TEST(CountByTest, IntegerValuesBecomeIntegerKeys) {
    EXPECT_EQ(collect(Value::parse("[1, 1, 0]")).count_by().to_array(), Value::parse(R"({"1": 2, "0": 1})"));
}
