/**
 * @file test_lazy.cpp
 * @brief Unit tests for LazyCollection and Sequence (GoogleTest)
 *
 * Tests cover:
 * - Restartable iteration over every source kind
 * - Deferred evaluation and early termination on endless sources
 * - Derived operations and deferred sorting
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "fluent/Errors.hpp"
#include "fluent/Helpers.hpp"

#include <memory>

using namespace fluent;

namespace {

/// Producer over 1..n that records how many elements were pulled in total
Producer counting_producer(std::int64_t n, std::shared_ptr<int> pulls) {
    return [n, pulls]() {
        std::int64_t current = 0;
        return Sequence([n, pulls, current]() mutable -> std::optional<Entry> {
            if (current >= n) {
                return std::nullopt;
            }
            ++*pulls;
            ++current;
            return Entry(Key(current - 1), Value(current));
        });
    };
}

const auto is_even = [](const Value& v) { return v.get<std::int64_t>() % 2 == 0; };

} // namespace

// ============================================================================
// Sequence
// ============================================================================

TEST(SequenceTest, PullsItemsInOrder) {
    auto items = std::make_shared<const Items>(Items::list({"a", "b"}));
    Sequence seq = Sequence::of(items);

    auto first = seq.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->second, "a");
    EXPECT_EQ(seq.next()->first, Key(1));
    EXPECT_FALSE(seq.next().has_value());
    EXPECT_TRUE(seq.exhausted());
}

TEST(SequenceTest, RangeForLoop) {
    Sequence seq = Sequence::of(std::make_shared<const Items>(Items::list({1, 2, 3})));
    std::int64_t total = 0;
    for (const Entry& entry : seq) {
        total += entry.second.get<std::int64_t>();
    }
    EXPECT_EQ(total, 6);
}

TEST(SequenceTest, DefaultIsEmpty) {
    Sequence seq;
    EXPECT_FALSE(seq.next().has_value());
}

// ============================================================================
// Sources
// ============================================================================

TEST(LazySourceTest, FromValue) {
    LazyCollection lazy = lazy_collect(Value::parse(R"({"a": 1, "b": 2})"));
    EXPECT_EQ(lazy.to_array(), Value::parse(R"({"a": 1, "b": 2})"));
    EXPECT_EQ(lazy.count(), 2u);
}

TEST(LazySourceTest, Empty) {
    EXPECT_TRUE(lazy_collect().is_empty());
    EXPECT_EQ(lazy_collect().to_array(), Value::array());
}

TEST(LazySourceTest, ProducerIsRestartable) {
    auto pulls = std::make_shared<int>(0);
    LazyCollection lazy = lazy_collect(counting_producer(3, pulls));
    EXPECT_EQ(lazy.to_array(), Value::parse("[1, 2, 3]"));
    EXPECT_EQ(lazy.to_array(), Value::parse("[1, 2, 3]"));
    EXPECT_EQ(*pulls, 6);
}

TEST(LazySourceTest, InterleavedIterationsAreIndependent) {
    auto pulls = std::make_shared<int>(0);
    LazyCollection evens = lazy_collect(counting_producer(6, pulls))
        .filter(is_even)
        .map([](const Value& v) { return v.get<int>() * 10; });

    Sequence a = evens.iterate();
    Sequence b = evens.iterate();
    EXPECT_EQ(a.next()->second, 20);
    EXPECT_EQ(a.next()->second, 40);
    EXPECT_EQ(b.next()->second, 20);
    EXPECT_EQ(a.next()->second, 60);
    EXPECT_EQ(b.next()->second, 40);
    EXPECT_FALSE(a.next().has_value());
    EXPECT_EQ(b.next()->second, 60);
    EXPECT_FALSE(b.next().has_value());
    EXPECT_EQ(*pulls, 12);
}

TEST(LazySourceTest, RejectsSingleShotSequence) {
    Sequence seq = Sequence::of(std::make_shared<const Items>(Items::list({1})));
    EXPECT_THROW(LazyCollection{std::move(seq)}, InvalidSourceError);
}

TEST(LazySourceTest, RoundTripThroughCollection) {
    Collection eager = collect(Value::parse(R"({"x": 1, "y": [2, 3]})"));
    EXPECT_TRUE(lazy_collect(eager).collect() == eager);
    EXPECT_EQ(collect(lazy_collect(eager)).to_array(), eager.to_array());
}

TEST(LazySourceTest, WrapReadsFromUpstream) {
    LazyCollection nested = LazyCollection::wrap(lazy_collect(Value::parse("[1, 2]")));
    EXPECT_EQ(nested.map([](const Value& v) { return v.get<int>() + 1; }).to_array(),
              Value::parse("[2, 3]"));
}

// ============================================================================
// Deferred evaluation
// ============================================================================

TEST(LazyDeferredTest, DerivedOperationsDoNoWorkUntilIterated) {
    auto pulls = std::make_shared<int>(0);
    LazyCollection mapped = lazy_collect(counting_producer(5, pulls))
        .map([](const Value& v) { return v.get<int>() * 10; })
        .filter([](const Value& v) { return v.get<int>() > 10; });
    EXPECT_EQ(*pulls, 0);

    EXPECT_EQ(mapped.first(), 20);
    EXPECT_EQ(*pulls, 2);
}

TEST(LazyDeferredTest, TakeStopsPulling) {
    auto pulls = std::make_shared<int>(0);
    LazyCollection lazy = lazy_collect(counting_producer(100, pulls));
    EXPECT_EQ(lazy.take(3).to_array(), Value::parse("[1, 2, 3]"));
    EXPECT_EQ(*pulls, 3);
}

TEST(LazyDeferredTest, EndlessRangeUnderTake) {
    LazyCollection evens = range_from(1).filter(is_even).take(3);
    EXPECT_EQ(evens.to_array(), Value::parse("[2, 4, 6]"));
}

TEST(LazyDeferredTest, EndlessRangeUnderFirstAndContains) {
    EXPECT_EQ(range_from(10, 5).first([](const Value& v) { return v.get<int>() > 42; }), 45);
    EXPECT_TRUE(range_from(0, 7).contains(49));
}

TEST(LazyDeferredTest, IsEmptyPullsAtMostOne) {
    auto pulls = std::make_shared<int>(0);
    EXPECT_FALSE(lazy_collect(counting_producer(10, pulls)).is_empty());
    EXPECT_EQ(*pulls, 1);
}

// ============================================================================
// Terminal operations
// ============================================================================

class LazyTerminalTest : public ::testing::Test {
protected:
    LazyCollection numbers = range(1, 5);
};

TEST_F(LazyTerminalTest, FirstAndLast) {
    EXPECT_EQ(numbers.first(), 1);
    EXPECT_EQ(numbers.last(), 5);
    EXPECT_EQ(numbers.first(is_even), 2);
    EXPECT_EQ(lazy_collect().first("none"), "none");
}

TEST_F(LazyTerminalTest, FirstOrFail) {
    EXPECT_EQ(numbers.first_or_fail(is_even), 2);
    EXPECT_THROW(numbers.first_or_fail([](const Value& v) { return v.get<int>() > 9; }),
                 ItemNotFoundError);
    EXPECT_THROW(lazy_collect().first_or_fail(), ItemNotFoundError);
}

TEST_F(LazyTerminalTest, Reduce) {
    Value product = numbers.reduce([](const Value& carry, const Value& v, const Key&) {
        return Value(carry.get<std::int64_t>() * v.get<std::int64_t>());
    }, 1);
    EXPECT_EQ(product, 120);
}

TEST_F(LazyTerminalTest, EachStopsOnFalse) {
    int visits = 0;
    numbers.each([&visits](const Value&) { return ++visits < 2; });
    EXPECT_EQ(visits, 2);
}

TEST_F(LazyTerminalTest, EveryAndContains) {
    EXPECT_TRUE(numbers.every([](const Value& v) { return v.get<int>() > 0; }));
    EXPECT_FALSE(numbers.every(is_even));
    EXPECT_TRUE(numbers.contains("3"));
    EXPECT_FALSE(numbers.contains(6));
}

TEST_F(LazyTerminalTest, Aggregates) {
    EXPECT_EQ(numbers.sum(), 15);
    EXPECT_EQ(numbers.avg(), 3);
    EXPECT_EQ(numbers.min(), 1);
    EXPECT_EQ(numbers.max(), 5);
    EXPECT_EQ(numbers.median(), 3);
    EXPECT_EQ(numbers.mode(), Value::parse("[1, 2, 3, 4, 5]"));
}

// ============================================================================
// Derived operations
// ============================================================================

TEST(LazyDerivedTest, KeysAndValues) {
    LazyCollection lazy = lazy_collect(Value::parse(R"({"a": 1, "b": 2})"));
    EXPECT_EQ(lazy.keys().to_array(), Value::parse(R"(["a", "b"])"));
    EXPECT_EQ(lazy.values().to_array(), Value::parse("[1, 2]"));
}

TEST(LazyDerivedTest, FilterPreservesKeys) {
    EXPECT_EQ(range(1, 4).filter(is_even).to_array(), Value::parse(R"({"1": 2, "3": 4})"));
    EXPECT_EQ(range(1, 4).reject(is_even).values().to_array(), Value::parse("[1, 3]"));
}

TEST(LazyDerivedTest, Where) {
    LazyCollection products = lazy_collect(Value::parse(R"([
        {"name": "Desk", "price": 200},
        {"name": "Chair", "price": 100},
        {"name": "Lamp", "price": null}
    ])"));
    EXPECT_EQ(products.where("price", 150, ">").count(), 1u);
    EXPECT_EQ(products.where_in("price", Value::parse("[100, 200]")).count(), 2u);
    EXPECT_EQ(products.where_null("price").first()["name"], "Lamp");
    EXPECT_EQ(products.where_like("name", "%a%").count(), 2u);
    EXPECT_THROW(products.where("price", 1, "=>"), InvalidOperatorError);
}

TEST(LazyDerivedTest, SliceSkipAndNegativeTake) {
    LazyCollection letters = lazy_collect(Value::parse(R"(["a", "b", "c", "d"])"));
    EXPECT_EQ(letters.slice(1, 2).to_array(), Value::parse(R"(["b", "c"])"));
    EXPECT_EQ(letters.skip(3).to_array(), Value::parse(R"(["d"])"));
    EXPECT_EQ(letters.take(-2).to_array(), Value::parse(R"(["c", "d"])"));
    EXPECT_EQ(letters.slice(2, std::nullopt, true).to_array(), Value::parse(R"({"2": "c", "3": "d"})"));
}

TEST(LazyDerivedTest, Nth) {
    EXPECT_EQ(range(1, 10).nth(3).to_array(), Value::parse("[1, 4, 7, 10]"));
    EXPECT_EQ(range(1, 10).nth(3, 1).to_array(), Value::parse("[2, 5, 8]"));
    EXPECT_THROW(range(1, 10).nth(0), InvalidArgumentError);
}

TEST(LazyDerivedTest, TakeWhileAndSkipWhile) {
    auto small = [](const Value& v) { return v.get<int>() < 3; };
    EXPECT_EQ(range_from(1).take_while(small).to_array(), Value::parse("[1, 2]"));
    EXPECT_EQ(range(1, 5).skip_while(small).values().to_array(), Value::parse("[3, 4, 5]"));
}

TEST(LazyDerivedTest, ChunkYieldsValues) {
    Value chunks = range(1, 5).chunk(2).to_array();
    EXPECT_EQ(chunks, Value::parse(R"([[1, 2], {"2": 3, "3": 4}, {"4": 5}])"));
    EXPECT_TRUE(range(1, 5).chunk(0).is_empty());
}

TEST(LazyDerivedTest, Unique) {
    LazyCollection lazy = lazy_collect(Value::parse(R"([1, "1", 2, 1])"));
    EXPECT_EQ(lazy.unique().values().to_array(), Value::parse("[1, 2]"));
    EXPECT_EQ(lazy.unique({}, true).values().to_array(), Value::parse(R"([1, "1", 2])"));
}

TEST(LazyDerivedTest, ConcatContinuesIntegerKeys) {
    LazyCollection a = lazy_collect(Value::parse(R"({"x": 1, "0": 2})"));
    LazyCollection b = lazy_collect(Value::parse("[3, 4]"));
    EXPECT_EQ(a.concat(b).to_array(), Value::parse(R"({"x": 1, "0": 2, "1": 3, "2": 4})"));
}

TEST(LazyDerivedTest, PushAppendsOnEveryIteration) {
    LazyCollection lazy = range(1, 2);
    lazy.push(3, 4);
    EXPECT_EQ(lazy.to_array(), Value::parse("[1, 2, 3, 4]"));
    EXPECT_EQ(lazy.count(), 4u);
}

// ============================================================================
// Deferred sorting
// ============================================================================

TEST(LazySortTest, SortIsDeferred) {
    auto pulls = std::make_shared<int>(0);
    LazyCollection sorted = lazy_collect(counting_producer(3, pulls)).sort_desc();
    EXPECT_EQ(*pulls, 0);
    EXPECT_EQ(sorted.to_array(), Value::parse("[3, 2, 1]"));
}

TEST(LazySortTest, SortByThenBy) {
    LazyCollection people = lazy_collect(Value::parse(R"([
        {"name": "b", "age": 2}, {"name": "a", "age": 2}, {"name": "c", "age": 1}
    ])"));
    LazyCollection sorted = people.sort_by("age").then_by("name");
    EXPECT_EQ(sorted.sorts(), 2u);
    EXPECT_EQ(sorted.values().to_array(), Value::parse(R"([
        {"name": "c", "age": 1}, {"name": "a", "age": 2}, {"name": "b", "age": 2}
    ])"));
}

TEST(LazySortTest, ThenByWithoutSortByThrowsImmediately) {
    EXPECT_THROW(range(1, 3).then_by("x"), UnchainedSortError);
    EXPECT_THROW(range(1, 3).sort().then_by_desc("x"), UnchainedSortError);
}

TEST(LazySortTest, CollectKeepsTheChain) {
    LazyCollection people = lazy_collect(Value::parse(R"([{"n": 2, "m": "y"}, {"n": 1, "m": "x"}])"));
    Collection eager = people.sort_by("n").collect();
    EXPECT_EQ(eager.sorts(), 1u);
    EXPECT_NO_THROW(eager.then_by("m"));
}

TEST(LazySortTest, PushKeepsTheChain) {
    LazyCollection sorted = lazy_collect(Value::parse("[2, 1]")).sort_by({});
    sorted.push(0);
    EXPECT_EQ(sorted.sorts(), 1u);
    EXPECT_EQ(sorted.values().to_array(), Value::parse("[1, 2, 0]"));
}
