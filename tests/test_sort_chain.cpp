/**
 * @file test_sort_chain.cpp
 * @brief Unit tests for sorting and comparator chains (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "fluent/Errors.hpp"
#include "fluent/Helpers.hpp"

using namespace fluent;

class SortChainTest : public ::testing::Test {
protected:
    Collection people = collect(Value::parse(R"([
        {"name": "Carol", "age": 30, "city": "Oslo"},
        {"name": "Alice", "age": 25, "city": "Rome"},
        {"name": "Bob",   "age": 30, "city": "Bern"},
        {"name": "Dave",  "age": 25, "city": "Bern"},
        {"name": "Erin",  "age": 30, "city": "Bern"}
    ])"));

    static Value names(const Collection& c) { return c.pluck("name").to_array(); }
};

// ============================================================================
// sort / sort_desc
// ============================================================================

TEST(SortTest, SortsValuesAndRenumbers) {
    Collection sorted = collect(Value::parse("[3, 1, 2]")).sort();
    EXPECT_EQ(sorted.to_array(), Value::parse("[1, 2, 3]"));
    EXPECT_EQ(sorted.sorts(), 0u);
}

TEST(SortTest, Descending) {
    EXPECT_EQ(collect(Value::parse("[3, 1, 2]")).sort_desc().to_array(), Value::parse("[3, 2, 1]"));
}

TEST(SortTest, NaturalMode) {
    Collection files = collect(Value::parse(R"(["img12", "img10", "img2"])"));
    EXPECT_EQ(files.sort(SortOptions(SortMode::Natural)).to_array(),
              Value::parse(R"(["img2", "img10", "img12"])"));
    EXPECT_EQ(files.sort(SortOptions(SortMode::String)).to_array(),
              Value::parse(R"(["img10", "img12", "img2"])"));
}

TEST(SortTest, UserComparator) {
    Collection words = collect(Value::parse(R"(["ccc", "a", "bb"])"));
    Comparator by_length = [](const Value& lhs, const Value& rhs) {
        return static_cast<int>(lhs.get<std::string>().size()) -
               static_cast<int>(rhs.get<std::string>().size());
    };
    EXPECT_EQ(words.sort(by_length).to_array(), Value::parse(R"(["a", "bb", "ccc"])"));
}

TEST(SortTest, SortKeys) {
    Collection c = collect(Value::parse(R"({"b": 1, "a": 2, "c": 3})"));
    EXPECT_EQ(c.sort_keys().keys().to_array(), Value::parse(R"(["a", "b", "c"])"));
    EXPECT_EQ(c.sort_keys_desc().keys().to_array(), Value::parse(R"(["c", "b", "a"])"));
}

// ============================================================================
// sort_by
// ============================================================================

TEST_F(SortChainTest, SortByIsStable) {
    EXPECT_EQ(names(people.sort_by("age")),
              Value::parse(R"(["Alice", "Dave", "Carol", "Bob", "Erin"])"));
}

TEST_F(SortChainTest, SortByDescendingKeepsTieOrder) {
    EXPECT_EQ(names(people.sort_by_desc("age")),
              Value::parse(R"(["Carol", "Bob", "Erin", "Alice", "Dave"])"));
}

TEST_F(SortChainTest, SortByPreservesKeys) {
    Collection sorted = people.sort_by("age");
    EXPECT_EQ(sorted.keys().to_array(), Value::parse("[1, 3, 0, 2, 4]"));
    EXPECT_EQ(sorted.sorts(), 1u);
}

TEST_F(SortChainTest, SortByCallable) {
    Collection sorted = people.sort_by([](const Value& p) { return p["name"].get<std::string>().size(); });
    EXPECT_EQ(names(sorted).front(), "Bob");
}

// ============================================================================
// then_by
// ============================================================================

TEST_F(SortChainTest, ThenByOrdersTies) {
    Collection sorted = people.sort_by("age").then_by("name");
    EXPECT_EQ(names(sorted), Value::parse(R"(["Alice", "Dave", "Bob", "Carol", "Erin"])"));
    EXPECT_EQ(sorted.sorts(), 2u);
}

TEST_F(SortChainTest, EarlierCriteriaDominate) {
    Collection sorted = people.sort_by("age").then_by("city").then_by_desc("name");
    EXPECT_EQ(names(sorted), Value::parse(R"(["Dave", "Alice", "Erin", "Bob", "Carol"])"));
}

TEST_F(SortChainTest, ThenByDescending) {
    Collection sorted = people.sort_by_desc("age").then_by_desc("name");
    EXPECT_EQ(names(sorted), Value::parse(R"(["Erin", "Carol", "Bob", "Dave", "Alice"])"));
}

TEST_F(SortChainTest, ThenByWithoutSortByThrows) {
    EXPECT_THROW(people.then_by("name"), UnchainedSortError);
    EXPECT_THROW(people.sort().then_by("name"), UnchainedSortError);
}

TEST_F(SortChainTest, ChainSurvivesThenBy) {
    Collection sorted = people.sort_by("age").then_by("city");
    ASSERT_EQ(sorted.sort_chain().size(), 2u);
    EXPECT_EQ(sorted.sort_chain()[1].extractor.path(), "city");
}

TEST(SortChainFunctionsTest, RefineSortGroupsByFirstAppearance) {
    Items items = Items::from_value(Value::parse(R"([
        {"g": "b", "v": 2}, {"g": "a", "v": 9}, {"g": "b", "v": 1}
    ])"));
    SortChain chain{SortCriterion{Extractor("g")}};
    Items refined = refine_sort(items, chain, SortCriterion{Extractor("v")});
    EXPECT_EQ(refined.to_value(), Value::parse(R"({
        "2": {"g": "b", "v": 1}, "0": {"g": "b", "v": 2}, "1": {"g": "a", "v": 9}
    })"));
}

TEST(SortChainFunctionsTest, UnresolvedPathSortsAsNull) {
    Collection c = collect(Value::parse(R"([{"n": 2}, {}, {"n": 1}])"));
    EXPECT_EQ(c.sort_by("n").values().to_array(), Value::parse(R"([{}, {"n": 1}, {"n": 2}])"));
}
