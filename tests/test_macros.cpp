/**
 * @file test_macros.cpp
 * @brief Unit tests for runtime-registered macros (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "fluent/Errors.hpp"
#include "fluent/Helpers.hpp"

using namespace fluent;

class MacroTest : public ::testing::Test {
protected:
    void TearDown() override {
        Collection::remove_macro("double_all");
        Collection::remove_macro("add");
        LazyCollection::remove_macro("size_plus");
    }
};

TEST_F(MacroTest, RegisterAndCall) {
    Collection::macro("double_all", [](Collection& self, const std::vector<Value>&) {
        return self.map([](const Value& v) { return v.get<int>() * 2; }).to_array();
    });
    EXPECT_TRUE(Collection::has_macro("double_all"));
    EXPECT_EQ(collect(Value::parse("[1, 2]")).call("double_all"), Value::parse("[2, 4]"));
}

TEST_F(MacroTest, ReceivesArguments) {
    Collection::macro("add", [](Collection& self, const std::vector<Value>& args) {
        self.push(args.at(0));
        return Value(self.count());
    });
    Collection c = collect(Value::parse("[1]"));
    EXPECT_EQ(c.call("add", {Value(5)}), 2);
    EXPECT_EQ(c.last(), 5);
}

TEST_F(MacroTest, RegisteringAgainReplaces) {
    Collection::macro("add", [](Collection&, const std::vector<Value>&) { return Value(1); });
    Collection::macro("add", [](Collection&, const std::vector<Value>&) { return Value(2); });
    Collection c;
    EXPECT_EQ(c.call("add"), 2);
}

TEST_F(MacroTest, UnknownMacroThrows) {
    Collection c;
    try {
        c.call("nope");
        FAIL() << "Expected BadMethodCallError";
    } catch (const BadMethodCallError& e) {
        EXPECT_NE(std::string(e.what()).find("nope"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("Collection"), std::string::npos);
    }
}

TEST_F(MacroTest, RemoveMacro) {
    Collection::macro("add", [](Collection&, const std::vector<Value>&) { return Value(); });
    EXPECT_TRUE(Collection::remove_macro("add"));
    EXPECT_FALSE(Collection::remove_macro("add"));
    Collection c;
    EXPECT_THROW(c.call("add"), BadMethodCallError);
}

TEST_F(MacroTest, TablesArePerType) {
    LazyCollection::macro("size_plus", [](LazyCollection& self, const std::vector<Value>& args) {
        return Value(static_cast<std::int64_t>(self.count()) + args.at(0).get<std::int64_t>());
    });
    EXPECT_TRUE(LazyCollection::has_macro("size_plus"));
    EXPECT_FALSE(Collection::has_macro("size_plus"));

    LazyCollection lazy = lazy_collect(Value::parse("[1, 2, 3]"));
    EXPECT_EQ(lazy.call("size_plus", {Value(10)}), 13);
}
