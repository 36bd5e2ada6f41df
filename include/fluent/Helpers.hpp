/**
 * @file Helpers.hpp
 * @brief Construction entry points
 *
 * Usage:
 * ```cpp
 * #include <fluent/Helpers.hpp>
 *
 * auto users = fluent::collect(fluent::load_data_file("users.json"));
 * auto names = users.where("active", true).pluck("name");
 *
 * auto squares = fluent::lazy_collect(fluent::range_producer(1, 1000))
 *     .map([](const fluent::Value& v) { return v.get<int>() * v.get<int>(); });
 * ```
 */

#ifndef FLUENT_HELPERS_HPP
#define FLUENT_HELPERS_HPP

#include "fluent/Collection.hpp"
#include "fluent/LazyCollection.hpp"
#include "fluent/Range.hpp"
#include "fluent/Value.hpp"

#include <vector>

namespace fluent {

/// Empty collection
inline Collection collect() {
    return Collection();
}

inline Collection collect(const Value& value) {
    return Collection(value);
}

inline Collection collect(Items items) {
    return Collection(std::move(items));
}

/// List collection (keys 0..n-1)
inline Collection collect(std::vector<Value> values) {
    return Collection(Items::list(std::move(values)));
}

inline Collection collect(const LazyCollection& lazy) {
    return lazy.collect();
}

inline LazyCollection lazy_collect() {
    return LazyCollection();
}

inline LazyCollection lazy_collect(const Value& value) {
    return LazyCollection(value);
}

inline LazyCollection lazy_collect(Items items) {
    return LazyCollection(std::move(items));
}

inline LazyCollection lazy_collect(const Collection& collection) {
    return LazyCollection(collection);
}

inline LazyCollection lazy_collect(Producer producer) {
    return LazyCollection(std::move(producer));
}

} // namespace fluent

#endif // FLUENT_HELPERS_HPP
