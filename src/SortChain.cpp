/**
 * @file SortChain.cpp
 * @brief Implementation of the stable multi-criterion sorts
 */

#include "fluent/SortChain.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>

namespace fluent {

namespace {

    using Order = std::vector<std::size_t>;

    Order identity_order(std::size_t n) {
        Order order(n);
        std::iota(order.begin(), order.end(), std::size_t{0});
        return order;
    }

    Items pick(const Items& items, const Order& order) {
        Items result;
        for (std::size_t pos : order) {
            const auto& [key, value] = items.at(pos);
            result.put(key, value);
        }
        return result;
    }

    /**
     * @brief Stable-sort positions by precomputed sort keys
     *
     * Descending flips the comparison, not the result, so ties keep their
     * original order in both directions.
     */
    void sort_positions(Order& order, const std::vector<Value>& keys,
                        const SortOptions& options, bool descending) {
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            const int cmp = collate(keys[a], keys[b], options);
            return descending ? cmp > 0 : cmp < 0;
        });
    }

    std::vector<Value> extract_keys(const Items& items, const SortCriterion& criterion) {
        std::vector<Value> keys;
        keys.reserve(items.size());
        for (const auto& [key, value] : items) {
            keys.push_back(criterion.key_of(value, key));
        }
        return keys;
    }

    bool ties_under(const std::vector<std::vector<Value>>& chain_keys, const SortChain& chain,
                    std::size_t a, std::size_t b) {
        for (std::size_t c = 0; c < chain.size(); ++c) {
            if (collate(chain_keys[c][a], chain_keys[c][b], chain[c].options) != 0) {
                return false;
            }
        }
        return true;
    }

} // namespace

Value SortCriterion::key_of(const Value& item, const Key& key) const {
    auto extracted = extractor(item, key);
    return extracted ? std::move(*extracted) : Value();
}

Items sort_items(const Items& items, const SortCriterion& criterion) {
    spdlog::trace("sort_by: {} items, {}", items.size(), criterion.descending ? "desc" : "asc");

    const auto keys = extract_keys(items, criterion);
    Order order = identity_order(items.size());
    sort_positions(order, keys, criterion.options, criterion.descending);
    return pick(items, order);
}

Items refine_sort(const Items& items, const SortChain& chain, const SortCriterion& criterion) {
    std::vector<std::vector<Value>> chain_keys;
    chain_keys.reserve(chain.size());
    for (const auto& prior : chain) {
        chain_keys.push_back(extract_keys(items, prior));
    }

    // Each group is represented by the position of its first member
    std::vector<Order> groups;
    for (std::size_t pos = 0; pos < items.size(); ++pos) {
        auto group = std::find_if(groups.begin(), groups.end(), [&](const Order& g) {
            return ties_under(chain_keys, chain, g.front(), pos);
        });
        if (group == groups.end()) {
            groups.push_back(Order{pos});
        } else {
            group->push_back(pos);
        }
    }

    spdlog::trace("then_by: {} items in {} groups, chain depth {}",
                  items.size(), groups.size(), chain.size());

    const auto keys = extract_keys(items, criterion);
    Order order;
    order.reserve(items.size());
    for (auto& group : groups) {
        sort_positions(group, keys, criterion.options, criterion.descending);
        order.insert(order.end(), group.begin(), group.end());
    }
    return pick(items, order);
}

Items sort_values(const Items& items, const SortOptions& options, bool descending) {
    SortCriterion criterion;
    criterion.descending = descending;
    criterion.options = options;
    return sort_items(items, criterion);
}

Items sort_values(const Items& items, const Comparator& comparator) {
    Order order = identity_order(items.size());
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return comparator(items.at(a).second, items.at(b).second) < 0;
    });
    return pick(items, order);
}

Items sort_keys(const Items& items, const SortOptions& options, bool descending) {
    std::vector<Value> keys;
    keys.reserve(items.size());
    for (const auto& entry : items) {
        keys.push_back(entry.first.to_value());
    }

    Order order = identity_order(items.size());
    sort_positions(order, keys, options, descending);
    return pick(items, order);
}

} // namespace fluent
