/**
 * @file Aggregate.cpp
 * @brief Collection aggregates: sum, avg, min, max, median, mode, count, count_by
 */

#include "fluent/Collection.hpp"
#include "fluent/Compare.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace fluent {

namespace {

    /// Values the extractor reads, skipping items where a path does not resolve
    std::vector<Value> read_all(const Items& items, const Extractor& key) {
        std::vector<Value> values;
        values.reserve(items.size());
        for (const auto& [k, item] : items) {
            if (auto extracted = key(item, k)) {
                values.push_back(std::move(*extracted));
            }
        }
        return values;
    }

    /**
     * @brief Number form of a numeric value; integers stay integers
     *
     * Numeric strings holding a plain integer ("12") become integers, other
     * numeric strings become floats.
     */
    std::optional<Value> as_number(const Value& value) {
        if (value.is_number()) {
            return value;
        }
        if (value.is_string() && is_numeric(value)) {
            const auto& text = value.get_ref<const std::string&>();
            if (is_integer_key(text)) {
                return Value(std::stoll(text));
            }
            return Value(to_number(value));
        }
        return std::nullopt;
    }

    /// Counts per key, in first-seen order
    class Tally {
    public:
        void add(const Key& key) {
            auto it = index_.find(key);
            if (it == index_.end()) {
                index_.emplace(key, counts_.size());
                counts_.emplace_back(key, 1);
            } else {
                ++counts_[it->second].second;
            }
        }

        const std::vector<std::pair<Key, std::int64_t>>& counts() const { return counts_; }

    private:
        std::vector<std::pair<Key, std::int64_t>> counts_;
        std::unordered_map<Key, std::size_t, KeyHash> index_;
    };

    Tally tally(const std::vector<Value>& values, const char* what) {
        Tally result;
        for (const auto& value : values) {
            auto key = Key::from_value(value);
            if (!key) {
                spdlog::warn("{}: can only count string and integer values, skipping {}",
                             what, type_name(value));
                continue;
            }
            result.add(*key);
        }
        return result;
    }

} // namespace

Value Collection::sum(const Extractor& key) const {
    Value total = 0;
    for (const auto& value : read_all(items_, key)) {
        if (auto number = as_number(value)) {
            total = add(total, *number);
        }
    }
    return total;
}

Value Collection::avg(const Extractor& key) const {
    const auto values = read_all(items_, key);
    if (values.empty()) {
        return nullptr;
    }
    return divide(sum(key), Value(static_cast<std::int64_t>(values.size())));
}

Value Collection::min(const Extractor& key) const {
    Value result;
    for (const auto& value : read_all(items_, key)) {
        if (value.is_null()) {
            continue;
        }
        if (result.is_null() || loose_compare(value, result) < 0) {
            result = value;
        }
    }
    return result;
}

Value Collection::max(const Extractor& key) const {
    Value result;
    for (const auto& value : read_all(items_, key)) {
        if (value.is_null()) {
            continue;
        }
        if (result.is_null() || loose_compare(value, result) > 0) {
            result = value;
        }
    }
    return result;
}

Value Collection::median(const Extractor& key) const {
    std::vector<Value> numbers;
    for (const auto& value : read_all(items_, key)) {
        if (auto number = as_number(value)) {
            numbers.push_back(std::move(*number));
        }
    }
    if (numbers.empty()) {
        return nullptr;
    }

    std::stable_sort(numbers.begin(), numbers.end(), [](const Value& a, const Value& b) {
        return loose_compare(a, b) < 0;
    });

    const std::size_t middle = numbers.size() / 2;
    if (numbers.size() % 2 == 1) {
        return numbers[middle];
    }
    return divide(add(numbers[middle - 1], numbers[middle]), Value(2));
}

Value Collection::mode(const Extractor& key) const {
    const Tally counted = tally(read_all(items_, key), "mode");

    std::int64_t highest = 0;
    for (const auto& entry : counted.counts()) {
        highest = std::max(highest, entry.second);
    }

    Value modes = Value::array();
    for (const auto& [value, occurrences] : counted.counts()) {
        if (occurrences == highest) {
            modes.push_back(value.to_value());
        }
    }
    return modes;
}

std::size_t Collection::count(const Extractor& key) const {
    if (key.is_identity()) {
        return items_.size();
    }

    std::size_t n = 0;
    for (const auto& [k, item] : items_) {
        auto extracted = key(item, k);
        if (key.is_function() ? (extracted && truthy(*extracted)) : extracted.has_value()) {
            ++n;
        }
    }
    return n;
}

Collection Collection::count_by(const Extractor& key) const {
    const Tally counted = tally(read_all(items_, key), "count_by");

    Items result;
    for (const auto& [value, occurrences] : counted.counts()) {
        result.put(value, occurrences);
    }
    return Collection(std::move(result));
}

} // namespace fluent
