/**
 * @file Items.cpp
 * @brief Implementation of the ordered mapping and bulk primitives
 */

#include "fluent/Items.hpp"
#include "fluent/Compare.hpp"
#include "fluent/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>
#include <unordered_set>

namespace fluent {

Items::Items(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        put(entry.first, entry.second);
    }
}

Items Items::from_value(const Value& val) {
    Items items;
    if (val.is_null()) {
        return items;
    }
    if (val.is_array()) {
        for (const auto& elem : val) {
            items.push(elem);
        }
    } else if (val.is_object()) {
        for (auto it = val.begin(); it != val.end(); ++it) {
            items.put(Key(it.key()), it.value());
        }
    } else {
        items.push(val);
    }
    return items;
}

Items Items::list(std::vector<Value> values) {
    Items items;
    items.entries_.reserve(values.size());
    for (auto& v : values) {
        items.push(std::move(v));
    }
    return items;
}

bool Items::is_list() const {
    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& key = entries_[i].first;
        if (!key.is_int() || key.as_int() != static_cast<std::int64_t>(i)) {
            return false;
        }
    }
    return true;
}

Value Items::to_value() const {
    if (is_list()) {
        Value arr = Value::array();
        for (const auto& [key, value] : entries_) {
            arr.push_back(value);
        }
        return arr;
    }

    Value obj = Value::object();
    for (const auto& [key, value] : entries_) {
        obj[key.str()] = value;
    }
    return obj;
}

const Value* Items::find(const Key& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

Value* Items::find(const Key& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

std::optional<std::size_t> Items::position(const Key& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Items::put(const Key& key, Value value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }

    index_.emplace(key, entries_.size());
    entries_.emplace_back(key, std::move(value));
    if (key.is_int() && key.as_int() >= next_index_) {
        next_index_ = key.as_int() + 1;
    }
}

void Items::push(Value value) {
    put(Key(next_index_), std::move(value));
}

void Items::prepend(Value value) {
    entries_.insert(entries_.begin(), Entry(Key(-1), std::move(value)));
    *this = renumbered(*this);
}

void Items::prepend(const Key& key, Value value) {
    auto pos = position(key);
    if (pos) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*pos));
    }
    entries_.insert(entries_.begin(), Entry(key, std::move(value)));
    reindex();
}

bool Items::erase(const Key& key) {
    auto pos = position(key);
    if (!pos) {
        return false;
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*pos));
    reindex();
    return true;
}

std::optional<Entry> Items::pop_back() {
    if (entries_.empty()) {
        return std::nullopt;
    }
    Entry last = std::move(entries_.back());
    entries_.pop_back();
    index_.erase(last.first);

    next_index_ = 0;
    for (const auto& [key, value] : entries_) {
        if (key.is_int() && key.as_int() >= next_index_) {
            next_index_ = key.as_int() + 1;
        }
    }
    return last;
}

std::optional<Entry> Items::pop_front() {
    if (entries_.empty()) {
        return std::nullopt;
    }
    Entry first = std::move(entries_.front());
    entries_.erase(entries_.begin());
    *this = renumbered(*this);
    return first;
}

void Items::clear() {
    entries_.clear();
    index_.clear();
    next_index_ = 0;
}

std::vector<Key> Items::keys() const {
    std::vector<Key> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<Value> Items::values() const {
    std::vector<Value> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.second);
    }
    return out;
}

void Items::reindex() {
    index_.clear();
    for (size_t i = 0; i < entries_.size(); ++i) {
        index_[entries_[i].first] = i;
    }
}

// ============================================================================
// Bulk primitives
// ============================================================================

Items renumbered(const Items& items) {
    Items out;
    for (const auto& [key, value] : items) {
        if (key.is_int()) {
            out.push(value);
        } else {
            out.put(key, value);
        }
    }
    return out;
}

Items merge(const Items& base, const Items& other) {
    Items out = renumbered(base);
    for (const auto& [key, value] : other) {
        if (key.is_int()) {
            out.push(value);
        } else {
            out.put(key, value);
        }
    }
    return out;
}

namespace {
    Items as_items(const Value& val) {
        if (is_container(val)) {
            return Items::from_value(val);
        }
        return Items::list({val});
    }
}

Items merge_recursive(const Items& base, const Items& other) {
    Items out = renumbered(base);
    for (const auto& [key, value] : other) {
        if (key.is_int()) {
            out.push(value);
            continue;
        }

        const Value* existing = out.find(key);
        if (existing == nullptr) {
            out.put(key, value);
            continue;
        }

        // Key present on both sides: collect into a nested list
        Items combined = merge_recursive(as_items(*existing), as_items(value));
        out.put(key, combined.to_value());
    }
    return out;
}

Items replace(const Items& base, const Items& other) {
    Items out = base;
    for (const auto& [key, value] : other) {
        out.put(key, value);
    }
    return out;
}

Items replace_recursive(const Items& base, const Items& other) {
    Items out = base;
    for (const auto& [key, value] : other) {
        const Value* existing = out.find(key);
        if (existing != nullptr && is_container(*existing) && is_container(value)) {
            Items nested = replace_recursive(Items::from_value(*existing), Items::from_value(value));
            out.put(key, nested.to_value());
        } else {
            out.put(key, value);
        }
    }
    return out;
}

Items flatten(const Items& items, int depth) {
    Items out;
    for (const auto& [key, value] : items) {
        if (!is_container(value)) {
            out.push(value);
            continue;
        }

        Items nested = Items::from_value(value);
        if (depth <= 1) {
            for (const auto& entry : nested) {
                out.push(entry.second);
            }
        } else {
            for (const auto& entry : flatten(nested, depth - 1)) {
                out.push(entry.second);
            }
        }
    }
    return out;
}

Items collapse(const Items& items) {
    Items out;
    for (const auto& [key, value] : items) {
        if (!is_container(value)) {
            continue;
        }
        out = merge(out, Items::from_value(value));
    }
    return out;
}

Items slice(const Items& items, std::int64_t offset,
            std::optional<std::int64_t> length, bool preserve_keys) {
    const auto size = static_cast<std::int64_t>(items.size());

    if (offset < 0) {
        offset = std::max<std::int64_t>(0, size + offset);
    }
    if (offset > size) {
        offset = size;
    }

    std::int64_t stop = size;
    if (length) {
        stop = *length < 0 ? size + *length : offset + *length;
    }
    stop = std::min(stop, size);

    Items out;
    for (std::int64_t i = offset; i < stop; ++i) {
        const auto& [key, value] = items.at(static_cast<size_t>(i));
        if (key.is_int() && !preserve_keys) {
            out.push(value);
        } else {
            out.put(key, value);
        }
    }
    return out;
}

Items reverse(const Items& items, bool preserve_keys) {
    Items out;
    for (auto it = items.entries().rbegin(); it != items.entries().rend(); ++it) {
        if (it->first.is_int() && !preserve_keys) {
            out.push(it->second);
        } else {
            out.put(it->first, it->second);
        }
    }
    return out;
}

Items diff(const Items& base, const Items& other) {
    std::unordered_set<std::string> excluded;
    for (const auto& entry : other) {
        excluded.insert(to_string(entry.second));
    }

    Items out;
    for (const auto& [key, value] : base) {
        if (excluded.count(to_string(value)) == 0) {
            out.put(key, value);
        }
    }
    return out;
}

Items diff_assoc(const Items& base, const Items& other) {
    Items out;
    for (const auto& [key, value] : base) {
        const Value* theirs = other.find(key);
        if (theirs == nullptr || to_string(*theirs) != to_string(value)) {
            out.put(key, value);
        }
    }
    return out;
}

Items diff_keys(const Items& base, const Items& other) {
    Items out;
    for (const auto& [key, value] : base) {
        if (!other.contains(key)) {
            out.put(key, value);
        }
    }
    return out;
}

Items only(const Items& items, const std::vector<Key>& keys) {
    Items out;
    for (const auto& [key, value] : items) {
        if (std::find(keys.begin(), keys.end(), key) != keys.end()) {
            out.put(key, value);
        }
    }
    return out;
}

Items except(const Items& items, const std::vector<Key>& keys) {
    Items out;
    for (const auto& [key, value] : items) {
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            out.put(key, value);
        }
    }
    return out;
}

Items pad(const Items& items, std::int64_t size, const Value& value) {
    const auto target = static_cast<size_t>(size < 0 ? -size : size);
    if (target <= items.size()) {
        return items;
    }

    const size_t missing = target - items.size();
    Items out;
    if (size < 0) {
        for (size_t i = 0; i < missing; ++i) out.push(value);
    }
    for (const auto& [key, entry] : items) {
        if (key.is_int()) {
            out.push(entry);
        } else {
            out.put(key, entry);
        }
    }
    if (size > 0) {
        for (size_t i = 0; i < missing; ++i) out.push(value);
    }
    return out;
}

Items combine(const Items& keys, const Items& values) {
    if (keys.size() != values.size()) {
        throw InvalidArgumentError(
            "combine() expects both sides to have the same number of elements (" +
            std::to_string(keys.size()) + " vs " + std::to_string(values.size()) + ")");
    }

    Items out;
    for (size_t i = 0; i < keys.size(); ++i) {
        const Value& raw = keys.at(i).second;
        auto key = Key::from_value(raw);
        out.put(key ? *key : Key(to_string(raw)), values.at(i).second);
    }
    return out;
}

Items flip(const Items& items) {
    Items out;
    for (const auto& [key, value] : items) {
        auto flipped = Key::from_value(value);
        if (!flipped) {
            spdlog::warn("flip: can only flip string and integer values, skipping {}", type_name(value));
            continue;
        }
        out.put(*flipped, key.to_value());
    }
    return out;
}

Items shuffle(const Items& items, std::optional<std::uint32_t> seed) {
    std::vector<Value> values = items.values();
    std::mt19937 engine(seed ? *seed : std::random_device{}());
    std::shuffle(values.begin(), values.end(), engine);
    return Items::list(std::move(values));
}

Items unique(const Items& items, bool strict) {
    Items out;
    std::vector<const Value*> seen;
    for (const auto& [key, value] : items) {
        bool duplicate = std::any_of(seen.begin(), seen.end(), [&](const Value* other) {
            return strict ? strict_equals(*other, value) : loose_equals(*other, value);
        });
        if (!duplicate) {
            seen.push_back(&value);
            out.put(key, value);
        }
    }
    return out;
}

} // namespace fluent
