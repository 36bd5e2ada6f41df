/**
 * @file Collection.cpp
 * @brief Implementation of the eager collection (aggregates live in Aggregate.cpp)
 */

#include "fluent/Collection.hpp"
#include "fluent/DotPath.hpp"
#include "fluent/Errors.hpp"
#include "fluent/Predicate.hpp"
#include "fluent/Range.hpp"
#include "fluent/Util.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <random>

namespace fluent {

namespace {

    std::mt19937& random_engine() {
        static std::mt19937 engine{std::random_device{}()};
        return engine;
    }

    // A key holding null counts as absent, like an unset slot
    const Value* present(const Items& items, const Key& key) {
        const Value* value = items.find(key);
        return (value != nullptr && !value->is_null()) ? value : nullptr;
    }

} // namespace

// ============================================================================
// Construction
// ============================================================================

Collection Collection::range(const Value& start, const Value& end, const Value& step) {
    return Collection(fluent::range(start, end, step).all());
}

Collection Collection::build_sorted(Items items, SortChain chain) {
    Collection sorted(std::move(items));
    sorted.chain_ = std::move(chain);
    return sorted;
}

// ============================================================================
// Structural access
// ============================================================================

Value Collection::get(const Key& key, const Value& default_value) const {
    const Value* value = present(items_, key);
    return value ? *value : default_value;
}

Value Collection::get_or(const Key& key, const std::function<Value()>& fallback) const {
    const Value* value = present(items_, key);
    return value ? *value : fallback();
}

Collection& Collection::set(const Key& key, Value value) {
    items_.put(key, std::move(value));
    return *this;
}

bool Collection::has(const Key& key) const {
    return present(items_, key) != nullptr;
}

bool Collection::has(std::initializer_list<Key> keys) const {
    return std::all_of(keys.begin(), keys.end(), [this](const Key& key) { return has(key); });
}

bool Collection::has_any(std::initializer_list<Key> keys) const {
    return std::any_of(keys.begin(), keys.end(), [this](const Key& key) { return has(key); });
}

Collection& Collection::prepend(Value value) {
    items_.prepend(std::move(value));
    return *this;
}

Collection& Collection::prepend(Value value, const Key& key) {
    items_.prepend(key, std::move(value));
    return *this;
}

Value Collection::pop() {
    auto entry = items_.pop_back();
    return entry ? std::move(entry->second) : Value();
}

Collection Collection::pop(std::size_t count) {
    std::vector<Value> popped;
    while (popped.size() < count) {
        auto entry = items_.pop_back();
        if (!entry) {
            break;
        }
        popped.push_back(std::move(entry->second));
    }
    return Collection(Items::list(std::move(popped)));
}

Value Collection::shift() {
    auto entry = items_.pop_front();
    return entry ? std::move(entry->second) : Value();
}

Collection Collection::shift(std::size_t count) {
    std::vector<Value> shifted;
    while (shifted.size() < count) {
        auto entry = items_.pop_front();
        if (!entry) {
            break;
        }
        shifted.push_back(std::move(entry->second));
    }
    return Collection(Items::list(std::move(shifted)));
}

Collection& Collection::forget(const Key& key) {
    items_.erase(key);
    return *this;
}

Collection& Collection::forget(std::initializer_list<Key> keys) {
    for (const auto& key : keys) {
        items_.erase(key);
    }
    return *this;
}

Value Collection::pull(const Key& key, const Value& default_value) {
    Value value = get(key, default_value);
    items_.erase(key);
    return value;
}

Collection Collection::only(std::initializer_list<Key> keys) const {
    return Collection(fluent::only(items_, std::vector<Key>(keys)));
}

Collection Collection::only(const std::vector<Key>& keys) const {
    return Collection(fluent::only(items_, keys));
}

Collection Collection::except(std::initializer_list<Key> keys) const {
    return Collection(fluent::except(items_, std::vector<Key>(keys)));
}

Collection Collection::except(const std::vector<Key>& keys) const {
    return Collection(fluent::except(items_, keys));
}

Collection Collection::keys() const {
    std::vector<Value> keys;
    keys.reserve(items_.size());
    for (const auto& entry : items_) {
        keys.push_back(entry.first.to_value());
    }
    return Collection(Items::list(std::move(keys)));
}

Collection Collection::values() const {
    return Collection(Items::list(items_.values()));
}

Collection Collection::slice(std::int64_t offset, std::optional<std::int64_t> length,
                             bool preserve_keys) const {
    return Collection(fluent::slice(items_, offset, length, preserve_keys));
}

Collection Collection::skip(std::int64_t count) const {
    return slice(count);
}

Collection Collection::take(std::int64_t limit) const {
    if (limit < 0) {
        return slice(limit);
    }
    return slice(0, limit);
}

Collection Collection::nth(std::int64_t step, std::int64_t offset) const {
    if (step <= 0) {
        throw InvalidArgumentError("nth step must be positive, got " + std::to_string(step));
    }

    std::vector<Value> picked;
    std::int64_t position = 0;
    for (const auto& entry : fluent::slice(items_, offset)) {
        if (position++ % step == 0) {
            picked.push_back(entry.second);
        }
    }
    return Collection(Items::list(std::move(picked)));
}

Collection Collection::reverse(bool preserve_keys) const {
    return Collection(fluent::reverse(items_, preserve_keys));
}

Collection Collection::flip() const {
    return Collection(fluent::flip(items_));
}

Collection Collection::pad(std::int64_t size, const Value& value) const {
    return Collection(fluent::pad(items_, size, value));
}

Collection Collection::combine(const Collection& values) const {
    return Collection(fluent::combine(items_, values.items_));
}

Collection Collection::concat(const Collection& other) const {
    Items result = items_;
    for (const auto& entry : other.items_) {
        result.push(entry.second);
    }
    return Collection(std::move(result));
}

Collection Collection::diff(const Collection& other) const {
    return Collection(fluent::diff(items_, other.items_));
}

Collection Collection::diff_assoc(const Collection& other) const {
    return Collection(fluent::diff_assoc(items_, other.items_));
}

Collection Collection::diff_keys(const Collection& other) const {
    return Collection(fluent::diff_keys(items_, other.items_));
}

Collection Collection::intersect(const Collection& other) const {
    std::vector<std::string> wanted;
    wanted.reserve(other.count());
    for (const auto& entry : other.items_) {
        wanted.push_back(to_string(entry.second));
    }

    return filter([&wanted](const Value& value) {
        return std::find(wanted.begin(), wanted.end(), to_string(value)) != wanted.end();
    });
}

Collection Collection::shuffle(std::optional<std::uint32_t> seed) const {
    return Collection(fluent::shuffle(items_, seed));
}

Value Collection::random() const {
    if (items_.empty()) {
        throw InvalidArgumentError("Cannot pick a random item from an empty collection");
    }
    std::uniform_int_distribution<std::size_t> pick(0, items_.size() - 1);
    return items_.at(pick(random_engine())).second;
}

Collection Collection::random(std::size_t count, bool preserve_keys) const {
    if (count > items_.size()) {
        throw InvalidArgumentError("Requested " + std::to_string(count) + " items, only " +
                                   std::to_string(items_.size()) + " available");
    }

    std::vector<std::size_t> positions(items_.size());
    std::iota(positions.begin(), positions.end(), std::size_t{0});
    std::vector<std::size_t> chosen;
    std::sample(positions.begin(), positions.end(), std::back_inserter(chosen), count,
                random_engine());

    Items result;
    for (std::size_t pos : chosen) {
        const auto& [key, value] = items_.at(pos);
        if (preserve_keys) {
            result.put(key, value);
        } else {
            result.push(value);
        }
    }
    return Collection(std::move(result));
}

std::optional<Key> Collection::search(const Value& value, bool strict) const {
    for (const auto& [key, item] : items_) {
        if (strict ? strict_equals(item, value) : loose_equals(item, value)) {
            return key;
        }
    }
    return std::nullopt;
}

std::optional<Key> Collection::search(const Predicate& predicate) const {
    for (const auto& [key, item] : items_) {
        if (predicate(item, key)) {
            return key;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Functional
// ============================================================================

Collection Collection::map(const Mapper& mapper) const {
    Items result;
    for (const auto& [key, value] : items_) {
        result.put(key, mapper(value, key));
    }
    return Collection(std::move(result));
}

Collection& Collection::transform(const Mapper& mapper) {
    for (std::size_t pos = 0; pos < items_.size(); ++pos) {
        const Key key = items_.at(pos).first;
        Value mapped = mapper(items_.at(pos).second, key);
        items_.value_at(pos) = std::move(mapped);
    }
    return *this;
}

Collection Collection::filter() const {
    return filter([](const Value& value) { return truthy(value); });
}

Collection Collection::filter(const Predicate& predicate) const {
    Items result;
    for (const auto& [key, value] : items_) {
        if (predicate(value, key)) {
            result.put(key, value);
        }
    }
    return Collection(std::move(result));
}

Collection Collection::reject(const Predicate& predicate) const {
    return filter([&predicate](const Value& value, const Key& key) { return !predicate(value, key); });
}

Value Collection::reduce(const Reducer& reducer, Value initial) const {
    Value carry = std::move(initial);
    for (const auto& [key, value] : items_) {
        carry = reducer(carry, value, key);
    }
    return carry;
}

const Collection& Collection::each(const Predicate& callback) const {
    for (const auto& [key, value] : items_) {
        if (!callback(value, key)) {
            break;
        }
    }
    return *this;
}

bool Collection::every(const Predicate& predicate) const {
    for (const auto& [key, value] : items_) {
        if (!predicate(value, key)) {
            return false;
        }
    }
    return true;
}

bool Collection::every(const std::string& path, const Value& value, const std::string& op) const {
    const Operator parsed = parse_operator(op);
    const auto segments = split_dot_path(path);

    for (const auto& entry : items_) {
        PathLookup lookup = resolve_path(entry.second, segments);
        if (lookup.found && !compare(*lookup.value, parsed, value)) {
            return false;
        }
    }
    return true;
}

bool Collection::contains(const Value& value) const {
    return search(value).has_value();
}

bool Collection::contains(const Predicate& predicate) const {
    return search(predicate).has_value();
}

bool Collection::contains(const std::string& path, const Value& value, bool strict) const {
    const auto segments = split_dot_path(path);
    for (const auto& entry : items_) {
        PathLookup lookup = resolve_path(entry.second, segments);
        if (lookup.found &&
            (strict ? strict_equals(*lookup.value, value) : loose_equals(*lookup.value, value))) {
            return true;
        }
    }
    return false;
}

bool Collection::contains_strict(const Value& value) const {
    return search(value, true).has_value();
}

bool Collection::contains_strict(const std::string& path, const Value& value) const {
    return contains(path, value, true);
}

Value Collection::first(const Value& default_value) const {
    return items_.empty() ? default_value : items_.at(0).second;
}

Value Collection::first(const Predicate& predicate, const Value& default_value) const {
    for (const auto& [key, value] : items_) {
        if (predicate(value, key)) {
            return value;
        }
    }
    return default_value;
}

Value Collection::first_where(const std::string& path, const Value& value,
                              const std::string& op) const {
    return first(where_filter(path, value, op));
}

Value Collection::first_or_fail() const {
    if (items_.empty()) {
        throw ItemNotFoundError();
    }
    return items_.at(0).second;
}

Value Collection::first_or_fail(const Predicate& predicate) const {
    for (const auto& [key, value] : items_) {
        if (predicate(value, key)) {
            return value;
        }
    }
    throw ItemNotFoundError();
}

Value Collection::last(const Value& default_value) const {
    return items_.empty() ? default_value : items_.at(items_.size() - 1).second;
}

Value Collection::last(const Predicate& predicate, const Value& default_value) const {
    const auto& entries = items_.entries();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (predicate(it->second, it->first)) {
            return it->second;
        }
    }
    return default_value;
}

Collection& Collection::when(bool condition, const Callback& callback, const Callback& fallback) {
    if (condition) {
        if (callback) {
            callback(*this);
        }
    } else if (fallback) {
        fallback(*this);
    }
    return *this;
}

Collection& Collection::when_empty(const Callback& callback, const Callback& fallback) {
    return when(is_empty(), callback, fallback);
}

Collection& Collection::when_not_empty(const Callback& callback, const Callback& fallback) {
    return when(is_not_empty(), callback, fallback);
}

Collection Collection::merge(const Collection& other) const {
    return Collection(fluent::merge(items_, other.items_));
}

Collection Collection::merge_recursive(const Collection& other) const {
    return Collection(fluent::merge_recursive(items_, other.items_));
}

Collection Collection::replace(const Collection& other) const {
    return Collection(fluent::replace(items_, other.items_));
}

Collection Collection::replace_recursive(const Collection& other) const {
    return Collection(fluent::replace_recursive(items_, other.items_));
}

Collection Collection::unique(const Extractor& key, bool strict) const {
    if (key.is_identity()) {
        return Collection(fluent::unique(items_, strict));
    }

    std::vector<Value> seen;
    Items result;
    for (const auto& [k, item] : items_) {
        auto extracted = key(item, k);
        const Value id = extracted ? std::move(*extracted) : Value();

        const bool duplicate = std::any_of(seen.begin(), seen.end(), [&](const Value& previous) {
            return strict ? strict_equals(previous, id) : loose_equals(previous, id);
        });
        if (!duplicate) {
            seen.push_back(id);
            result.put(k, item);
        }
    }
    return Collection(std::move(result));
}

Collection Collection::unique_strict(const Extractor& key) const {
    return unique(key, true);
}

std::vector<Collection> Collection::chunk(std::int64_t size) const {
    std::vector<Collection> chunks;
    if (size <= 0) {
        return chunks;
    }

    Items current;
    for (const auto& [key, value] : items_) {
        current.put(key, value);
        if (static_cast<std::int64_t>(current.size()) == size) {
            chunks.emplace_back(std::move(current));
            current = Items();
        }
    }
    if (!current.empty()) {
        chunks.emplace_back(std::move(current));
    }
    return chunks;
}

std::pair<Collection, Collection> Collection::partition(const Predicate& predicate) const {
    std::vector<Value> passed;
    std::vector<Value> failed;
    for (const auto& [key, value] : items_) {
        (predicate(value, key) ? passed : failed).push_back(value);
    }
    return {Collection(Items::list(std::move(passed))), Collection(Items::list(std::move(failed)))};
}

Collection Collection::flatten(int depth) const {
    return Collection(fluent::flatten(items_, depth));
}

Collection Collection::collapse() const {
    return Collection(fluent::collapse(items_));
}

Collection Collection::pluck(const std::string& path, const std::string& key_path) const {
    const auto segments = split_dot_path(path);
    const auto key_segments = split_dot_path(key_path);

    Items result;
    for (const auto& entry : items_) {
        PathLookup lookup = resolve_path(entry.second, segments);
        Value value = lookup.found ? *lookup.value : Value();

        std::optional<Key> key;
        if (!key_path.empty()) {
            PathLookup key_lookup = resolve_path(entry.second, key_segments);
            if (key_lookup.found) {
                key = Key::from_value(*key_lookup.value);
            }
        }

        if (key) {
            result.put(*key, std::move(value));
        } else {
            result.push(std::move(value));
        }
    }
    return Collection(std::move(result));
}

std::string Collection::implode(const std::string& glue, const std::string& path) const {
    const Collection parts = path.empty() ? values() : pluck(path);

    std::string joined;
    bool first_part = true;
    for (const auto& entry : parts) {
        if (!first_part) {
            joined += glue;
        }
        joined += to_string(entry.second);
        first_part = false;
    }
    return joined;
}

// ============================================================================
// Queries
// ============================================================================

Collection Collection::where(const std::string& path, const Value& value,
                             const std::string& op) const {
    return filter(where_filter(path, value, op));
}

Collection Collection::where_strict(const std::string& path, const Value& value) const {
    return filter(where_filter(path, value, "==="));
}

Collection Collection::where_between(const std::string& path, const Value& min,
                                     const Value& max) const {
    return filter(between_filter(path, min, max));
}

Collection Collection::where_not_between(const std::string& path, const Value& min,
                                         const Value& max) const {
    return filter(between_filter(path, min, max, true));
}

Collection Collection::where_in(const std::string& path, const Value& values, bool strict) const {
    return filter(in_filter(path, values, strict));
}

Collection Collection::where_in_strict(const std::string& path, const Value& values) const {
    return filter(in_filter(path, values, true));
}

Collection Collection::where_not_in(const std::string& path, const Value& values,
                                    bool strict) const {
    return filter(in_filter(path, values, strict, true));
}

Collection Collection::where_not_in_strict(const std::string& path, const Value& values) const {
    return filter(in_filter(path, values, true, true));
}

Collection Collection::where_like(const std::string& path, const std::string& pattern,
                                  bool strict) const {
    return filter(like_filter(path, pattern, strict));
}

Collection Collection::where_null(const std::string& path) const {
    return filter(null_filter(path));
}

Collection Collection::where_not_null(const std::string& path) const {
    return filter(null_filter(path, true));
}

Collection Collection::where_not_empty(const std::string& path) const {
    return filter(not_empty_filter(path));
}

Collection Collection::where_not_blank() const {
    return filter([](const Value& value) {
        return !is_container(value) && truthy(Value(trim(to_string(value))));
    });
}

// ============================================================================
// Sorting
// ============================================================================

Collection Collection::sort(const SortOptions& options, bool descending) const {
    return Collection(renumbered(sort_values(items_, options, descending)));
}

Collection Collection::sort(const Comparator& comparator) const {
    return Collection(renumbered(sort_values(items_, comparator)));
}

Collection Collection::sort_desc(const SortOptions& options) const {
    return sort(options, true);
}

Collection Collection::sort_by(const Extractor& key, bool descending,
                               const SortOptions& options) const {
    SortCriterion criterion{key, descending, options};
    return build_sorted(sort_items(items_, criterion), SortChain{criterion});
}

Collection Collection::sort_by_desc(const Extractor& key, const SortOptions& options) const {
    return sort_by(key, true, options);
}

Collection Collection::refine(const char* method, const SortCriterion& criterion) const {
    if (chain_.empty()) {
        throw UnchainedSortError(method);
    }

    SortChain chain = chain_;
    chain.push_back(criterion);
    return build_sorted(refine_sort(items_, chain_, criterion), std::move(chain));
}

Collection Collection::then_by(const Extractor& key, bool descending,
                               const SortOptions& options) const {
    return refine("then_by", SortCriterion{key, descending, options});
}

Collection Collection::then_by_desc(const Extractor& key, const SortOptions& options) const {
    return refine("then_by_desc", SortCriterion{key, true, options});
}

Collection Collection::sort_keys(const SortOptions& options, bool descending) const {
    return Collection(fluent::sort_keys(items_, options, descending));
}

Collection Collection::sort_keys_desc(const SortOptions& options) const {
    return sort_keys(options, true);
}

// ============================================================================
// Macros
// ============================================================================

void Collection::macro(const std::string& name, Macro fn) {
    MacroRegistry<Collection>::instance().add(name, std::move(fn));
}

bool Collection::has_macro(const std::string& name) {
    return MacroRegistry<Collection>::instance().contains(name);
}

bool Collection::remove_macro(const std::string& name) {
    return MacroRegistry<Collection>::instance().remove(name);
}

Value Collection::call(const std::string& name, const std::vector<Value>& args) {
    return MacroRegistry<Collection>::instance().call(name, *this, args);
}

} // namespace fluent
