/**
 * @file Items.hpp
 * @brief Ordered key/value mapping and the bulk array primitives over it
 *
 * Items is the backing store of every collection: unique keys, insertion
 * order significant. Integer keys behave like list indexes (push appends
 * under the next free index, renumbering reassigns them 0..n-1), string
 * keys behave like map keys and are never renumbered.
 *
 * The free functions below are the primitive bulk operations the
 * collection types are built from. They never mutate their arguments.
 */

#ifndef FLUENT_ITEMS_HPP
#define FLUENT_ITEMS_HPP

#include "fluent/Key.hpp"
#include "fluent/Value.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fluent {

using Entry = std::pair<Key, Value>;

class Items {
public:
    using container_type = std::vector<Entry>;
    using const_iterator = container_type::const_iterator;

    Items() = default;
    Items(std::initializer_list<Entry> entries);

    /**
     * @brief Build from a Value.
     *
     * - array → keys 0..n-1
     * - object → keys normalized ("3" becomes integer key 3)
     * - null → empty
     * - any other scalar → a single entry under key 0
     */
    static Items from_value(const Value& val);

    /// Build a list (keys 0..n-1) from plain values
    static Items list(std::vector<Value> values);

    /**
     * @brief Convert to a Value: a JSON array when the keys are exactly
     *        0..n-1 in order, otherwise an object with stringified keys.
     */
    Value to_value() const;

    /// True when the keys are exactly 0..n-1 in order
    bool is_list() const;

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    const Entry& at(std::size_t pos) const { return entries_.at(pos); }
    Value& value_at(std::size_t pos) { return entries_.at(pos).second; }

    const Value* find(const Key& key) const;
    Value* find(const Key& key);
    bool contains(const Key& key) const { return index_.count(key) > 0; }
    std::optional<std::size_t> position(const Key& key) const;

    /// Insert or overwrite; an existing key keeps its position
    void put(const Key& key, Value value);

    /// Append under the next free integer key
    void push(Value value);

    /// Insert at the front and renumber integer keys
    void prepend(Value value);

    /// Insert at the front under the given key, replacing any existing entry
    void prepend(const Key& key, Value value);

    bool erase(const Key& key);

    std::optional<Entry> pop_back();

    /// Remove the first entry and renumber the remaining integer keys
    std::optional<Entry> pop_front();

    void clear();

    std::vector<Key> keys() const;
    std::vector<Value> values() const;

    const container_type& entries() const noexcept { return entries_; }

    bool operator==(const Items& other) const { return entries_ == other.entries_; }
    bool operator!=(const Items& other) const { return !(*this == other); }

private:
    void reindex();

    container_type entries_;
    std::unordered_map<Key, std::size_t, KeyHash> index_;
    std::int64_t next_index_ = 0;
};

// ============================================================================
// Bulk primitives
// ============================================================================

/// Reassign integer keys 0..n-1 in order, keep string keys
Items renumbered(const Items& items);

/**
 * @brief Merge: integer-keyed entries of `other` are appended (renumbered),
 *        string-keyed entries overwrite in place.
 */
Items merge(const Items& base, const Items& other);

/**
 * @brief Recursive merge: like merge(), but a string key present on both
 *        sides collects both values into a nested list (merging
 *        recursively when both are containers).
 */
Items merge_recursive(const Items& base, const Items& other);

/// Replace: every entry of `other` overwrites (or adds) by key, integer keys included
Items replace(const Items& base, const Items& other);

/// Recursive replace: containers present on both sides are replaced key by key
Items replace_recursive(const Items& base, const Items& other);

/**
 * @brief Flatten nested containers into a list of leaf values.
 * @param depth Number of nesting levels to open (depth 1 opens one level)
 */
Items flatten(const Items& items, int depth);

/// Merge every container value into one list; scalars are dropped
Items collapse(const Items& items);

/**
 * @brief Slice by position.
 *
 * A negative offset counts from the end. A missing length runs to the end,
 * a negative length stops that many entries before the end. Integer keys
 * are renumbered unless `preserve_keys`.
 */
Items slice(const Items& items, std::int64_t offset,
            std::optional<std::int64_t> length = std::nullopt,
            bool preserve_keys = false);

Items reverse(const Items& items, bool preserve_keys = false);

/// Entries of `base` whose value (compared as a string) is absent from `other`
Items diff(const Items& base, const Items& other);

/// Entries of `base` whose key/value pair is absent from `other`
Items diff_assoc(const Items& base, const Items& other);

/// Entries of `base` whose key is absent from `other`
Items diff_keys(const Items& base, const Items& other);

Items only(const Items& items, const std::vector<Key>& keys);
Items except(const Items& items, const std::vector<Key>& keys);

/**
 * @brief Pad to |size| entries with `value`; positive sizes pad at the end,
 *        negative sizes at the front.
 */
Items pad(const Items& items, std::int64_t size, const Value& value);

/**
 * @brief Use the values of `keys` as keys for the values of `values`.
 * @throws InvalidArgumentError if both sides differ in size
 */
Items combine(const Items& keys, const Items& values);

/// Swap keys and values; values that cannot be keys are skipped
Items flip(const Items& items);

/// Values in random order, renumbered; a seed makes the order reproducible
Items shuffle(const Items& items, std::optional<std::uint32_t> seed = std::nullopt);

/// First occurrence of each value survives, keys preserved
Items unique(const Items& items, bool strict = false);

} // namespace fluent

#endif // FLUENT_ITEMS_HPP
