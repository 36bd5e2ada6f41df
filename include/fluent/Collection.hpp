/**
 * @file Collection.hpp
 * @brief Eager, chainable ordered collection
 *
 * A Collection owns its Items. Transformations return a new Collection and
 * leave the receiver alone; the in-place operations (push, prepend, set,
 * pop, shift, forget, pull, transform) mutate the receiver.
 *
 * Usage:
 * ```cpp
 * auto products = collect(Value::parse(R"([
 *     {"name": "Desk", "price": 200},
 *     {"name": "Chair", "price": 100},
 *     {"name": "Door", "price": 100}
 * ])"));
 *
 * auto cheap = products.where("price", 150, "<");
 * auto ordered = products.sort_by("price").then_by("name");
 * Value total = products.sum("price");   // 400
 * ```
 */

#ifndef FLUENT_COLLECTION_HPP
#define FLUENT_COLLECTION_HPP

#include "fluent/Callable.hpp"
#include "fluent/Compare.hpp"
#include "fluent/Enumerable.hpp"
#include "fluent/Items.hpp"
#include "fluent/Macros.hpp"
#include "fluent/SortChain.hpp"
#include "fluent/Value.hpp"

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fluent {

class Collection : public Enumerable {
public:
    static constexpr const char* kTypeName = "Collection";

    using Macro = MacroRegistry<Collection>::Function;
    using Callback = std::function<void(Collection&)>;
    using const_iterator = Items::const_iterator;

    Collection() = default;
    explicit Collection(Items items) : items_(std::move(items)) {}

    /// See Items::from_value() for how a Value becomes items
    explicit Collection(const Value& value) : items_(Items::from_value(value)) {}

    /**
     * @brief Bounded range of integers, floats or single characters
     * @throws InvalidArgumentError when `step` is zero
     */
    static Collection range(const Value& start, const Value& end, const Value& step = 1);

    /**
     * @brief Build a sorted collection carrying `chain` as its comparator
     *        chain, so that then_by() can refine it.
     */
    static Collection build_sorted(Items items, SortChain chain);

    // ========================================================================
    // Enumerable
    // ========================================================================

    Items all() const override { return items_; }
    std::size_t count() const override { return items_.size(); }
    bool is_empty() const override { return items_.empty(); }

    const Items& items() const noexcept { return items_; }
    const_iterator begin() const noexcept { return items_.begin(); }
    const_iterator end() const noexcept { return items_.end(); }

    // ========================================================================
    // Structural access
    // ========================================================================

    Value get(const Key& key, const Value& default_value = nullptr) const;

    /// Like get(), computing the fallback only when the key is missing
    Value get_or(const Key& key, const std::function<Value()>& fallback) const;

    Collection& set(const Key& key, Value value);

    bool has(const Key& key) const;

    /// True when every key is present
    bool has(std::initializer_list<Key> keys) const;

    /// True when at least one key is present
    bool has_any(std::initializer_list<Key> keys) const;

    /// Append each value under the next free integer key
    template <typename... Values>
    Collection& push(Values&&... values) {
        (items_.push(Value(std::forward<Values>(values))), ...);
        return *this;
    }

    /// Insert at the front; integer keys are renumbered
    Collection& prepend(Value value);

    /// Insert at the front under `key`
    Collection& prepend(Value value, const Key& key);

    /// Remove and return the last value (null when empty)
    Value pop();

    /**
     * @brief Remove up to `count` values from the end
     * @return The removed values, last one first, renumbered
     */
    Collection pop(std::size_t count);

    /// Remove and return the first value (null when empty)
    Value shift();

    /**
     * @brief Remove up to `count` values from the front
     * @return The removed values in order, renumbered
     */
    Collection shift(std::size_t count);

    Collection& forget(const Key& key);
    Collection& forget(std::initializer_list<Key> keys);

    /// Remove `key` and return its value
    Value pull(const Key& key, const Value& default_value = nullptr);

    Collection only(std::initializer_list<Key> keys) const;
    Collection only(const std::vector<Key>& keys) const;
    Collection except(std::initializer_list<Key> keys) const;
    Collection except(const std::vector<Key>& keys) const;

    Collection keys() const;
    Collection values() const;

    /**
     * @brief Slice by position; see fluent::slice()
     */
    Collection slice(std::int64_t offset, std::optional<std::int64_t> length = std::nullopt,
                     bool preserve_keys = false) const;

    Collection skip(std::int64_t count) const;

    /// First `limit` entries, or the last |limit| for a negative limit
    Collection take(std::int64_t limit) const;

    /// Every `step`-th value, starting at position `offset`
    Collection nth(std::int64_t step, std::int64_t offset = 0) const;

    Collection reverse(bool preserve_keys = false) const;
    Collection flip() const;
    Collection pad(std::int64_t size, const Value& value) const;

    /**
     * @brief Use this collection's values as keys for `values`
     * @throws InvalidArgumentError when both sides differ in size
     */
    Collection combine(const Collection& values) const;

    /// Append the values of `other`, ignoring its keys
    Collection concat(const Collection& other) const;

    Collection diff(const Collection& other) const;
    Collection diff_assoc(const Collection& other) const;
    Collection diff_keys(const Collection& other) const;

    /// Values of this collection also present (loosely) in `other`, keys preserved
    Collection intersect(const Collection& other) const;

    Collection shuffle(std::optional<std::uint32_t> seed = std::nullopt) const;

    /**
     * @brief One value picked at random
     * @throws InvalidArgumentError when the collection is empty
     */
    Value random() const;

    /**
     * @brief `count` distinct entries picked at random, in collection order
     * @throws InvalidArgumentError when `count` exceeds the size
     */
    Collection random(std::size_t count, bool preserve_keys = false) const;

    /// Key of the first value equal to `value`
    std::optional<Key> search(const Value& value, bool strict = false) const;

    /// Key of the first entry accepted by `predicate`
    std::optional<Key> search(const Predicate& predicate) const;

    // ========================================================================
    // Functional
    // ========================================================================

    /// Keys preserved
    Collection map(const Mapper& mapper) const;

    /// map() applied to the receiver
    Collection& transform(const Mapper& mapper);

    /// Drop falsy values
    Collection filter() const;
    Collection filter(const Predicate& predicate) const;
    Collection reject(const Predicate& predicate) const;

    Value reduce(const Reducer& reducer, Value initial = nullptr) const;

    /// Visit every entry; stops early when the callback returns false
    const Collection& each(const Predicate& callback) const;

    bool every(const Predicate& predicate) const;

    /**
     * @brief Every item whose `path` resolves satisfies `value(path) op value`
     *
     * Items where the path does not resolve are not considered.
     */
    bool every(const std::string& path, const Value& value, const std::string& op = "=") const;

    /// Some value loosely equal to `value`
    bool contains(const Value& value) const;
    bool contains(const Predicate& predicate) const;

    /// Some item whose `path` resolves to a value equal to `value`
    bool contains(const std::string& path, const Value& value, bool strict = false) const;

    bool contains_strict(const Value& value) const;
    bool contains_strict(const std::string& path, const Value& value) const;

    Value first(const Value& default_value = nullptr) const;
    Value first(const Predicate& predicate, const Value& default_value = nullptr) const;

    /// First item satisfying `value(path) op value`, or null
    Value first_where(const std::string& path, const Value& value,
                      const std::string& op = "=") const;

    /**
     * @brief First value (accepted by `predicate`), falsy values included
     * @throws ItemNotFoundError when there is none
     */
    Value first_or_fail() const;
    Value first_or_fail(const Predicate& predicate) const;

    Value last(const Value& default_value = nullptr) const;
    Value last(const Predicate& predicate, const Value& default_value = nullptr) const;

    /// Hand the collection to `fn` and return its result
    template <typename F>
    auto pipe(F&& fn) const -> decltype(fn(std::declval<const Collection&>())) {
        return std::forward<F>(fn)(*this);
    }

    /**
     * @brief Run `callback` on the receiver when `condition` holds, else
     *        `fallback` when one is given.
     */
    Collection& when(bool condition, const Callback& callback, const Callback& fallback = {});
    Collection& when_empty(const Callback& callback, const Callback& fallback = {});
    Collection& when_not_empty(const Callback& callback, const Callback& fallback = {});

    Collection merge(const Collection& other) const;
    Collection merge_recursive(const Collection& other) const;
    Collection replace(const Collection& other) const;
    Collection replace_recursive(const Collection& other) const;

    /**
     * @brief First occurrence of each value, keys preserved
     * @param key What identifies an item; the item itself by default
     */
    Collection unique(const Extractor& key = {}, bool strict = false) const;
    Collection unique_strict(const Extractor& key = {}) const;

    /// Chunks of `size` entries, keys preserved; size <= 0 yields none
    std::vector<Collection> chunk(std::int64_t size) const;

    /**
     * @brief Split into the values accepted and rejected by `predicate`,
     *        both renumbered, in a single pass.
     */
    std::pair<Collection, Collection> partition(const Predicate& predicate) const;

    Collection flatten(int depth = 1000) const;
    Collection collapse() const;

    /**
     * @brief Values at `path` of each item, optionally keyed by `key_path`
     *
     * Items where `path` does not resolve contribute null.
     */
    Collection pluck(const std::string& path, const std::string& key_path = "") const;

    /// String casts of the values (or of `path` in each item) joined by `glue`
    std::string implode(const std::string& glue, const std::string& path = "") const;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @throws InvalidOperatorError when `op` is not supported
     */
    Collection where(const std::string& path, const Value& value,
                     const std::string& op = "=") const;
    Collection where_strict(const std::string& path, const Value& value) const;
    Collection where_between(const std::string& path, const Value& min, const Value& max) const;
    Collection where_not_between(const std::string& path, const Value& min, const Value& max) const;
    Collection where_in(const std::string& path, const Value& values, bool strict = false) const;
    Collection where_in_strict(const std::string& path, const Value& values) const;
    Collection where_not_in(const std::string& path, const Value& values, bool strict = false) const;
    Collection where_not_in_strict(const std::string& path, const Value& values) const;
    Collection where_like(const std::string& path, const std::string& pattern,
                          bool strict = false) const;
    Collection where_null(const std::string& path) const;
    Collection where_not_null(const std::string& path) const;
    Collection where_not_empty(const std::string& path) const;

    /// Scalar values whose trimmed string cast is not blank
    Collection where_not_blank() const;

    // ========================================================================
    // Aggregates
    // ========================================================================

    /// Sum of the numeric values read by `key`
    Value sum(const Extractor& key = {}) const;

    /// Mean over the items `key` reads from; null when there are none
    Value avg(const Extractor& key = {}) const;

    Value min(const Extractor& key = {}) const;
    Value max(const Extractor& key = {}) const;

    /**
     * @brief Median of the numeric values read by `key`
     *
     * Odd counts give the middle value, even counts the mean of the two
     * central values; null when there are no numeric values.
     */
    Value median(const Extractor& key = {}) const;

    /// Every value tied for the highest frequency, in first-seen order
    Value mode(const Extractor& key = {}) const;

    /**
     * @brief Count items a path resolves in, or a callable returns truthy for
     */
    std::size_t count(const Extractor& key) const;

    /// Occurrences of each string or integer value read by `key`
    Collection count_by(const Extractor& key = {}) const;

    // ========================================================================
    // Sorting
    // ========================================================================

    /// Sort values and renumber
    Collection sort(const SortOptions& options = {}, bool descending = false) const;
    Collection sort(const Comparator& comparator) const;
    Collection sort_desc(const SortOptions& options = {}) const;

    /**
     * @brief Stable sort by `key`, keys preserved; starts a comparator chain
     */
    Collection sort_by(const Extractor& key, bool descending = false,
                       const SortOptions& options = {}) const;
    Collection sort_by_desc(const Extractor& key, const SortOptions& options = {}) const;

    /**
     * @brief Order the ties of the comparator chain by `key`
     * @throws UnchainedSortError when no sort_by() preceded
     */
    Collection then_by(const Extractor& key, bool descending = false,
                       const SortOptions& options = {}) const;
    Collection then_by_desc(const Extractor& key, const SortOptions& options = {}) const;

    Collection sort_keys(const SortOptions& options = {}, bool descending = false) const;
    Collection sort_keys_desc(const SortOptions& options = {}) const;

    /// Length of the comparator chain
    std::size_t sorts() const noexcept { return chain_.size(); }
    const SortChain& sort_chain() const noexcept { return chain_; }

    // ========================================================================
    // Macros
    // ========================================================================

    static void macro(const std::string& name, Macro fn);
    static bool has_macro(const std::string& name);
    static bool remove_macro(const std::string& name);

    /**
     * @throws BadMethodCallError when no macro is registered under `name`
     */
    Value call(const std::string& name, const std::vector<Value>& args = {});

    bool operator==(const Collection& other) const { return items_ == other.items_; }
    bool operator!=(const Collection& other) const { return !(*this == other); }

private:
    Collection refine(const char* method, const SortCriterion& criterion) const;

    Items items_;
    SortChain chain_;
};

} // namespace fluent

#endif // FLUENT_COLLECTION_HPP
