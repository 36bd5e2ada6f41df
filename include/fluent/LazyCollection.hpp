/**
 * @file LazyCollection.hpp
 * @brief Pull-based collection over a restartable source
 *
 * A LazyCollection describes how to produce its entries instead of holding
 * them. Its source is one of:
 * - materialized items, shared and immutable;
 * - a Producer returning a fresh Sequence on every call;
 * - another LazyCollection (nested).
 *
 * Derived operations (map, filter, where, take, ...) return a new lazy
 * collection and do no work until an iteration begins; they pull from
 * their upstream one element at a time. Terminal operations (all, count,
 * first, reduce, sum, ...) run an iteration. Every iteration restarts the
 * source, so a lazy collection can be consumed any number of times.
 *
 * Endless sources (see range_from()) are safe only under operations that
 * stop pulling: first(), take(), a bounded slice(), contains().
 *
 * Usage:
 * ```cpp
 * auto evens = range_from(1)
 *     .filter([](const Value& v) { return v.get<int>() % 2 == 0; })
 *     .take(3);
 * evens.to_array();   // [2, 4, 6]
 * ```
 */

#ifndef FLUENT_LAZYCOLLECTION_HPP
#define FLUENT_LAZYCOLLECTION_HPP

#include "fluent/Callable.hpp"
#include "fluent/Collection.hpp"
#include "fluent/Enumerable.hpp"
#include "fluent/Items.hpp"
#include "fluent/Macros.hpp"
#include "fluent/Sequence.hpp"
#include "fluent/SortChain.hpp"
#include "fluent/Value.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace fluent {

class LazyCollection : public Enumerable {
public:
    static constexpr const char* kTypeName = "LazyCollection";

    using Source = std::variant<std::shared_ptr<const Items>, Producer,
                                std::shared_ptr<const LazyCollection>>;
    using Macro = MacroRegistry<LazyCollection>::Function;

    /// Empty collection
    LazyCollection();

    explicit LazyCollection(Items items);
    explicit LazyCollection(const Value& value);
    explicit LazyCollection(const Collection& collection);
    explicit LazyCollection(Producer producer);

    /**
     * @brief Rejected: a Sequence can be pulled only once
     * @throws InvalidSourceError always; pass a Producer instead
     */
    explicit LazyCollection(Sequence sequence);

    /// Lazy collection reading from `upstream`
    static LazyCollection wrap(LazyCollection upstream);

    /// Start a fresh, independent iteration
    Sequence iterate() const;

    // ========================================================================
    // Terminal operations
    // ========================================================================

    Items all() const override;
    std::size_t count() const override;

    /// Pulls at most one element
    bool is_empty() const override;

    /// Materialize; a sorted lazy collection keeps its comparator chain
    Collection collect() const;

    Value first(const Value& default_value = nullptr) const;
    Value first(const Predicate& predicate, const Value& default_value = nullptr) const;

    /**
     * @throws ItemNotFoundError when no element (passing `predicate`) exists
     */
    Value first_or_fail() const;
    Value first_or_fail(const Predicate& predicate) const;

    Value last(const Value& default_value = nullptr) const;

    /// Visit every entry; stops early when the callback returns false
    const LazyCollection& each(const Predicate& callback) const;

    Value reduce(const Reducer& reducer, Value initial = nullptr) const;

    bool contains(const Value& value) const;
    bool contains(const Predicate& predicate) const;
    bool every(const Predicate& predicate) const;

    Value sum(const Extractor& key = {}) const;
    Value avg(const Extractor& key = {}) const;
    Value min(const Extractor& key = {}) const;
    Value max(const Extractor& key = {}) const;
    Value median(const Extractor& key = {}) const;
    Value mode(const Extractor& key = {}) const;

    // ========================================================================
    // Derived operations
    // ========================================================================

    LazyCollection keys() const;
    LazyCollection values() const;

    LazyCollection map(const Mapper& mapper) const;
    LazyCollection filter() const;
    LazyCollection filter(const Predicate& predicate) const;
    LazyCollection reject(const Predicate& predicate) const;

    LazyCollection where(const std::string& path, const Value& value,
                         const std::string& op = "=") const;
    LazyCollection where_strict(const std::string& path, const Value& value) const;
    LazyCollection where_between(const std::string& path, const Value& min, const Value& max) const;
    LazyCollection where_not_between(const std::string& path, const Value& min,
                                     const Value& max) const;
    LazyCollection where_in(const std::string& path, const Value& values, bool strict = false) const;
    LazyCollection where_in_strict(const std::string& path, const Value& values) const;
    LazyCollection where_not_in(const std::string& path, const Value& values,
                                bool strict = false) const;
    LazyCollection where_not_in_strict(const std::string& path, const Value& values) const;
    LazyCollection where_like(const std::string& path, const std::string& pattern,
                              bool strict = false) const;
    LazyCollection where_null(const std::string& path) const;
    LazyCollection where_not_null(const std::string& path) const;
    LazyCollection where_not_empty(const std::string& path) const;

    /**
     * @brief Slice by position, renumbering integer keys unless `preserve_keys`
     *
     * Non-negative offsets and lengths stream; negative ones count from the
     * end and materialize the upstream when iterated.
     */
    LazyCollection slice(std::int64_t offset, std::optional<std::int64_t> length = std::nullopt,
                         bool preserve_keys = false) const;
    LazyCollection take(std::int64_t limit) const;
    LazyCollection skip(std::int64_t count) const;

    /**
     * @throws InvalidArgumentError when `step` is not positive
     */
    LazyCollection nth(std::int64_t step, std::int64_t offset = 0) const;

    LazyCollection take_while(const Predicate& predicate) const;
    LazyCollection skip_while(const Predicate& predicate) const;

    /// Lists of up to `size` values (objects when keys are not a list)
    LazyCollection chunk(std::int64_t size) const;

    LazyCollection unique(const Extractor& key = {}, bool strict = false) const;

    /// This collection's entries, then the values of `other` under new integer keys
    LazyCollection concat(const LazyCollection& other) const;

    /**
     * @brief Append values by replacing the source with one that replays
     *        the previous source, then the pushed values.
     */
    template <typename... Values>
    LazyCollection& push(Values&&... values) {
        std::vector<Value> pushed;
        (pushed.emplace_back(std::forward<Values>(values)), ...);
        append(std::move(pushed));
        return *this;
    }

    // ========================================================================
    // Deferred sorting
    // ========================================================================

    LazyCollection sort(const SortOptions& options = {}, bool descending = false) const;
    LazyCollection sort(const Comparator& comparator) const;
    LazyCollection sort_desc(const SortOptions& options = {}) const;
    LazyCollection sort_by(const Extractor& key, bool descending = false,
                           const SortOptions& options = {}) const;
    LazyCollection sort_by_desc(const Extractor& key, const SortOptions& options = {}) const;

    /**
     * @throws UnchainedSortError immediately when no sort_by() preceded
     */
    LazyCollection then_by(const Extractor& key, bool descending = false,
                           const SortOptions& options = {}) const;
    LazyCollection then_by_desc(const Extractor& key, const SortOptions& options = {}) const;

    LazyCollection sort_keys(const SortOptions& options = {}, bool descending = false) const;
    LazyCollection sort_keys_desc(const SortOptions& options = {}) const;

    std::size_t sorts() const noexcept { return chain_.size(); }

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

private:
    /// Lazy collection whose entries are `materialize(upstream.all())`
    template <typename Fn>
    LazyCollection deferred(Fn materialize) const;

    LazyCollection refine(const char* method, const SortCriterion& criterion) const;

    void append(std::vector<Value> pushed);

    Source source_;
    SortChain chain_;
};

} // namespace fluent

#endif // FLUENT_LAZYCOLLECTION_HPP
