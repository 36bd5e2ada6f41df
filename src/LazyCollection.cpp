/**
 * @file LazyCollection.cpp
 * @brief Implementation of the pull-based collection
 */

#include "fluent/LazyCollection.hpp"
#include "fluent/Compare.hpp"
#include "fluent/Errors.hpp"
#include "fluent/Predicate.hpp"

#include <spdlog/spdlog.h>

namespace fluent {

namespace {

    using Input = std::shared_ptr<Sequence>;

    Input pull_from(const LazyCollection& upstream) {
        return std::make_shared<Sequence>(upstream.iterate());
    }

} // namespace

// ============================================================================
// Construction
// ============================================================================

LazyCollection::LazyCollection()
    : source_(std::make_shared<const Items>()) {}

LazyCollection::LazyCollection(Items items)
    : source_(std::make_shared<const Items>(std::move(items))) {}

LazyCollection::LazyCollection(const Value& value)
    : LazyCollection(Items::from_value(value)) {}

LazyCollection::LazyCollection(const Collection& collection)
    : LazyCollection(collection.all()) {}

LazyCollection::LazyCollection(Producer producer)
    : source_(std::move(producer)) {}

LazyCollection::LazyCollection(Sequence)
    : source_(std::make_shared<const Items>()) {
    throw InvalidSourceError("a Sequence can be iterated only once; pass a Producer that "
                             "returns a new Sequence for each iteration");
}

LazyCollection LazyCollection::wrap(LazyCollection upstream) {
    LazyCollection nested;
    nested.chain_ = upstream.chain_;
    nested.source_ = std::make_shared<const LazyCollection>(std::move(upstream));
    return nested;
}

Sequence LazyCollection::iterate() const {
    if (const auto* items = std::get_if<std::shared_ptr<const Items>>(&source_)) {
        return Sequence::of(*items);
    }
    if (const auto* producer = std::get_if<Producer>(&source_)) {
        return *producer ? (*producer)() : Sequence();
    }
    return std::get<std::shared_ptr<const LazyCollection>>(source_)->iterate();
}

template <typename Fn>
LazyCollection LazyCollection::deferred(Fn materialize) const {
    return LazyCollection(Producer([upstream = *this, materialize]() {
        auto items = std::make_shared<const Items>(materialize(upstream.all()));
        return Sequence::of(std::move(items));
    }));
}

// ============================================================================
// Terminal operations
// ============================================================================

Items LazyCollection::all() const {
    Items items;
    Sequence seq = iterate();
    for (const Entry& entry : seq) {
        items.put(entry.first, entry.second);
    }
    spdlog::trace("LazyCollection materialized {} items", items.size());
    return items;
}

std::size_t LazyCollection::count() const {
    std::size_t n = 0;
    Sequence seq = iterate();
    while (seq.next()) {
        ++n;
    }
    return n;
}

bool LazyCollection::is_empty() const {
    Sequence seq = iterate();
    return !seq.next();
}

Collection LazyCollection::collect() const {
    if (chain_.empty()) {
        return Collection(all());
    }
    return Collection::build_sorted(all(), chain_);
}

Value LazyCollection::first(const Value& default_value) const {
    Sequence seq = iterate();
    auto entry = seq.next();
    return entry ? entry->second : default_value;
}

Value LazyCollection::first(const Predicate& predicate, const Value& default_value) const {
    Sequence seq = iterate();
    while (auto entry = seq.next()) {
        if (predicate(entry->second, entry->first)) {
            return entry->second;
        }
    }
    return default_value;
}

Value LazyCollection::first_or_fail() const {
    Sequence seq = iterate();
    auto entry = seq.next();
    if (!entry) {
        throw ItemNotFoundError();
    }
    return entry->second;
}

Value LazyCollection::first_or_fail(const Predicate& predicate) const {
    Sequence seq = iterate();
    while (auto entry = seq.next()) {
        if (predicate(entry->second, entry->first)) {
            return entry->second;
        }
    }
    throw ItemNotFoundError();
}

Value LazyCollection::last(const Value& default_value) const {
    std::optional<Value> result;
    Sequence seq = iterate();
    while (auto entry = seq.next()) {
        result = std::move(entry->second);
    }
    return result ? *result : default_value;
}

const LazyCollection& LazyCollection::each(const Predicate& callback) const {
    Sequence seq = iterate();
    while (auto entry = seq.next()) {
        if (!callback(entry->second, entry->first)) {
            break;
        }
    }
    return *this;
}

Value LazyCollection::reduce(const Reducer& reducer, Value initial) const {
    Value carry = std::move(initial);
    Sequence seq = iterate();
    while (auto entry = seq.next()) {
        carry = reducer(carry, entry->second, entry->first);
    }
    return carry;
}

bool LazyCollection::contains(const Value& value) const {
    return contains(Predicate([&value](const Value& item) { return loose_equals(item, value); }));
}

bool LazyCollection::contains(const Predicate& predicate) const {
    Sequence seq = iterate();
    while (auto entry = seq.next()) {
        if (predicate(entry->second, entry->first)) {
            return true;
        }
    }
    return false;
}

bool LazyCollection::every(const Predicate& predicate) const {
    Sequence seq = iterate();
    while (auto entry = seq.next()) {
        if (!predicate(entry->second, entry->first)) {
            return false;
        }
    }
    return true;
}

Value LazyCollection::sum(const Extractor& key) const { return collect().sum(key); }
Value LazyCollection::avg(const Extractor& key) const { return collect().avg(key); }
Value LazyCollection::min(const Extractor& key) const { return collect().min(key); }
Value LazyCollection::max(const Extractor& key) const { return collect().max(key); }
Value LazyCollection::median(const Extractor& key) const { return collect().median(key); }
Value LazyCollection::mode(const Extractor& key) const { return collect().mode(key); }

// ============================================================================
// Derived operations
// ============================================================================

LazyCollection LazyCollection::keys() const {
    return LazyCollection(Producer([upstream = *this]() {
        Input input = pull_from(upstream);
        std::int64_t index = 0;
        return Sequence([input, index]() mutable -> std::optional<Entry> {
            auto entry = input->next();
            if (!entry) {
                return std::nullopt;
            }
            return Entry(Key(index++), entry->first.to_value());
        });
    }));
}

LazyCollection LazyCollection::values() const {
    return LazyCollection(Producer([upstream = *this]() {
        Input input = pull_from(upstream);
        std::int64_t index = 0;
        return Sequence([input, index]() mutable -> std::optional<Entry> {
            auto entry = input->next();
            if (!entry) {
                return std::nullopt;
            }
            return Entry(Key(index++), std::move(entry->second));
        });
    }));
}

LazyCollection LazyCollection::map(const Mapper& mapper) const {
    return LazyCollection(Producer([upstream = *this, mapper]() {
        Input input = pull_from(upstream);
        return Sequence([input, mapper]() -> std::optional<Entry> {
            auto entry = input->next();
            if (!entry) {
                return std::nullopt;
            }
            Value mapped = mapper(entry->second, entry->first);
            return Entry(std::move(entry->first), std::move(mapped));
        });
    }));
}

LazyCollection LazyCollection::filter() const {
    return filter([](const Value& item) { return truthy(item); });
}

LazyCollection LazyCollection::filter(const Predicate& predicate) const {
    return LazyCollection(Producer([upstream = *this, predicate]() {
        Input input = pull_from(upstream);
        return Sequence([input, predicate]() -> std::optional<Entry> {
            while (auto entry = input->next()) {
                if (predicate(entry->second, entry->first)) {
                    return entry;
                }
            }
            return std::nullopt;
        });
    }));
}

LazyCollection LazyCollection::reject(const Predicate& predicate) const {
    return filter([predicate](const Value& item, const Key& key) { return !predicate(item, key); });
}

LazyCollection LazyCollection::where(const std::string& path, const Value& value,
                                     const std::string& op) const {
    return filter(where_filter(path, value, op));
}

LazyCollection LazyCollection::where_strict(const std::string& path, const Value& value) const {
    return filter(where_filter(path, value, "==="));
}

LazyCollection LazyCollection::where_between(const std::string& path, const Value& min,
                                             const Value& max) const {
    return filter(between_filter(path, min, max));
}

LazyCollection LazyCollection::where_not_between(const std::string& path, const Value& min,
                                                 const Value& max) const {
    return filter(between_filter(path, min, max, true));
}

LazyCollection LazyCollection::where_in(const std::string& path, const Value& values,
                                        bool strict) const {
    return filter(in_filter(path, values, strict));
}

LazyCollection LazyCollection::where_in_strict(const std::string& path, const Value& values) const {
    return filter(in_filter(path, values, true));
}

LazyCollection LazyCollection::where_not_in(const std::string& path, const Value& values,
                                            bool strict) const {
    return filter(in_filter(path, values, strict, true));
}

LazyCollection LazyCollection::where_not_in_strict(const std::string& path,
                                                   const Value& values) const {
    return filter(in_filter(path, values, true, true));
}

LazyCollection LazyCollection::where_like(const std::string& path, const std::string& pattern,
                                          bool strict) const {
    return filter(like_filter(path, pattern, strict));
}

LazyCollection LazyCollection::where_null(const std::string& path) const {
    return filter(null_filter(path));
}

LazyCollection LazyCollection::where_not_null(const std::string& path) const {
    return filter(null_filter(path, true));
}

LazyCollection LazyCollection::where_not_empty(const std::string& path) const {
    return filter(not_empty_filter(path));
}

LazyCollection LazyCollection::slice(std::int64_t offset, std::optional<std::int64_t> length,
                                     bool preserve_keys) const {
    if (offset < 0 || (length && *length < 0)) {
        return deferred([offset, length, preserve_keys](const Items& items) {
            return fluent::slice(items, offset, length, preserve_keys);
        });
    }

    return LazyCollection(Producer([upstream = *this, offset, length, preserve_keys]() {
        Input input = pull_from(upstream);
        std::int64_t position = 0;
        std::int64_t emitted = 0;
        std::int64_t index = 0;
        return Sequence([=]() mutable -> std::optional<Entry> {
            // Stop before pulling so bounded slices of endless sources end
            if (length && emitted >= *length) {
                return std::nullopt;
            }
            while (auto entry = input->next()) {
                if (position++ < offset) {
                    continue;
                }
                ++emitted;
                if (!preserve_keys && entry->first.is_int()) {
                    entry->first = Key(index++);
                }
                return entry;
            }
            return std::nullopt;
        });
    }));
}

LazyCollection LazyCollection::take(std::int64_t limit) const {
    if (limit < 0) {
        return slice(limit);
    }
    return slice(0, limit);
}

LazyCollection LazyCollection::skip(std::int64_t count) const {
    return slice(count);
}

LazyCollection LazyCollection::nth(std::int64_t step, std::int64_t offset) const {
    if (step <= 0) {
        throw InvalidArgumentError("nth step must be positive, got " + std::to_string(step));
    }

    return slice(offset).values().filter([step](const Value&, const Key& key) {
        return key.as_int() % step == 0;
    }).values();
}

LazyCollection LazyCollection::take_while(const Predicate& predicate) const {
    return LazyCollection(Producer([upstream = *this, predicate]() {
        Input input = pull_from(upstream);
        bool done = false;
        return Sequence([input, predicate, done]() mutable -> std::optional<Entry> {
            if (done) {
                return std::nullopt;
            }
            auto entry = input->next();
            if (!entry || !predicate(entry->second, entry->first)) {
                done = true;
                return std::nullopt;
            }
            return entry;
        });
    }));
}

LazyCollection LazyCollection::skip_while(const Predicate& predicate) const {
    return LazyCollection(Producer([upstream = *this, predicate]() {
        Input input = pull_from(upstream);
        bool skipping = true;
        return Sequence([input, predicate, skipping]() mutable -> std::optional<Entry> {
            while (auto entry = input->next()) {
                if (skipping && predicate(entry->second, entry->first)) {
                    continue;
                }
                skipping = false;
                return entry;
            }
            return std::nullopt;
        });
    }));
}

LazyCollection LazyCollection::chunk(std::int64_t size) const {
    if (size <= 0) {
        return LazyCollection();
    }

    return LazyCollection(Producer([upstream = *this, size]() {
        Input input = pull_from(upstream);
        std::int64_t index = 0;
        return Sequence([input, size, index]() mutable -> std::optional<Entry> {
            Items chunk;
            while (static_cast<std::int64_t>(chunk.size()) < size) {
                auto entry = input->next();
                if (!entry) {
                    break;
                }
                chunk.put(entry->first, std::move(entry->second));
            }
            if (chunk.empty()) {
                return std::nullopt;
            }
            return Entry(Key(index++), chunk.to_value());
        });
    }));
}

LazyCollection LazyCollection::unique(const Extractor& key, bool strict) const {
    return LazyCollection(Producer([upstream = *this, key, strict]() {
        Input input = pull_from(upstream);
        std::vector<Value> seen;
        return Sequence([input, key, strict, seen]() mutable -> std::optional<Entry> {
            while (auto entry = input->next()) {
                auto extracted = key(entry->second, entry->first);
                const Value id = extracted ? std::move(*extracted) : Value();

                bool duplicate = false;
                for (const auto& previous : seen) {
                    if (strict ? strict_equals(previous, id) : loose_equals(previous, id)) {
                        duplicate = true;
                        break;
                    }
                }
                if (!duplicate) {
                    seen.push_back(id);
                    return entry;
                }
            }
            return std::nullopt;
        });
    }));
}

LazyCollection LazyCollection::concat(const LazyCollection& other) const {
    return LazyCollection(Producer([upstream = *this, other]() {
        Input first = pull_from(upstream);
        Input second = pull_from(other);
        std::int64_t next_index = 0;
        return Sequence([first, second, next_index]() mutable -> std::optional<Entry> {
            if (auto entry = first->next()) {
                if (entry->first.is_int() && entry->first.as_int() >= next_index) {
                    next_index = entry->first.as_int() + 1;
                }
                return entry;
            }
            auto entry = second->next();
            if (!entry) {
                return std::nullopt;
            }
            return Entry(Key(next_index++), std::move(entry->second));
        });
    }));
}

void LazyCollection::append(std::vector<Value> pushed) {
    SortChain chain = chain_;
    *this = concat(LazyCollection(Items::list(std::move(pushed))));
    chain_ = std::move(chain);
}

// ============================================================================
// Deferred sorting
// ============================================================================

LazyCollection LazyCollection::sort(const SortOptions& options, bool descending) const {
    return deferred([options, descending](const Items& items) {
        return renumbered(sort_values(items, options, descending));
    });
}

LazyCollection LazyCollection::sort(const Comparator& comparator) const {
    return deferred([comparator](const Items& items) {
        return renumbered(sort_values(items, comparator));
    });
}

LazyCollection LazyCollection::sort_desc(const SortOptions& options) const {
    return sort(options, true);
}

LazyCollection LazyCollection::sort_by(const Extractor& key, bool descending,
                                       const SortOptions& options) const {
    SortCriterion criterion{key, descending, options};
    LazyCollection sorted = deferred([criterion](const Items& items) {
        return sort_items(items, criterion);
    });
    sorted.chain_ = SortChain{criterion};
    return sorted;
}

LazyCollection LazyCollection::sort_by_desc(const Extractor& key, const SortOptions& options) const {
    return sort_by(key, true, options);
}

LazyCollection LazyCollection::refine(const char* method, const SortCriterion& criterion) const {
    if (chain_.empty()) {
        throw UnchainedSortError(method);
    }

    LazyCollection refined = deferred([chain = chain_, criterion](const Items& items) {
        return refine_sort(items, chain, criterion);
    });
    refined.chain_ = chain_;
    refined.chain_.push_back(criterion);
    return refined;
}

LazyCollection LazyCollection::then_by(const Extractor& key, bool descending,
                                       const SortOptions& options) const {
    return refine("then_by", SortCriterion{key, descending, options});
}

LazyCollection LazyCollection::then_by_desc(const Extractor& key, const SortOptions& options) const {
    return refine("then_by_desc", SortCriterion{key, true, options});
}

LazyCollection LazyCollection::sort_keys(const SortOptions& options, bool descending) const {
    return deferred([options, descending](const Items& items) {
        return fluent::sort_keys(items, options, descending);
    });
}

LazyCollection LazyCollection::sort_keys_desc(const SortOptions& options) const {
    return sort_keys(options, true);
}

// ============================================================================
// Macros
// ============================================================================

void LazyCollection::macro(const std::string& name, Macro fn) {
    MacroRegistry<LazyCollection>::instance().add(name, std::move(fn));
}

bool LazyCollection::has_macro(const std::string& name) {
    return MacroRegistry<LazyCollection>::instance().contains(name);
}

bool LazyCollection::remove_macro(const std::string& name) {
    return MacroRegistry<LazyCollection>::instance().remove(name);
}

Value LazyCollection::call(const std::string& name, const std::vector<Value>& args) {
    return MacroRegistry<LazyCollection>::instance().call(name, *this, args);
}

} // namespace fluent
