/**
 * @file SortChain.hpp
 * @brief Multi-criterion stable sorting
 *
 * A sort criterion pairs an Extractor with a direction and a collation.
 * sort_by() orders items by one criterion and starts a chain; then_by()
 * refines an ordered sequence: items that tie under every criterion of
 * the chain form a group, and each group is ordered by the new criterion
 * on its own. Earlier criteria therefore always dominate later ones.
 *
 * All sorts are stable and keep keys; renumbering is up to the caller.
 */

#ifndef FLUENT_SORTCHAIN_HPP
#define FLUENT_SORTCHAIN_HPP

#include "fluent/Callable.hpp"
#include "fluent/Compare.hpp"
#include "fluent/Items.hpp"

#include <functional>
#include <vector>

namespace fluent {

struct SortCriterion {
    Extractor extractor;
    bool descending = false;
    SortOptions options;

    /// Sort key of one item; an unresolved path sorts as null
    Value key_of(const Value& item, const Key& key) const;
};

using SortChain = std::vector<SortCriterion>;

/// User comparison: negative, zero or positive like strcmp
using Comparator = std::function<int(const Value& lhs, const Value& rhs)>;

/**
 * @brief Stable sort by one criterion, keys preserved
 */
Items sort_items(const Items& items, const SortCriterion& criterion);

/**
 * @brief Refine an ordering with one more criterion
 *
 * @param items Items already ordered by `chain`
 * @param chain Criteria the items were ordered by (must not be empty)
 * @param criterion Criterion applied inside each group of ties
 * @return Items grouped by equality under every criterion of `chain`
 *         (groups in order of first appearance), each group stably
 *         sorted by `criterion`
 */
Items refine_sort(const Items& items, const SortChain& chain, const SortCriterion& criterion);

/// Stable sort by value, keys preserved
Items sort_values(const Items& items, const SortOptions& options, bool descending = false);

/// Stable sort by value with a user comparison, keys preserved
Items sort_values(const Items& items, const Comparator& comparator);

/// Sort by key, keys preserved
Items sort_keys(const Items& items, const SortOptions& options, bool descending = false);

} // namespace fluent

#endif // FLUENT_SORTCHAIN_HPP
