/**
 * @file Predicate.hpp
 * @brief Query filters built from the path resolver and the comparator
 *
 * Each builder returns a Predicate over `(item, key)`. Items whose path
 * does not resolve never match, negated forms included. Operators are
 * validated when the filter is built, so an invalid operator fails at the
 * query call even for lazy collections.
 */

#ifndef FLUENT_PREDICATE_HPP
#define FLUENT_PREDICATE_HPP

#include "fluent/Callable.hpp"
#include "fluent/Compare.hpp"
#include "fluent/Value.hpp"

#include <string>

namespace fluent {

/**
 * @brief Glob-style pattern with `%` wildcards at its ends
 *
 * Shapes:
 * - `%x%` → contains x
 * - `x%`  → starts with x
 * - `%x`  → ends with x
 * - `x`   → equals x
 *
 * Non-strict patterns fold both sides to lower-case ASCII first
 * (see fold_ascii()), strict patterns compare bytes as they are. Only
 * string and number values can match.
 */
class LikePattern {
public:
    enum class Kind { Contains, StartsWith, EndsWith, Exact };

    static LikePattern parse(const std::string& pattern, bool strict = false);

    bool matches(const Value& value) const;

    Kind kind() const noexcept { return kind_; }
    const std::string& needle() const noexcept { return needle_; }
    bool strict() const noexcept { return strict_; }

private:
    LikePattern(Kind kind, std::string needle, bool strict)
        : kind_(kind), needle_(std::move(needle)), strict_(strict) {}

    Kind kind_;
    std::string needle_;
    bool strict_;
};

/**
 * @brief `value(path) op value`
 * @throws InvalidOperatorError when `op` is not supported
 */
Predicate where_filter(const std::string& path, const Value& value, const std::string& op = "=");

/**
 * @brief Inclusive range test `min <= value(path) <= max`
 * @param negate Select `value < min || value > max` instead
 */
Predicate between_filter(const std::string& path, const Value& min, const Value& max,
                         bool negate = false);

/**
 * @brief Membership test against the elements of `values`
 * @param values An array or object whose values form the set
 * @param strict Use strict (typed) equality
 * @param negate Select items whose value is not a member
 */
Predicate in_filter(const std::string& path, const Value& values, bool strict = false,
                    bool negate = false);

/// Pattern test, see LikePattern
Predicate like_filter(const std::string& path, const std::string& pattern, bool strict = false);

/// Resolved value strictly null (or, negated, resolved and not null)
Predicate null_filter(const std::string& path, bool negate = false);

/// Resolved value truthy
Predicate not_empty_filter(const std::string& path);

} // namespace fluent

#endif // FLUENT_PREDICATE_HPP
