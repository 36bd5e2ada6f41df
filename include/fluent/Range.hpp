/**
 * @file Range.hpp
 * @brief Arithmetic and character ranges as lazy collections
 *
 * Ranges generate one element per pull and never preallocate, so
 * range_from() can describe an endless sequence.
 *
 * Element type:
 * - single-character, non-numeric start and end → characters ("a".."e")
 * - any float operand (or numeric string with a fraction) → floats
 * - otherwise → integers
 */

#ifndef FLUENT_RANGE_HPP
#define FLUENT_RANGE_HPP

#include "fluent/LazyCollection.hpp"
#include "fluent/Sequence.hpp"
#include "fluent/Value.hpp"

namespace fluent {

/**
 * @brief Producer for the bounded range from `start` to `end`, inclusive
 *
 * The range ascends when `start <= end` and descends otherwise; only the
 * magnitude of `step` is used.
 *
 * @throws InvalidArgumentError when `step` is zero or not numeric, or the
 *         bounds are neither numbers nor single characters
 */
Producer range_producer(const Value& start, const Value& end, const Value& step = 1);

/**
 * @brief Producer for the unbounded numeric range `start, start + step, ...`
 *
 * A negative step counts down.
 *
 * @throws InvalidArgumentError when `step` is zero or either operand is
 *         not numeric
 */
Producer range_from_producer(const Value& start, const Value& step = 1);

/// Lazy bounded range, see range_producer()
LazyCollection range(const Value& start, const Value& end, const Value& step = 1);

/// Lazy unbounded range, see range_from_producer()
LazyCollection range_from(const Value& start, const Value& step = 1);

} // namespace fluent

#endif // FLUENT_RANGE_HPP
