/**
 * @file Compare.hpp
 * @brief Relational operators over Values
 *
 * Two equality families exist:
 * - loose (`=`, `==`, `!=`, `<>`): numbers and numeric strings compare by
 *   value, so `1 == "1" == 1.0`;
 * - strict (`===`, `!==`): type and value must both match, so `1 !== "1"`
 *   and `1 !== 1.0`.
 *
 * Ordering operators and sorting use the loose three-way comparison
 * unless a collation mode is requested through SortOptions.
 */

#ifndef FLUENT_COMPARE_HPP
#define FLUENT_COMPARE_HPP

#include "fluent/Value.hpp"
#include <string>

namespace fluent {

enum class Operator {
    Equal,            // =, ==
    Identical,        // ===
    NotEqual,         // !=, <>
    NotIdentical,     // !==
    Less,             // <
    Greater,          // >
    LessOrEqual,      // <=
    GreaterOrEqual,   // >=
    Spaceship         // <=>
};

/**
 * @brief Parse an operator string
 * @throws InvalidOperatorError for anything outside
 *         `= == === != <> !== < > <= >= <=>`
 */
Operator parse_operator(const std::string& op);

/**
 * @brief Three-way loose comparison
 * @return -1, 0 or 1
 */
int loose_compare(const Value& lhs, const Value& rhs);

bool loose_equals(const Value& lhs, const Value& rhs);

/// Same type family (integer and unsigned count as one) and equal content
bool strict_equals(const Value& lhs, const Value& rhs);

/**
 * @brief Three-way result of `lhs <=> rhs`
 */
int spaceship(const Value& lhs, const Value& rhs);

/**
 * @brief Evaluate `lhs op rhs`
 *
 * `<=>` evaluates to true when the three-way result is non-zero.
 */
bool compare(const Value& lhs, Operator op, const Value& rhs);

/**
 * @brief Evaluate `lhs op rhs` with a textual operator
 * @throws InvalidOperatorError for an unsupported operator
 */
bool compare(const Value& lhs, const std::string& op, const Value& rhs);

/**
 * @brief Collation used when sorting
 */
enum class SortMode {
    Regular,   // loose comparison
    Numeric,   // compare numeric casts
    String,    // compare string casts byte-wise
    Natural    // compare string casts in natural order ("a2" < "a10")
};

struct SortOptions {
    SortMode mode = SortMode::Regular;
    bool fold_case = false;   // applies to String and Natural

    SortOptions() = default;
    SortOptions(SortMode m, bool fold = false) : mode(m), fold_case(fold) {}
};

/**
 * @brief Three-way comparison under a collation
 * @return -1, 0 or 1
 */
int collate(const Value& lhs, const Value& rhs, const SortOptions& options = {});

} // namespace fluent

#endif // FLUENT_COMPARE_HPP
