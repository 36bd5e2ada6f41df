/**
 * @file DotPath.hpp
 * @brief Dot-notation path utilities for nested item access
 *
 * Provides functions for addressing values inside nested items using
 * dot-separated paths like "author.name" or "tags.0".
 *
 * Resolution rules:
 * - Object levels look the segment up as a key
 * - Array levels require the segment to be an index in range
 * - A missing segment reports "not found" through PathLookup::found
 * - A scalar met before the last segment ends the walk early and is
 *   returned as found (lenient partial match), see resolve_path()
 */

#ifndef FLUENT_DOTPATH_HPP
#define FLUENT_DOTPATH_HPP

#include "fluent/Value.hpp"
#include <string>
#include <vector>

namespace fluent {

/**
 * @brief Result of resolving a path against a nested structure
 *
 * `found` is the only not-found signal. `value` is null when not found and
 * points into the resolved structure otherwise.
 */
struct PathLookup {
    const Value* value = nullptr;
    bool found = false;

    explicit operator bool() const noexcept { return found; }
};

/**
 * @brief Split a dot-path into segments
 *
 * @param path Dot-separated path like "a.b.c"
 * @return Vector of segments ["a", "b", "c"]
 *
 * Empty segments are kept as they are; there is no escaping of literal
 * dots.
 *
 * Examples:
 * - "author.name" → ["author", "name"]
 * - "tags.0" → ["tags", "0"]
 * - "a..b" → ["a", "", "b"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Resolve pre-split segments against a nested structure
 *
 * @param data Structure to walk (an item of a collection)
 * @param segments Path segments, usually from split_dot_path()
 * @return Lookup with `found == false` when any segment is absent
 *
 * Zero segments resolve to `data` itself. The root must be an array or an
 * object; a scalar root never resolves.
 *
 * Lenient partial match: when a segment is found, more segments remain,
 * and the value at that segment is not an array or object, the walk stops
 * and that value is returned with `found == true`.
 *
 * Examples:
 * ```cpp
 * Value item = {{"user", {{"name", "ada"}}}, {"age", 36}};
 * resolve_path(item, split_dot_path("user.name"));   // found, "ada"
 * resolve_path(item, split_dot_path("user.email"));  // not found
 * resolve_path(item, split_dot_path("age.years"));   // found, 36 (partial)
 * ```
 */
PathLookup resolve_path(const Value& data, const std::vector<std::string>& segments);

/**
 * @brief Resolve a dot-path against a nested structure
 */
PathLookup resolve_path(const Value& data, const std::string& path);

/**
 * @brief Get value from nested structure using dot-path (with default)
 *
 * Strict traversal: unlike resolve_path(), a scalar met before the last
 * segment counts as missing.
 *
 * @return Pointer to value at path, or pointer to default_val if not found
 */
const Value* get_by_dot(const Value& data, const std::string& path,
                        const Value& default_val);

/**
 * @brief Check if dot-path fully resolves in nested structure
 *
 * Strict traversal like get_by_dot(); never throws.
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace fluent

#endif // FLUENT_DOTPATH_HPP
