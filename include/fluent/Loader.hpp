/**
 * @file Loader.hpp
 * @brief Reading collection data from files and writing it back out
 *
 * Supported formats:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * The format is picked by file extension.
 */

#ifndef FLUENT_LOADER_HPP
#define FLUENT_LOADER_HPP

#include "fluent/Value.hpp"

#include <string>

namespace fluent {

/**
 * @brief Load a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed document, object key order preserved
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file.
 *
 * Tables become objects and arrays become arrays. Dates, times and
 * date-times have no JSON counterpart and are read as their TOML text.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a data file, detecting the format by extension.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws InvalidArgumentError for extensions other than .json and .toml
 */
Value load_data_file(const std::string& path);

/// Lowercased extension including the dot (".json"), empty when there is none
std::string get_file_extension(const std::string& path);

/**
 * @brief Render a value as a TOML document.
 *
 * A TOML document is a table, so a value that is not an object is
 * written under the key `value`. TOML has no null: nulls are written as
 * empty strings.
 */
std::string to_toml_string(const Value& value);

} // namespace fluent

#endif // FLUENT_LOADER_HPP
