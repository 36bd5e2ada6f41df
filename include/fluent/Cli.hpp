/**
 * @file Cli.hpp
 * @brief Command layer of the fluent-cli tool
 *
 * The tool loads a JSON or TOML document, optionally narrows it to a
 * nested value, wraps that value in a Collection and runs one command:
 *
 *   dump | keys | count [PATH] | where PATH [OP] VALUE | like PATH PATTERN |
 *   in PATH V1,V2,... | between PATH MIN MAX | sort [-]PATH... |
 *   sum|avg|min|max|median|mode [PATH] | unique [PATH] | first | last
 *
 * Kept apart from main() so the commands can be tested without a process.
 */

#ifndef FLUENT_CLI_HPP
#define FLUENT_CLI_HPP

#include "fluent/Errors.hpp"
#include "fluent/Value.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace fluent {

/**
 * @brief Bad command line: unknown command, missing arguments
 *
 * Reported with exit status 2.
 */
class UsageError : public CollectionError {
public:
    using CollectionError::CollectionError;
};

struct CliOptions {
    std::optional<std::string> input;   // stdin when empty
    std::string path;                   // dot-path selecting the collection
    std::string format = "json";        // json | toml
    int indent = 2;
    bool strict = false;
};

/**
 * @brief Parse a command argument as JSON, falling back to the raw string
 *
 * "42" → 42, "true" → true, "[1,2]" → [1, 2], "Desk" → "Desk".
 */
Value parse_json_or_string(const std::string& raw);

/**
 * @brief Read the input document and select `options.path` inside it
 * @throws InvalidArgumentError when the path does not resolve
 */
Value read_document(const CliOptions& options, std::istream& in);

/**
 * @brief Run one command against `document`
 *
 * @param command Command name followed by its arguments
 * @return The command's result as a value
 * @throws UsageError for an unknown command or a wrong argument count
 */
Value run_query(const Value& document, const std::vector<std::string>& command, bool strict = false);

/// Render a result as JSON or TOML, per `options.format`
std::string render(const Value& result, const CliOptions& options);

/**
 * @brief Full command execution with error reporting
 * @return 0 on success, 1 on a failed operation, 2 on a usage error
 */
int run_command(const CliOptions& options, const std::vector<std::string>& command,
                std::istream& in, std::ostream& out, std::ostream& err);

} // namespace fluent

#endif // FLUENT_CLI_HPP
