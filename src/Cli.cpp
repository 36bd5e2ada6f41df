/**
 * @file Cli.cpp
 * @brief Command dispatch for fluent-cli
 */

#include "fluent/Cli.hpp"
#include "fluent/Collection.hpp"
#include "fluent/DotPath.hpp"
#include "fluent/Loader.hpp"
#include "fluent/Util.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <istream>
#include <ostream>

namespace fluent {

namespace {

    void expect_args(const std::vector<std::string>& command, std::size_t min, std::size_t max) {
        const std::size_t given = command.size() - 1;
        if (given < min || given > max) {
            throw UsageError("wrong number of arguments for '" + command[0] + "'");
        }
    }

    /// Optional PATH argument: the item itself when omitted
    Extractor optional_path(const std::vector<std::string>& command) {
        expect_args(command, 0, 1);
        return command.size() > 1 ? Extractor(command[1]) : Extractor();
    }

    /// "[1,2]" or "1,2" → [1, 2]
    Value parse_list(const std::string& raw) {
        Value parsed = parse_json_or_string(raw);
        if (parsed.is_array()) {
            return parsed;
        }
        Value list = Value::array();
        for (const auto& part : split(raw, ',')) {
            list.push_back(parse_json_or_string(trim(part)));
        }
        return list;
    }

    Collection sorted(const Collection& collection, const std::vector<std::string>& command) {
        if (command.size() == 1) {
            return collection.sort();
        }

        Collection result;
        for (std::size_t i = 1; i < command.size(); ++i) {
            std::string path = command[i];
            const bool descending = !path.empty() && path[0] == '-';
            if (descending) {
                path.erase(0, 1);
            }
            result = i == 1 ? collection.sort_by(path, descending)
                            : result.then_by(path, descending);
        }
        return result;
    }

} // namespace

Value parse_json_or_string(const std::string& raw) {
    Value parsed = Value::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return Value(raw);
    }
    return parsed;
}

Value read_document(const CliOptions& options, std::istream& in) {
    Value document;
    if (options.input) {
        document = load_data_file(*options.input);
    } else {
        try {
            document = Value::parse(in);
        } catch (const Value::parse_error& e) {
            throw ParseError("<stdin>", e.what());
        }
    }

    if (options.path.empty()) {
        return document;
    }

    PathLookup lookup = resolve_path(document, options.path);
    if (!lookup) {
        throw InvalidArgumentError("Path '" + options.path + "' not found in input");
    }
    return *lookup.value;
}

Value run_query(const Value& document, const std::vector<std::string>& command, bool strict) {
    if (command.empty()) {
        throw UsageError("missing command");
    }

    const Collection collection(document);
    const std::string& name = command[0];
    spdlog::debug("Running '{}' on {} items", name, collection.count());

    if (name == "dump") {
        expect_args(command, 0, 0);
        return collection.to_array();
    }
    if (name == "keys") {
        expect_args(command, 0, 0);
        return collection.keys().to_array();
    }
    if (name == "count") {
        return static_cast<std::int64_t>(collection.count(optional_path(command)));
    }
    if (name == "where") {
        expect_args(command, 2, 3);
        if (command.size() == 3) {
            return collection.where(command[1], parse_json_or_string(command[2])).to_array();
        }
        return collection.where(command[1], parse_json_or_string(command[3]), command[2]).to_array();
    }
    if (name == "like") {
        expect_args(command, 2, 2);
        return collection.where_like(command[1], command[2], strict).to_array();
    }
    if (name == "in") {
        expect_args(command, 2, 2);
        return collection.where_in(command[1], parse_list(command[2]), strict).to_array();
    }
    if (name == "between") {
        expect_args(command, 3, 3);
        return collection
            .where_between(command[1], parse_json_or_string(command[2]), parse_json_or_string(command[3]))
            .to_array();
    }
    if (name == "sort") {
        return sorted(collection, command).to_array();
    }
    if (name == "sum") {
        return collection.sum(optional_path(command));
    }
    if (name == "avg") {
        return collection.avg(optional_path(command));
    }
    if (name == "min") {
        return collection.min(optional_path(command));
    }
    if (name == "max") {
        return collection.max(optional_path(command));
    }
    if (name == "median") {
        return collection.median(optional_path(command));
    }
    if (name == "mode") {
        return collection.mode(optional_path(command));
    }
    if (name == "unique") {
        return collection.unique(optional_path(command), strict).to_array();
    }
    if (name == "first") {
        expect_args(command, 0, 0);
        return collection.first();
    }
    if (name == "last") {
        expect_args(command, 0, 0);
        return collection.last();
    }

    throw UsageError("unknown command '" + name + "'");
}

std::string render(const Value& result, const CliOptions& options) {
    if (options.format == "toml") {
        return to_toml_string(result);
    }
    if (options.format != "json") {
        throw UsageError("unknown output format '" + options.format + "' (expected json or toml)");
    }
    return result.dump(options.indent);
}

int run_command(const CliOptions& options, const std::vector<std::string>& command,
                std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        const Value document = read_document(options, in);
        out << render(run_query(document, command, options.strict), options) << "\n";
        return 0;
    } catch (const UsageError& e) {
        err << "Usage error: " << e.what() << "\n";
        return 2;
    } catch (const CollectionError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace fluent
