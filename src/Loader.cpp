/**
 * @file Loader.cpp
 * @brief JSON and TOML file loading, TOML rendering
 */

#include "fluent/Loader.hpp"
#include "fluent/Errors.hpp"
#include "fluent/Util.hpp"

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace fluent {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
Value as_text(const T& temporal) {
    std::ostringstream ss;
    ss << temporal;
    return Value(ss.str());
}

Value from_toml(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());
        case toml::node_type::integer:
            return Value(node.as_integer()->get());
        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());
        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());
        case toml::node_type::date:
            return as_text(node.as_date()->get());
        case toml::node_type::time:
            return as_text(node.as_time()->get());
        case toml::node_type::date_time:
            return as_text(node.as_date_time()->get());

        case toml::node_type::array: {
            Value list = Value::array();
            for (const auto& elem : *node.as_array()) {
                list.push_back(from_toml(elem));
            }
            return list;
        }

        case toml::node_type::table: {
            Value object = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                object[std::string(key.str())] = from_toml(val);
            }
            return object;
        }

        default:
            return Value(nullptr);
    }
}

// ---- Value -> TOML ---------------------------------------------------------

toml::table to_table(const Value& object);

toml::array to_array(const Value& list);

/// Append a scalar through `put`, which receives the toml-native value
template <typename Put>
void put_scalar(const Value& v, Put&& put) {
    if (v.is_string()) {
        put(v.get<std::string>());
    } else if (v.is_boolean()) {
        put(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            put(static_cast<std::int64_t>(u));
        } else {
            put(static_cast<double>(u));
        }
    } else if (v.is_number_integer()) {
        put(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        put(v.get<double>());
    } else {
        put(std::string{});
    }
}

toml::array to_array(const Value& list) {
    toml::array out;
    for (const auto& elem : list) {
        if (elem.is_object()) {
            out.push_back(to_table(elem));
        } else if (elem.is_array()) {
            out.push_back(to_array(elem));
        } else {
            put_scalar(elem, [&out](auto&& scalar) { out.push_back(std::forward<decltype(scalar)>(scalar)); });
        }
    }
    return out;
}

toml::table to_table(const Value& object) {
    toml::table tbl;
    for (auto it = object.begin(); it != object.end(); ++it) {
        const std::string& key = it.key();
        const Value& v = it.value();
        if (v.is_object()) {
            tbl.insert(key, to_table(v));
        } else if (v.is_array()) {
            tbl.insert(key, to_array(v));
        } else {
            put_scalar(v, [&tbl, &key](auto&& scalar) {
                tbl.insert(key, std::forward<decltype(scalar)>(scalar));
            });
        }
    }
    return tbl;
}

} // anonymous namespace

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        Value document = Value::parse(content);
        spdlog::debug("Loaded JSON file '{}' ({})", path, type_name(document));
        return document;
    } catch (const Value::parse_error& e) {
        throw ParseError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << "line " << e.source().begin.line << ", column " << e.source().begin.column
                << ": " << e.description();
        throw ParseError(path, details.str());
    }

    Value document = from_toml(table);
    spdlog::debug("Loaded TOML file '{}' ({} top-level keys)", path, document.size());
    return document;
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_data_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw InvalidArgumentError("Unsupported data file type: '" + ext + "' (expected .json or .toml)");
}

std::string to_toml_string(const Value& value) {
    toml::table root;
    if (value.is_object()) {
        root = to_table(value);
    } else {
        Value wrapped = Value::object();
        wrapped["value"] = value;
        root = to_table(wrapped);
    }

    std::ostringstream oss;
    oss << root;
    return oss.str();
}

} // namespace fluent
