/**
 * @file Key.cpp
 * @brief Implementation of collection keys
 */

#include "fluent/Key.hpp"

#include <cerrno>
#include <cstdlib>

namespace fluent {

bool is_integer_key(const std::string& text) {
    if (text.empty() || text.size() > 20) return false;

    size_t i = 0;
    if (text[0] == '-') {
        if (text.size() == 1) return false;
        i = 1;
        // "-0" is not canonical
        if (text[1] == '0') return false;
    }
    if (text[i] == '0' && text.size() > i + 1) return false;

    for (; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') return false;
    }

    errno = 0;
    std::strtoll(text.c_str(), nullptr, 10);
    return errno != ERANGE;
}

Key::Key(std::string name) {
    if (is_integer_key(name)) {
        repr_ = static_cast<std::int64_t>(std::strtoll(name.c_str(), nullptr, 10));
    } else {
        repr_ = std::move(name);
    }
}

std::optional<Key> Key::from_value(const Value& val) {
    if (val.is_number_integer()) {
        return Key(val.get<std::int64_t>());
    }
    if (val.is_string()) {
        return Key(val.get<std::string>());
    }
    return std::nullopt;
}

std::string Key::str() const {
    if (is_int()) {
        return std::to_string(as_int());
    }
    return as_string();
}

Value Key::to_value() const {
    if (is_int()) {
        return as_int();
    }
    return as_string();
}

std::size_t Key::hash() const noexcept {
    if (is_int()) {
        return std::hash<std::int64_t>{}(std::get<std::int64_t>(repr_));
    }
    return std::hash<std::string>{}(std::get<std::string>(repr_)) ^ 0x9e3779b97f4a7c15ULL;
}

} // namespace fluent
