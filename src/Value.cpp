/**
 * @file Value.cpp
 * @brief Scalar conversions over the Value model
 */

#include "fluent/Value.hpp"
#include "fluent/Errors.hpp"

#include <cctype>
#include <cstdint>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace fluent {

std::optional<double> parse_numeric(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (begin == end) {
        return std::nullopt;
    }

    size_t i = begin;
    if (text[i] == '+' || text[i] == '-') ++i;

    size_t int_digits = 0;
    while (i < end && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++int_digits; }

    size_t frac_digits = 0;
    if (i < end && text[i] == '.') {
        ++i;
        while (i < end && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++frac_digits; }
    }
    if (int_digits == 0 && frac_digits == 0) {
        return std::nullopt;
    }

    if (i < end && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < end && (text[i] == '+' || text[i] == '-')) ++i;
        size_t exp_digits = 0;
        while (i < end && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++exp_digits; }
        if (exp_digits == 0) {
            return std::nullopt;
        }
    }
    if (i != end) {
        return std::nullopt;
    }

    const std::string trimmed = text.substr(begin, end - begin);
    return std::strtod(trimmed.c_str(), nullptr);
}

bool is_numeric(const Value& val) {
    if (val.is_number()) return true;
    if (val.is_string()) return parse_numeric(val.get_ref<const std::string&>()).has_value();
    return false;
}

double to_number(const Value& val) {
    if (val.is_number()) return val.get<double>();
    if (val.is_boolean()) return val.get<bool>() ? 1.0 : 0.0;
    if (val.is_string()) {
        auto parsed = parse_numeric(val.get_ref<const std::string&>());
        return parsed ? *parsed : 0.0;
    }
    return 0.0;
}

namespace {
    /**
     * @brief Shortest decimal representation of a double that parses back
     *        to the same value
     */
    std::string format_double(double d) {
        if (std::isnan(d)) return "NAN";
        if (std::isinf(d)) return d > 0 ? "INF" : "-INF";

        char buf[32];
        for (int precision = 1; precision <= 17; ++precision) {
            std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
            if (std::strtod(buf, nullptr) == d) {
                break;
            }
        }
        return buf;
    }
}

std::string to_string(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null:
            return "";
        case Value::value_t::boolean:
            return val.get<bool>() ? "1" : "";
        case Value::value_t::number_integer:
            return std::to_string(val.get<std::int64_t>());
        case Value::value_t::number_unsigned:
            return std::to_string(val.get<std::uint64_t>());
        case Value::value_t::number_float:
            return format_double(val.get<double>());
        case Value::value_t::string:
            return val.get<std::string>();
        default:
            return val.dump();
    }
}

bool truthy(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null:
            return false;
        case Value::value_t::boolean:
            return val.get<bool>();
        case Value::value_t::number_integer:
            return val.get<std::int64_t>() != 0;
        case Value::value_t::number_unsigned:
            return val.get<std::uint64_t>() != 0;
        case Value::value_t::number_float:
            return val.get<double>() != 0.0;
        case Value::value_t::string: {
            const auto& s = val.get_ref<const std::string&>();
            return !s.empty() && s != "0";
        }
        case Value::value_t::array:
        case Value::value_t::object:
            return !val.empty();
        default:
            return false;
    }
}

std::optional<std::int64_t> exact_int64(const Value& val) {
    if (val.is_number_unsigned()) {
        const auto u = val.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(u);
    }
    if (val.is_number_integer()) {
        return val.get<std::int64_t>();
    }
    return std::nullopt;
}

Value add(const Value& lhs, const Value& rhs) {
    const auto a = exact_int64(lhs);
    const auto b = exact_int64(rhs);
    if (a && b) {
        constexpr auto lo = std::numeric_limits<std::int64_t>::min();
        constexpr auto hi = std::numeric_limits<std::int64_t>::max();
        const bool overflows = (*b > 0 && *a > hi - *b) || (*b < 0 && *a < lo - *b);
        if (!overflows) {
            return *a + *b;
        }
    }
    return to_number(lhs) + to_number(rhs);
}

Value divide(const Value& lhs, const Value& rhs) {
    if (to_number(rhs) == 0.0) {
        throw InvalidArgumentError("Division by zero");
    }
    const auto a = exact_int64(lhs);
    const auto b = exact_int64(rhs);
    // INT64_MIN / -1 has no int64 result
    if (a && b && !(*b == -1 && *a == std::numeric_limits<std::int64_t>::min())) {
        if (*a % *b == 0) {
            return *a / *b;
        }
    }
    return to_number(lhs) / to_number(rhs);
}

} // namespace fluent
