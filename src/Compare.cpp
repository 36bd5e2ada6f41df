/**
 * @file Compare.cpp
 * @brief Implementation of loose/strict comparison and collation
 */

#include "fluent/Compare.hpp"
#include "fluent/Errors.hpp"
#include "fluent/Items.hpp"
#include "fluent/Util.hpp"

#include <cstdint>

namespace fluent {

Operator parse_operator(const std::string& op) {
    if (op == "=" || op == "==") return Operator::Equal;
    if (op == "===") return Operator::Identical;
    if (op == "!=" || op == "<>") return Operator::NotEqual;
    if (op == "!==") return Operator::NotIdentical;
    if (op == "<") return Operator::Less;
    if (op == ">") return Operator::Greater;
    if (op == "<=") return Operator::LessOrEqual;
    if (op == ">=") return Operator::GreaterOrEqual;
    if (op == "<=>") return Operator::Spaceship;
    throw InvalidOperatorError(op);
}

namespace {

    template <typename T>
    int three_way(const T& a, const T& b) {
        if (a < b) return -1;
        if (b < a) return 1;
        return 0;
    }

    int compare_strings(const std::string& a, const std::string& b) {
        const int cmp = a.compare(b);
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }

    bool is_integral(const Value& v) {
        return v.is_number_integer();
    }

    /**
     * @brief Compare two numbers, exactly when both are integers
     */
    int compare_numbers(const Value& a, const Value& b) {
        if (is_integral(a) && is_integral(b)) {
            const bool ua = a.is_number_unsigned();
            const bool ub = b.is_number_unsigned();
            if (ua && ub) {
                return three_way(a.get<std::uint64_t>(), b.get<std::uint64_t>());
            }
            if (!ua && !ub) {
                return three_way(a.get<std::int64_t>(), b.get<std::int64_t>());
            }
            // One unsigned, one signed
            if (ua) {
                const auto sb = b.get<std::int64_t>();
                if (sb < 0) return 1;
                return three_way(a.get<std::uint64_t>(), static_cast<std::uint64_t>(sb));
            }
            const auto sa = a.get<std::int64_t>();
            if (sa < 0) return -1;
            return three_way(static_cast<std::uint64_t>(sa), b.get<std::uint64_t>());
        }
        return three_way(a.get<double>(), b.get<double>());
    }

    int compare_number_string(const Value& number, const std::string& text) {
        if (auto parsed = parse_numeric(text)) {
            return three_way(number.get<double>(), *parsed);
        }
        return compare_strings(to_string(number), text);
    }

    int compare_containers(const Value& a, const Value& b) {
        if (a.size() != b.size()) {
            return a.size() < b.size() ? -1 : 1;
        }

        const Items lhs = Items::from_value(a);
        const Items rhs = Items::from_value(b);
        for (const auto& [key, value] : lhs) {
            const Value* other = rhs.find(key);
            if (other == nullptr) {
                // Not comparable; the left side counts as greater
                return 1;
            }
            const int cmp = loose_compare(value, *other);
            if (cmp != 0) return cmp;
        }
        return 0;
    }

    enum class Family { Null, Boolean, Integer, Float, String, Array, Object, Other };

    Family family_of(const Value& v) {
        switch (v.type()) {
            case Value::value_t::null: return Family::Null;
            case Value::value_t::boolean: return Family::Boolean;
            case Value::value_t::number_integer:
            case Value::value_t::number_unsigned: return Family::Integer;
            case Value::value_t::number_float: return Family::Float;
            case Value::value_t::string: return Family::String;
            case Value::value_t::array: return Family::Array;
            case Value::value_t::object: return Family::Object;
            default: return Family::Other;
        }
    }

} // namespace

int loose_compare(const Value& a, const Value& b) {
    if (a.is_null() && b.is_null()) {
        return 0;
    }

    if (a.is_boolean() || b.is_boolean()) {
        return three_way(truthy(a), truthy(b));
    }

    if (a.is_null()) {
        if (b.is_string()) return compare_strings("", b.get_ref<const std::string&>());
        return three_way(false, truthy(b));
    }
    if (b.is_null()) {
        if (a.is_string()) return compare_strings(a.get_ref<const std::string&>(), "");
        return three_way(truthy(a), false);
    }

    if (a.is_number() && b.is_number()) {
        return compare_numbers(a, b);
    }
    if (a.is_number() && b.is_string()) {
        return compare_number_string(a, b.get_ref<const std::string&>());
    }
    if (a.is_string() && b.is_number()) {
        return -compare_number_string(b, a.get_ref<const std::string&>());
    }

    if (a.is_string() && b.is_string()) {
        const auto& sa = a.get_ref<const std::string&>();
        const auto& sb = b.get_ref<const std::string&>();
        auto na = parse_numeric(sa);
        auto nb = parse_numeric(sb);
        if (na && nb) {
            return three_way(*na, *nb);
        }
        return compare_strings(sa, sb);
    }

    const bool ca = is_container(a);
    const bool cb = is_container(b);
    if (ca && cb) {
        return compare_containers(a, b);
    }
    if (ca) return 1;
    if (cb) return -1;

    return compare_strings(to_string(a), to_string(b));
}

bool loose_equals(const Value& lhs, const Value& rhs) {
    return loose_compare(lhs, rhs) == 0;
}

bool strict_equals(const Value& lhs, const Value& rhs) {
    const Family family = family_of(lhs);
    if (family != family_of(rhs)) {
        return false;
    }

    switch (family) {
        case Family::Null:
            return true;
        case Family::Boolean:
            return lhs.get<bool>() == rhs.get<bool>();
        case Family::Integer:
            return compare_numbers(lhs, rhs) == 0;
        case Family::Float:
            return lhs.get<double>() == rhs.get<double>();
        case Family::String:
            return lhs.get_ref<const std::string&>() == rhs.get_ref<const std::string&>();
        case Family::Array: {
            if (lhs.size() != rhs.size()) return false;
            for (size_t i = 0; i < lhs.size(); ++i) {
                if (!strict_equals(lhs[i], rhs[i])) return false;
            }
            return true;
        }
        case Family::Object: {
            if (lhs.size() != rhs.size()) return false;
            auto it = lhs.begin();
            auto jt = rhs.begin();
            for (; it != lhs.end(); ++it, ++jt) {
                if (it.key() != jt.key() || !strict_equals(it.value(), jt.value())) {
                    return false;
                }
            }
            return true;
        }
        default:
            return lhs == rhs;
    }
}

int spaceship(const Value& lhs, const Value& rhs) {
    return loose_compare(lhs, rhs);
}

bool compare(const Value& lhs, Operator op, const Value& rhs) {
    switch (op) {
        case Operator::Equal:
            return loose_equals(lhs, rhs);
        case Operator::Identical:
            return strict_equals(lhs, rhs);
        case Operator::NotEqual:
            return !loose_equals(lhs, rhs);
        case Operator::NotIdentical:
            return !strict_equals(lhs, rhs);
        case Operator::Less:
            return loose_compare(lhs, rhs) < 0;
        case Operator::Greater:
            return loose_compare(lhs, rhs) > 0;
        case Operator::LessOrEqual:
            return loose_compare(lhs, rhs) <= 0;
        case Operator::GreaterOrEqual:
            return loose_compare(lhs, rhs) >= 0;
        case Operator::Spaceship:
            return spaceship(lhs, rhs) != 0;
    }
    return false;
}

bool compare(const Value& lhs, const std::string& op, const Value& rhs) {
    return compare(lhs, parse_operator(op), rhs);
}

int collate(const Value& lhs, const Value& rhs, const SortOptions& options) {
    switch (options.mode) {
        case SortMode::Regular:
            return loose_compare(lhs, rhs);
        case SortMode::Numeric:
            return three_way(to_number(lhs), to_number(rhs));
        case SortMode::String: {
            if (options.fold_case) {
                return compare_strings(to_lower(to_string(lhs)), to_lower(to_string(rhs)));
            }
            return compare_strings(to_string(lhs), to_string(rhs));
        }
        case SortMode::Natural:
            return natural_compare(to_string(lhs), to_string(rhs), options.fold_case);
    }
    return 0;
}

} // namespace fluent
