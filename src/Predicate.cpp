/**
 * @file Predicate.cpp
 * @brief Implementation of the query filters
 */

#include "fluent/Predicate.hpp"
#include "fluent/DotPath.hpp"
#include "fluent/Util.hpp"

#include <vector>

namespace fluent {

namespace {

    std::string fold(const std::string& text) {
        return to_lower(fold_ascii(text));
    }

    bool starts_with(const std::string& text, const std::string& prefix) {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    bool ends_with(const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::vector<Value> members_of(const Value& values) {
        std::vector<Value> members;
        if (is_container(values)) {
            for (const auto& member : values) {
                members.push_back(member);
            }
        } else {
            members.push_back(values);
        }
        return members;
    }

} // namespace

// ============================================================================
// LikePattern
// ============================================================================

LikePattern LikePattern::parse(const std::string& pattern, bool strict) {
    const bool leading = !pattern.empty() && pattern.front() == '%';
    const bool trailing = pattern.size() > 1 && pattern.back() == '%';

    Kind kind = Kind::Exact;
    std::string needle = pattern;
    if (leading && trailing) {
        kind = Kind::Contains;
        needle = pattern.substr(1, pattern.size() - 2);
    } else if (leading) {
        kind = Kind::EndsWith;
        needle = pattern.substr(1);
    } else if (trailing) {
        kind = Kind::StartsWith;
        needle = pattern.substr(0, pattern.size() - 1);
    }

    if (!strict) {
        needle = fold(needle);
    }
    return LikePattern(kind, std::move(needle), strict);
}

bool LikePattern::matches(const Value& value) const {
    if (!value.is_string() && !value.is_number()) {
        return false;
    }

    const std::string text = strict_ ? to_string(value) : fold(to_string(value));
    switch (kind_) {
        case Kind::Contains:
            return text.find(needle_) != std::string::npos;
        case Kind::StartsWith:
            return starts_with(text, needle_);
        case Kind::EndsWith:
            return ends_with(text, needle_);
        case Kind::Exact:
            return text == needle_;
    }
    return false;
}

// ============================================================================
// Filters
// ============================================================================

Predicate where_filter(const std::string& path, const Value& value, const std::string& op) {
    const Operator parsed = parse_operator(op);
    auto segments = split_dot_path(path);

    return [segments = std::move(segments), value, parsed](const Value& item) {
        PathLookup lookup = resolve_path(item, segments);
        return lookup.found && compare(*lookup.value, parsed, value);
    };
}

Predicate between_filter(const std::string& path, const Value& min, const Value& max,
                         bool negate) {
    auto segments = split_dot_path(path);

    return [segments = std::move(segments), min, max, negate](const Value& item) {
        PathLookup lookup = resolve_path(item, segments);
        if (!lookup.found) {
            return false;
        }
        const Value& v = *lookup.value;
        if (negate) {
            return loose_compare(v, min) < 0 || loose_compare(v, max) > 0;
        }
        return loose_compare(v, min) >= 0 && loose_compare(v, max) <= 0;
    };
}

Predicate in_filter(const std::string& path, const Value& values, bool strict, bool negate) {
    auto segments = split_dot_path(path);
    auto members = members_of(values);

    return [segments = std::move(segments), members = std::move(members), strict,
            negate](const Value& item) {
        PathLookup lookup = resolve_path(item, segments);
        if (!lookup.found) {
            return false;
        }

        bool member = false;
        for (const auto& candidate : members) {
            if (strict ? strict_equals(*lookup.value, candidate)
                       : loose_equals(*lookup.value, candidate)) {
                member = true;
                break;
            }
        }
        return member != negate;
    };
}

Predicate like_filter(const std::string& path, const std::string& pattern, bool strict) {
    auto segments = split_dot_path(path);
    LikePattern like = LikePattern::parse(pattern, strict);

    return [segments = std::move(segments), like = std::move(like)](const Value& item) {
        PathLookup lookup = resolve_path(item, segments);
        return lookup.found && like.matches(*lookup.value);
    };
}

Predicate null_filter(const std::string& path, bool negate) {
    auto segments = split_dot_path(path);

    return [segments = std::move(segments), negate](const Value& item) {
        PathLookup lookup = resolve_path(item, segments);
        return lookup.found && lookup.value->is_null() != negate;
    };
}

Predicate not_empty_filter(const std::string& path) {
    auto segments = split_dot_path(path);

    return [segments = std::move(segments)](const Value& item) {
        PathLookup lookup = resolve_path(item, segments);
        return lookup.found && truthy(*lookup.value);
    };
}

} // namespace fluent
