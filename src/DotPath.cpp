/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "fluent/DotPath.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <numeric>
#include <utility>

namespace fluent {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    if (path.empty()) {
        return segments;
    }

    std::string::size_type begin = 0;
    for (;;) {
        const auto dot = path.find('.', begin);
        segments.emplace_back(path, begin, dot == std::string::npos ? std::string::npos : dot - begin);
        if (dot == std::string::npos) {
            break;
        }
        begin = dot + 1;
    }
    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return {};
    }
    return std::accumulate(std::next(segments.begin()), segments.end(), segments.front(),
                           [](std::string joined, const std::string& segment) {
                               return std::move(joined) + '.' + segment;
                           });
}

namespace {

    // Canonical non-negative index: digits only, no leading zero
    bool is_array_index(const std::string& segment) {
        if (segment.empty() || segment.size() > 18 || (segment.size() > 1 && segment[0] == '0')) {
            return false;
        }
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    /**
     * @brief Step one level down
     * @return Child value, or nullptr if the segment is absent
     */
    const Value* child_of(const Value& current, const std::string& seg) {
        if (current.is_object()) {
            auto it = current.find(seg);
            return it == current.end() ? nullptr : &*it;
        }

        if (current.is_array()) {
            if (!is_array_index(seg)) {
                return nullptr;
            }
            size_t idx = std::stoull(seg);
            if (idx >= current.size()) {
                return nullptr;
            }
            return &current[idx];
        }

        return nullptr;
    }

    /// Walk every segment without the partial-match leniency
    const Value* strict_walk(const Value& data, const std::string& path) {
        const Value* current = &data;
        for (const auto& seg : split_dot_path(path)) {
            current = child_of(*current, seg);
            if (current == nullptr) {
                break;
            }
        }
        return current;
    }

} // namespace

PathLookup resolve_path(const Value& data, const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return {&data, true};
    }

    const Value* current = &data;

    for (size_t i = 0; i < segments.size(); ++i) {
        const Value* next = child_of(*current, segments[i]);
        if (next == nullptr) {
            return {};
        }

        const bool more_segments = i + 1 < segments.size();
        if (more_segments && !is_container(*next)) {
            // Partial match: a scalar sits where the path wants to descend.
            return {next, true};
        }

        current = next;
    }

    return {current, true};
}

PathLookup resolve_path(const Value& data, const std::string& path) {
    return resolve_path(data, split_dot_path(path));
}

const Value* get_by_dot(const Value& data, const std::string& path,
                        const Value& default_val) {
    const Value* found = strict_walk(data, path);
    return found ? found : &default_val;
}

bool contains_dot(const Value& data, const std::string& path) {
    return strict_walk(data, path) != nullptr;
}

} // namespace fluent
