/**
 * @file Key.hpp
 * @brief Key type of an ordered collection mapping
 *
 * A key is either a 64-bit integer or a string. Strings holding a
 * canonical decimal integer ("7", "-3") normalize to the integer key, so
 * `Key("7") == Key(7)`. Strings such as "07", "-0", "+7" or "7.0" stay
 * strings.
 */

#ifndef FLUENT_KEY_HPP
#define FLUENT_KEY_HPP

#include "fluent/Value.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace fluent {

class Key {
public:
    Key() : repr_(std::int64_t{0}) {}
    Key(int index) : repr_(std::int64_t{index}) {}
    Key(std::int64_t index) : repr_(index) {}
    Key(std::size_t index) : repr_(static_cast<std::int64_t>(index)) {}
    Key(const char* name) : Key(std::string(name)) {}
    Key(std::string name);

    /**
     * @brief Convert a Value into a key.
     *
     * Only integers and strings can be keys; every other type yields
     * nullopt.
     */
    static std::optional<Key> from_value(const Value& val);

    bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(repr_); }
    bool is_string() const noexcept { return !is_int(); }

    std::int64_t as_int() const { return std::get<std::int64_t>(repr_); }
    const std::string& as_string() const { return std::get<std::string>(repr_); }

    /// Textual form used for object keys and dot paths
    std::string str() const;

    /// Integer keys become JSON integers, string keys JSON strings
    Value to_value() const;

    bool operator==(const Key& other) const { return repr_ == other.repr_; }
    bool operator!=(const Key& other) const { return !(*this == other); }

    /// Integers order before strings; within a kind the natural order applies
    bool operator<(const Key& other) const { return repr_ < other.repr_; }

    std::size_t hash() const noexcept;

private:
    std::variant<std::int64_t, std::string> repr_;
};

/**
 * @brief Check if a string is a canonical decimal integer key ("0", "12", "-4")
 */
bool is_integer_key(const std::string& text);

struct KeyHash {
    std::size_t operator()(const Key& key) const noexcept { return key.hash(); }
};

} // namespace fluent

namespace std {
template <>
struct hash<fluent::Key> {
    std::size_t operator()(const fluent::Key& key) const noexcept { return key.hash(); }
};
} // namespace std

#endif // FLUENT_KEY_HPP
