/**
 * @file Callable.hpp
 * @brief Callback adapters shared by the collection types
 *
 * Callbacks receive `(value, key)` or just `(value)`, chosen by what the
 * callable accepts. Extractor additionally accepts a dot-path string in
 * place of a callable.
 */

#ifndef FLUENT_CALLABLE_HPP
#define FLUENT_CALLABLE_HPP

#include "fluent/DotPath.hpp"
#include "fluent/Key.hpp"
#include "fluent/Value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace fluent {

namespace detail {
    template <typename R, typename T>
    R convert_result(T&& result) {
        if constexpr (std::is_same_v<R, bool> && std::is_same_v<std::decay_t<T>, Value>) {
            return truthy(result);
        } else {
            return R(std::forward<T>(result));
        }
    }

    template <typename R, typename F, typename... Args>
    R invoke_as(F& fn, Args&&... args) {
        if constexpr (std::is_void_v<std::invoke_result_t<F&, Args...>>) {
            // Callbacks returning nothing never stop an iteration
            fn(std::forward<Args>(args)...);
            return R(true);
        } else {
            return convert_result<R>(fn(std::forward<Args>(args)...));
        }
    }

    template <typename F>
    constexpr bool takes_item_and_key = std::is_invocable_v<F&, const Value&, const Key&>;

    template <typename F>
    constexpr bool takes_item = std::is_invocable_v<F&, const Value&>;
}

/**
 * @brief Type-erased `R(const Value&, const Key&)` built from a callable
 *        taking either `(value, key)` or `(value)`.
 */
template <typename R>
class ItemFunction {
public:
    using function_type = std::function<R(const Value&, const Key&)>;

    ItemFunction() = default;

    template <typename F,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, ItemFunction> &&
                                          (detail::takes_item_and_key<std::decay_t<F>> ||
                                           detail::takes_item<std::decay_t<F>>)>>
    ItemFunction(F&& fn) {
        using Fn = std::decay_t<F>;
        if constexpr (detail::takes_item_and_key<Fn>) {
            fn_ = [fn = Fn(std::forward<F>(fn))](const Value& value, const Key& key) mutable -> R {
                return detail::invoke_as<R>(fn, value, key);
            };
        } else {
            fn_ = [fn = Fn(std::forward<F>(fn))](const Value& value, const Key&) mutable -> R {
                return detail::invoke_as<R>(fn, value);
            };
        }
    }

    R operator()(const Value& value, const Key& key) const { return fn_(value, key); }

    explicit operator bool() const noexcept { return static_cast<bool>(fn_); }

private:
    function_type fn_;
};

using Predicate = ItemFunction<bool>;
using Mapper = ItemFunction<Value>;

/// Accumulator: `(carry, value, key) -> carry`
using Reducer = std::function<Value(const Value& carry, const Value& value, const Key& key)>;

/**
 * @brief What an aggregate or sort reads from each item.
 *
 * - default constructed: the item itself
 * - a dot-path: the value at that path, absent when the path does not
 *   resolve
 * - a callable: whatever it returns, always present
 */
class Extractor {
public:
    Extractor() = default;

    Extractor(std::string path)
        : kind_(Kind::Path), path_(std::move(path)), segments_(split_dot_path(path_)) {}

    Extractor(const char* path) : Extractor(std::string(path)) {}

    Extractor(int index) : Extractor(std::to_string(index)) {}

    template <typename F,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, Extractor> &&
                                          (detail::takes_item_and_key<std::decay_t<F>> ||
                                           detail::takes_item<std::decay_t<F>>)>>
    Extractor(F&& fn) : kind_(Kind::Function), fn_(std::forward<F>(fn)) {}

    /**
     * @brief Read from one item
     * @return The extracted value, or nullopt when a path does not resolve
     */
    std::optional<Value> operator()(const Value& item, const Key& key) const {
        switch (kind_) {
            case Kind::Identity:
                return item;
            case Kind::Path: {
                PathLookup lookup = resolve_path(item, segments_);
                if (!lookup.found) {
                    return std::nullopt;
                }
                return *lookup.value;
            }
            case Kind::Function:
                return fn_(item, key);
        }
        return std::nullopt;
    }

    bool is_identity() const noexcept { return kind_ == Kind::Identity; }
    bool is_path() const noexcept { return kind_ == Kind::Path; }
    bool is_function() const noexcept { return kind_ == Kind::Function; }

    const std::string& path() const noexcept { return path_; }

private:
    enum class Kind { Identity, Path, Function };

    Kind kind_ = Kind::Identity;
    std::string path_;
    std::vector<std::string> segments_;
    Mapper fn_;
};

} // namespace fluent

#endif // FLUENT_CALLABLE_HPP
