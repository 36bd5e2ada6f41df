/**
 * @file Macros.hpp
 * @brief Per-type table of user-registered operations
 *
 * A macro is a named function registered at runtime and invoked through
 * the receiving type's `call()`. Each receiving type owns one process-wide
 * table. The table is not synchronized: register macros before sharing
 * collections between threads.
 *
 * Usage:
 * ```cpp
 * Collection::macro("double_all", [](Collection& self, const std::vector<Value>&) {
 *     return self.map([](const Value& v) { return v.get<int>() * 2; }).to_array();
 * });
 * Value doubled = collect(Value::parse("[1, 2]")).call("double_all");
 * ```
 */

#ifndef FLUENT_MACROS_HPP
#define FLUENT_MACROS_HPP

#include "fluent/Errors.hpp"
#include "fluent/Value.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fluent {

/**
 * @brief Name → function table for one receiving type
 *
 * @tparam Target Receiving type; must expose `static constexpr const char* kTypeName`
 */
template <typename Target>
class MacroRegistry {
public:
    using Function = std::function<Value(Target&, const std::vector<Value>&)>;

    /// The process-wide table for Target
    static MacroRegistry& instance() {
        static MacroRegistry registry;
        return registry;
    }

    /**
     * @brief Register `fn` under `name`, replacing any previous registration
     */
    void add(const std::string& name, Function fn) {
        if (table_.count(name) > 0) {
            spdlog::warn("{} macro '{}' registered again; the previous one is replaced",
                         Target::kTypeName, name);
        } else {
            spdlog::debug("{} macro '{}' registered", Target::kTypeName, name);
        }
        table_[name] = std::move(fn);
    }

    bool contains(const std::string& name) const {
        return table_.count(name) > 0;
    }

    /// @return true when a registration was removed
    bool remove(const std::string& name) {
        return table_.erase(name) > 0;
    }

    /**
     * @brief Invoke the macro registered under `name`
     * @throws BadMethodCallError when nothing is registered under `name`
     */
    Value call(const std::string& name, Target& self, const std::vector<Value>& args) const {
        auto it = table_.find(name);
        if (it == table_.end()) {
            throw BadMethodCallError(Target::kTypeName, name);
        }
        return it->second(self, args);
    }

private:
    MacroRegistry() = default;

    std::unordered_map<std::string, Function> table_;
};

} // namespace fluent

#endif // FLUENT_MACROS_HPP
