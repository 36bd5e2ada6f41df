/**
 * @file Enumerable.hpp
 * @brief Contract shared by the eager and the lazy collection
 */

#ifndef FLUENT_ENUMERABLE_HPP
#define FLUENT_ENUMERABLE_HPP

#include "fluent/Items.hpp"
#include "fluent/Value.hpp"

#include <cstddef>
#include <string>

namespace fluent {

/**
 * @brief Read side common to Collection and LazyCollection
 *
 * For a lazy collection every call enumerates its source again.
 */
class Enumerable {
public:
    virtual ~Enumerable() = default;

    /// Every entry, in order
    virtual Items all() const = 0;

    virtual std::size_t count() const = 0;

    virtual bool is_empty() const { return count() == 0; }
    bool is_not_empty() const { return !is_empty(); }

    /**
     * @brief Plain nested Value: an array for list-shaped items, an object
     *        otherwise.
     */
    Value to_array() const { return all().to_value(); }

    /**
     * @brief Encode as JSON
     * @param indent Indentation width; -1 produces compact output
     */
    std::string to_json(int indent = -1) const { return to_array().dump(indent); }

protected:
    Enumerable() = default;
    Enumerable(const Enumerable&) = default;
    Enumerable(Enumerable&&) = default;
    Enumerable& operator=(const Enumerable&) = default;
    Enumerable& operator=(Enumerable&&) = default;
};

} // namespace fluent

#endif // FLUENT_ENUMERABLE_HPP
