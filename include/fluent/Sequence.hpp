/**
 * @file Sequence.hpp
 * @brief Single-shot pull cursor over collection entries
 *
 * A Sequence wraps a generator returning the next entry, or nullopt once
 * exhausted. It can be pulled exactly once; lazy collections therefore
 * hold a Producer that creates a fresh Sequence for every iteration.
 *
 * Usage:
 * ```cpp
 * Sequence seq = Sequence::of(items);
 * for (const Entry& entry : seq) {
 *     // entry.first is the key, entry.second the value
 * }
 * ```
 */

#ifndef FLUENT_SEQUENCE_HPP
#define FLUENT_SEQUENCE_HPP

#include "fluent/Items.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>

namespace fluent {

class Sequence {
public:
    using Generator = std::function<std::optional<Entry>()>;

    /// Empty sequence
    Sequence() = default;

    explicit Sequence(Generator generator) : generator_(std::move(generator)) {}

    Sequence(const Sequence&) = delete;
    Sequence& operator=(const Sequence&) = delete;
    Sequence(Sequence&&) = default;
    Sequence& operator=(Sequence&&) = default;

    /// Entries of `items` in order; `items` stays alive while pulled
    static Sequence of(std::shared_ptr<const Items> items);

    /// Pull the next entry; nullopt once the sequence is exhausted
    std::optional<Entry> next();

    bool exhausted() const noexcept { return ended_; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = Entry;
        using pointer = const Entry*;
        using reference = const Entry&;

        explicit iterator(Sequence* parent = nullptr) : parent_(parent) {}

        iterator& operator++() {
            if (parent_ != nullptr) {
                parent_->current_ = parent_->next();
                if (!parent_->current_) {
                    parent_ = nullptr;
                }
            }
            return *this;
        }

        reference operator*() const { return *parent_->current_; }
        pointer operator->() const { return &*parent_->current_; }

        bool operator==(const iterator& other) const { return parent_ == other.parent_; }
        bool operator!=(const iterator& other) const { return parent_ != other.parent_; }

    private:
        Sequence* parent_;
    };

    /// Starts pulling; call once per sequence
    iterator begin();
    iterator end() { return iterator(); }

private:
    Generator generator_;
    std::optional<Entry> current_;
    bool ended_ = false;
};

/// Zero-argument source of fresh sequences
using Producer = std::function<Sequence()>;

} // namespace fluent

#endif // FLUENT_SEQUENCE_HPP
