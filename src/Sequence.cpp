/**
 * @file Sequence.cpp
 * @brief Implementation of the pull cursor
 */

#include "fluent/Sequence.hpp"

namespace fluent {

Sequence Sequence::of(std::shared_ptr<const Items> items) {
    std::size_t pos = 0;
    return Sequence([items = std::move(items), pos]() mutable -> std::optional<Entry> {
        if (!items || pos >= items->size()) {
            return std::nullopt;
        }
        return items->at(pos++);
    });
}

std::optional<Entry> Sequence::next() {
    if (ended_ || !generator_) {
        ended_ = true;
        return std::nullopt;
    }

    auto entry = generator_();
    if (!entry) {
        ended_ = true;
        // Release captured state as soon as possible
        generator_ = nullptr;
    }
    return entry;
}

Sequence::iterator Sequence::begin() {
    iterator it(this);
    ++it;
    return it;
}

} // namespace fluent
