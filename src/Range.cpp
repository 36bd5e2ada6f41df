/**
 * @file Range.cpp
 * @brief Implementation of range producers
 */

#include "fluent/Range.hpp"
#include "fluent/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace fluent {

namespace {

    bool is_char_bound(const Value& v) {
        return v.is_string() && v.get_ref<const std::string&>().size() == 1 && !is_numeric(v);
    }

    bool is_float_operand(const Value& v) {
        if (v.is_number_float()) {
            return true;
        }
        if (v.is_string() && is_numeric(v)) {
            const auto& text = v.get_ref<const std::string&>();
            return text.find_first_of(".eE") != std::string::npos;
        }
        return false;
    }

    double numeric_operand(const Value& v, const char* what) {
        if (v.is_boolean() || !is_numeric(v)) {
            throw InvalidArgumentError(std::string("Range ") + what + " must be numeric, got " +
                                       type_name(v));
        }
        return to_number(v);
    }

    double step_magnitude(const Value& step) {
        const double magnitude = std::fabs(numeric_operand(step, "step"));
        if (magnitude == 0.0) {
            throw InvalidArgumentError("Range step must not be zero");
        }
        return magnitude;
    }

    constexpr double kInt64Bound = 9223372036854775808.0;   // 2^63

    std::int64_t to_int64(double d, const char* what) {
        if (!(d >= -kInt64Bound && d < kInt64Bound)) {
            throw InvalidArgumentError(std::string("Range ") + what +
                                       " is outside the 64-bit integer range");
        }
        return static_cast<std::int64_t>(d);
    }

    // Integers are read directly so large bounds keep their precision
    std::int64_t integer_operand(const Value& v, const char* what) {
        if (auto exact = exact_int64(v)) {
            return *exact;
        }
        return to_int64(to_number(v), what);
    }

    /// |step| as an integer stride
    std::int64_t integer_stride(const Value& step) {
        const std::int64_t stride = integer_operand(step, "step");
        if (stride == std::numeric_limits<std::int64_t>::min()) {
            throw InvalidArgumentError("Range step is outside the 64-bit integer range");
        }
        return stride < 0 ? -stride : stride;
    }

    /**
     * @brief Integers from `start` by `step`, stopping past `end` when bounded
     *
     * Stops instead of overflowing at the limits of int64.
     */
    Producer integer_range(std::int64_t start, std::optional<std::int64_t> end, std::int64_t step) {
        return [=]() {
            std::int64_t current = start;
            std::int64_t index = 0;
            bool done = false;
            return Sequence([=]() mutable -> std::optional<Entry> {
                if (done) {
                    return std::nullopt;
                }
                if (end && (step > 0 ? current > *end : current < *end)) {
                    done = true;
                    return std::nullopt;
                }

                Entry entry(Key(index++), Value(current));

                if (step > 0 && current > std::numeric_limits<std::int64_t>::max() - step) {
                    done = true;
                } else if (step < 0 && current < std::numeric_limits<std::int64_t>::min() - step) {
                    done = true;
                } else {
                    current += step;
                }
                return entry;
            });
        };
    }

    /**
     * @brief Floats computed as `start + i * step` so errors do not accumulate
     */
    Producer float_range(double start, std::optional<double> end, double step) {
        std::optional<std::int64_t> count;
        if (end) {
            // Tolerate representation error at the upper bound (0.1 * 3)
            const double steps = std::floor(std::fabs(*end - start) / std::fabs(step) + 1e-9);
            count = steps < kInt64Bound ? static_cast<std::int64_t>(steps) + 1
                                        : std::numeric_limits<std::int64_t>::max();
        }

        return [=]() {
            std::int64_t index = 0;
            return Sequence([=]() mutable -> std::optional<Entry> {
                if (count && index >= *count) {
                    return std::nullopt;
                }
                Entry entry(Key(index), Value(start + static_cast<double>(index) * step));
                ++index;
                return entry;
            });
        };
    }

    Producer char_range(unsigned char start, unsigned char end, std::int64_t step) {
        return [=]() {
            std::int64_t current = start;
            std::int64_t index = 0;
            return Sequence([=]() mutable -> std::optional<Entry> {
                if (step > 0 ? current > end : current < end) {
                    return std::nullopt;
                }
                Entry entry(Key(index++), Value(std::string(1, static_cast<char>(current))));
                current += step;
                return entry;
            });
        };
    }

} // namespace

Producer range_producer(const Value& start, const Value& end, const Value& step) {
    const double magnitude = step_magnitude(step);

    if (is_char_bound(start) && is_char_bound(end)) {
        const auto first = static_cast<unsigned char>(start.get_ref<const std::string&>()[0]);
        const auto last = static_cast<unsigned char>(end.get_ref<const std::string&>()[0]);
        // Any stride past the byte range yields the start alone
        const auto stride =
            std::max<std::int64_t>(1, static_cast<std::int64_t>(std::min(magnitude, 256.0)));
        return char_range(first, last, first <= last ? stride : -stride);
    }

    const double from = numeric_operand(start, "start");
    const double to = numeric_operand(end, "end");
    const bool descending = from > to;

    if (is_float_operand(start) || is_float_operand(end) || is_float_operand(step) ||
        magnitude != std::floor(magnitude)) {
        return float_range(from, to, descending ? -magnitude : magnitude);
    }

    // Compared as integers: nearby large bounds can round to the same double
    const std::int64_t first = integer_operand(start, "start");
    const std::int64_t last = integer_operand(end, "end");
    const std::int64_t stride = integer_stride(step);
    return integer_range(first, last, first > last ? -stride : stride);
}

Producer range_from_producer(const Value& start, const Value& step) {
    const double from = numeric_operand(start, "start");
    const double stride = numeric_operand(step, "step");
    if (stride == 0.0) {
        throw InvalidArgumentError("Range step must not be zero");
    }

    if (is_float_operand(start) || is_float_operand(step) || stride != std::floor(stride)) {
        return float_range(from, std::nullopt, stride);
    }
    return integer_range(integer_operand(start, "start"), std::nullopt,
                         integer_operand(step, "step"));
}

LazyCollection range(const Value& start, const Value& end, const Value& step) {
    return LazyCollection(range_producer(start, end, step));
}

LazyCollection range_from(const Value& start, const Value& step) {
    return LazyCollection(range_from_producer(start, step));
}

} // namespace fluent
