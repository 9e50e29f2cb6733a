// src/stats/range.hpp
#pragma once
#include <optional>

namespace ddattr {

// min/max of the non-missing values; both absent until something is observed
template <typename T>
struct range_accumulator {
    std::optional<T> min;
    std::optional<T> max;

    bool empty() const noexcept { return !min.has_value(); }

    void observe(T x) {
        if (!min || x < *min) min = x;
        if (!max || *max < x) max = x;
    }
};

template <typename T>
inline range_accumulator<T> merge_ranges(const range_accumulator<T>& a,
                                         const range_accumulator<T>& b) {
    range_accumulator<T> out = a;
    if (b.min && (!out.min || *b.min < *out.min)) out.min = b.min;
    if (b.max && (!out.max || *out.max < *b.max)) out.max = b.max;
    return out;
}

}
