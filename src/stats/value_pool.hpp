// src/stats/value_pool.hpp
#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

namespace ddattr {

// One scalar per partition (byte size, row count). Bounded by the number of
// partitions, so percentiles are computed exactly over the whole pool.
using value_pool = std::vector<double>;

inline value_pool merge_pools(value_pool a, const value_pool& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

struct percentile_point {
    double prob{0.0};
    std::optional<double> value;
};

using percentile_table = std::vector<percentile_point>;

constexpr std::size_t percentile_points = 101;

// linear interpolation between order statistics, h = (n - 1) * q
inline double interpolated_quantile(const std::vector<double>& sorted, double q) {
    const double pos = q * static_cast<double>(sorted.size() - 1);
    std::size_t i = static_cast<std::size_t>(std::floor(pos));
    if (i >= sorted.size() - 1) return sorted.back();
    const double frac = pos - static_cast<double>(i);
    return sorted[i] + frac * (sorted[i + 1] - sorted[i]);
}

// 0th..100th percentile in 1% steps; missing (NaN) entries are ignored
inline percentile_table make_percentiles(const value_pool& pool) {
    std::vector<double> v;
    v.reserve(pool.size());
    for (double x : pool) if (!std::isnan(x)) v.push_back(x);
    std::sort(v.begin(), v.end());

    percentile_table out(percentile_points);
    for (std::size_t i = 0; i < percentile_points; ++i) {
        out[i].prob = static_cast<double>(i) / 100.0;
        if (!v.empty()) out[i].value = interpolated_quantile(v, out[i].prob);
    }
    return out;
}

}
