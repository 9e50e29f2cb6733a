// src/stats/moments.hpp
#pragma once
#include <cmath>
#include <cstdint>
#include <optional>

namespace ddattr {

// Central-moment sums of the non-missing values seen so far.
// n == 0 is the identity of merge_moments().
struct moment_accumulator {
    std::uint64_t n{0};
    double mean{0.0};
    double m2{0.0}, m3{0.0}, m4{0.0};

    bool empty() const noexcept { return n == 0; }

    // one-pass update (Welford, extended to M3/M4 by Terriberry)
    void push(double x) noexcept {
        const double n1 = static_cast<double>(n);
        ++n;
        const double nn = static_cast<double>(n);
        const double delta = x - mean;
        const double delta_n = delta / nn;
        const double delta_n2 = delta_n * delta_n;
        const double term1 = delta * delta_n * n1;
        mean += delta_n;
        m4 += term1 * delta_n2 * (nn * nn - 3.0 * nn + 3.0)
            + 6.0 * delta_n2 * m2 - 4.0 * delta_n * m3;
        m3 += term1 * delta_n * (nn - 2.0) - 3.0 * delta_n * m2;
        m2 += term1;
    }
};

// Pairwise merge of two groups (Bennett et al., CLUSTER 2009).
inline moment_accumulator merge_moments(const moment_accumulator& a,
                                        const moment_accumulator& b) noexcept {
    if (b.empty()) return a;
    if (a.empty()) return b;

    const double na = static_cast<double>(a.n);
    const double nb = static_cast<double>(b.n);
    const double n  = na + nb;
    const double d  = b.mean - a.mean;
    const double d2 = d * d;
    const double d3 = d2 * d;
    const double d4 = d2 * d2;

    moment_accumulator out;
    out.n = a.n + b.n;
    out.mean = a.mean + d * nb / n;
    out.m2 = a.m2 + b.m2 + d2 * na * nb / n;
    out.m3 = a.m3 + b.m3
           + d3 * na * nb * (na - nb) / (n * n)
           + 3.0 * d * (na * b.m2 - nb * a.m2) / n;
    out.m4 = a.m4 + b.m4
           + d4 * na * nb * (na * na - na * nb + nb * nb) / (n * n * n)
           + 6.0 * d2 * (na * na * b.m2 + nb * nb * a.m2) / (n * n)
           + 4.0 * d * (na * b.m3 - nb * a.m3) / n;
    return out;
}

struct moment_statistics {
    std::optional<double> mean;
    std::optional<double> variance;
    std::optional<double> skewness;
    std::optional<double> kurtosis;
};

inline moment_statistics to_statistics(const moment_accumulator& m) {
    moment_statistics s;
    if (m.empty()) return s;
    const double n = static_cast<double>(m.n);
    s.mean = m.mean;
    if (m.n >= 2) s.variance = m.m2 / (n - 1.0);
    if (m.m2 != 0.0) {
        s.skewness = std::sqrt(n) * m.m3 / std::pow(m.m2, 1.5);
        s.kurtosis = n * m.m4 / (m.m2 * m.m2) - 3.0;
    }
    return s;
}

}
