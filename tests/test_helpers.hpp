// tests/test_helpers.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "data/frame.hpp"

namespace ddattr::testing {

inline column num_col(std::string name, std::vector<std::optional<double>> v) {
    return column{std::move(name), numeric_column{std::move(v)}};
}

inline column cat_col(std::string name, std::vector<std::optional<std::string>> v) {
    return column{std::move(name), categorical_column{std::move(v)}};
}

inline column dt_col(std::string name, std::vector<std::optional<std::int64_t>> v) {
    return column{std::move(name), datetime_column{std::move(v)}};
}

// partition with `rows` rows: x = 0..rows-1, g alternating a/b, t = 1000 + x
inline partition make_partition(const std::string& key, std::size_t rows, double x0 = 0.0) {
    std::vector<std::optional<double>> x;
    std::vector<std::optional<std::string>> g;
    std::vector<std::optional<std::int64_t>> t;
    for (std::size_t i = 0; i < rows; ++i) {
        x.emplace_back(x0 + static_cast<double>(i));
        g.emplace_back(i % 2 == 0 ? "a" : "b");
        t.emplace_back(1000 + static_cast<std::int64_t>(i));
    }
    partition p;
    p.key = key;
    p.value.columns.push_back(num_col("x", std::move(x)));
    p.value.columns.push_back(cat_col("g", std::move(g)));
    p.value.columns.push_back(dt_col("t", std::move(t)));
    return p;
}

}
