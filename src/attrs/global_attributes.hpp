// src/attrs/global_attributes.hpp
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "stats/moments.hpp"
#include "stats/value_pool.hpp"

namespace ddattr {

// ---------- per-column summaries ----------
struct numeric_summary {
    std::uint64_t na_count{0};
    moment_statistics stats;
    std::optional<double> min, max;
};

struct categorical_summary {
    std::uint64_t na_count{0};
    std::map<std::string, std::uint64_t> freq_table;
    bool complete{true};
};

struct datetime_summary {
    std::uint64_t na_count{0};
    std::optional<std::int64_t> min, max;
};

using summary_entry = std::variant<numeric_summary, categorical_summary, datetime_summary>;

// column name -> summary, in the dataset's declared column order
using summary_table = std::vector<std::pair<std::string, summary_entry>>;

using key_list = std::vector<std::string>;

// ---------- dataset-level record ----------
// Only the attributes computed by a pass are set.
struct global_attributes {
    std::optional<double> tot_object_size;
    std::optional<std::uint64_t> n_div;
    std::optional<std::uint64_t> n_row;
    std::optional<key_list> keys;
    std::optional<std::vector<std::string>> key_hashes;
    std::optional<percentile_table> split_size_distn;
    std::optional<percentile_table> split_row_distn;
    std::optional<summary_table> summary;

    bool empty() const noexcept {
        return !tot_object_size && !n_div && !n_row && !keys && !key_hashes &&
               !split_size_distn && !split_row_distn && !summary;
    }

    const summary_entry* find_summary(const std::string& column) const {
        if (!summary) return nullptr;
        for (const auto& kv : *summary) if (kv.first == column) return &kv.second;
        return nullptr;
    }
};

}
