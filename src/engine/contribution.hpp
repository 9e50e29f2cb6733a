// src/engine/contribution.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "attrs/attribute_names.hpp"
#include "attrs/global_attributes.hpp"
#include "stats/frequency.hpp"
#include "stats/moments.hpp"
#include "stats/range.hpp"
#include "stats/value_pool.hpp"

namespace ddattr {

// What a contribution is about. The summary tags carry a column name.
enum class attr_tag {
    tot_object_size,
    n_div,
    keys,
    split_size_distn,
    n_row,
    split_row_distn,
    summary_quant,
    summary_categ,
    summary_datetime
};

inline const char* to_string(attr_tag t) {
    switch (t) {
        case attr_tag::tot_object_size:  return attr::tot_object_size;
        case attr_tag::n_div:            return attr::n_div;
        case attr_tag::keys:             return attr::keys;
        case attr_tag::split_size_distn: return attr::split_size_distn;
        case attr_tag::n_row:            return attr::n_row;
        case attr_tag::split_row_distn:  return attr::split_row_distn;
        case attr_tag::summary_quant:    return "summary_quant";
        case attr_tag::summary_categ:    return "summary_categ";
        default:                         return "summary_datetime";
    }
}

inline bool is_summary(attr_tag t) noexcept {
    return t == attr_tag::summary_quant || t == attr_tag::summary_categ ||
           t == attr_tag::summary_datetime;
}

// Grouping key between the map and reduce stages.
struct contribution_key {
    attr_tag tag{attr_tag::n_div};
    std::string column;   // empty unless is_summary(tag)

    bool operator<(const contribution_key& o) const {
        return std::tie(tag, column) < std::tie(o.tag, o.column);
    }
    bool operator==(const contribution_key& o) const {
        return tag == o.tag && column == o.column;
    }
};

inline std::string to_string(const contribution_key& k) {
    if (k.column.empty()) return to_string(k.tag);
    return std::string(to_string(k.tag)) + "_" + k.column;
}

// ---------- partial aggregates ----------
struct quant_partial {
    std::uint64_t na_count{0};
    moment_accumulator moments;
    range_accumulator<double> range;
};

struct datetime_partial {
    std::uint64_t na_count{0};
    range_accumulator<std::int64_t> range;
};

// categorical partials are frequency_accumulator (NA count included)

// totObjectSize is a double sum; nDiv and nRow are integer sums
using contribution = std::variant<double, std::uint64_t, key_list, value_pool,
                                  quant_partial, frequency_accumulator, datetime_partial>;

// ---------- finalized values ----------
using attribute_value = std::variant<double, std::uint64_t, key_list, percentile_table,
                                     numeric_summary, categorical_summary, datetime_summary>;

using collect_fn = std::function<void(contribution_key, contribution)>;

// finalized (key, value) pairs of one pass, ordered by key
using result_set = std::vector<std::pair<contribution_key, attribute_value>>;

}
