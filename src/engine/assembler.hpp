// src/engine/assembler.hpp
#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "attrs/global_attributes.hpp"
#include "data/dataset.hpp"
#include "engine/contribution.hpp"
#include "engine/job_params.hpp"
#include "util/key_hash.hpp"
#include "util/log.hpp"

namespace ddattr {

namespace detail {

template <typename T>
T take_value(attribute_value& v, const contribution_key& key) {
    if (auto* p = std::get_if<T>(&v)) return std::move(*p);
    throw std::logic_error("unexpected attribute value for " + to_string(key));
}

inline void report_anomalies(const std::string& column, const summary_entry& e) {
    if (const auto* n = std::get_if<numeric_summary>(&e)) {
        if (!n->min) log::warn("column '{}' has no non-missing values", column);
    } else if (const auto* d = std::get_if<datetime_summary>(&e)) {
        if (!d->min) log::warn("column '{}' has no non-missing values", column);
    } else if (const auto* c = std::get_if<categorical_summary>(&e)) {
        if (!c->complete)
            log::warn("column '{}' has more distinct values than tracked; frequency table is incomplete",
                      column);
    }
}

}

inline std::vector<std::string> hash_keys(const key_list& keys) {
    std::vector<std::string> out;
    out.reserve(keys.size());
    for (const auto& k : keys) out.push_back(key_hash(k));
    return out;
}

// Reshapes the finalized pairs of a pass into the dataset-level record.
// Summaries follow the dataset's declared column order; summaries of columns
// that are not declared are dropped. A needed attribute that received no
// contribution at all (no partitions, no summarizable columns) gets its
// empty value.
inline global_attributes assemble_attributes(const dataset& ds, const attribute_need& needs,
                                             result_set results) {
    global_attributes out;
    std::map<std::string, summary_entry> summaries;
    bool has_summary = is_needed(needs, attr::summary);

    for (auto& [key, value] : results) {
        switch (key.tag) {
            case attr_tag::tot_object_size:
                out.tot_object_size = detail::take_value<double>(value, key);
                break;
            case attr_tag::n_div:
                out.n_div = detail::take_value<std::uint64_t>(value, key);
                break;
            case attr_tag::n_row:
                out.n_row = detail::take_value<std::uint64_t>(value, key);
                break;
            case attr_tag::keys:
                out.keys = detail::take_value<key_list>(value, key);
                break;
            case attr_tag::split_size_distn:
                out.split_size_distn = detail::take_value<percentile_table>(value, key);
                break;
            case attr_tag::split_row_distn:
                out.split_row_distn = detail::take_value<percentile_table>(value, key);
                break;
            case attr_tag::summary_quant:
                has_summary = true;
                summaries[key.column] = detail::take_value<numeric_summary>(value, key);
                break;
            case attr_tag::summary_categ:
                has_summary = true;
                summaries[key.column] = detail::take_value<categorical_summary>(value, key);
                break;
            case attr_tag::summary_datetime:
                has_summary = true;
                summaries[key.column] = detail::take_value<datetime_summary>(value, key);
                break;
        }
    }

    if (has_summary) {
        summary_table table;
        for (const auto& name : ds.vars()) {
            auto it = summaries.find(name);
            if (it == summaries.end()) continue;
            detail::report_anomalies(name, it->second);
            table.emplace_back(name, std::move(it->second));
        }
        out.summary = std::move(table);
    }

    if (is_needed(needs, attr::tot_object_size) && !out.tot_object_size) out.tot_object_size = 0.0;
    if (is_needed(needs, attr::n_div) && !out.n_div) out.n_div = 0;
    if (is_needed(needs, attr::n_row) && !out.n_row) out.n_row = 0;
    if (is_needed(needs, attr::keys) && !out.keys) out.keys = key_list{};
    if (is_needed(needs, attr::split_size_distn) && !out.split_size_distn)
        out.split_size_distn = make_percentiles({});
    if (is_needed(needs, attr::split_row_distn) && !out.split_row_distn)
        out.split_row_distn = make_percentiles({});

    if (out.keys) out.key_hashes = hash_keys(*out.keys);
    return out;
}

}
