// src/engine/local_builder.hpp
#pragma once
#include <cstdint>
#include <type_traits>
#include <variant>

#include "attrs/attribute_names.hpp"
#include "data/frame.hpp"
#include "engine/contribution.hpp"
#include "engine/job_params.hpp"

namespace ddattr {

// ---------- per-family local summaries ----------
inline quant_partial summarize_numeric(const numeric_column& c) {
    quant_partial p;
    for (const auto& v : c.values) {
        if (is_missing(v)) { ++p.na_count; continue; }
        p.moments.push(*v);
        p.range.observe(*v);
    }
    return p;
}

inline frequency_accumulator summarize_categorical(const categorical_column& c,
                                                   std::size_t max_categories) {
    frequency_accumulator f;
    f.cap = max_categories;
    for (const auto& v : c.values) {
        if (v) f.add(*v);
        else f.add_missing();
    }
    return f;
}

inline datetime_partial summarize_datetime(const datetime_column& c) {
    datetime_partial p;
    for (const auto& v : c.values) {
        if (!v) { ++p.na_count; continue; }
        p.range.observe(*v);
    }
    return p;
}

// emits one summary contribution per supported column of `f`
inline void collect_summary(const frame& f, std::size_t max_categories, const collect_fn& collect) {
    for (const auto& col : f.columns) {
        std::visit([&](const auto& c) {
            using C = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<C, numeric_column>) {
                collect({attr_tag::summary_quant, col.name}, summarize_numeric(c));
            } else if constexpr (std::is_same_v<C, categorical_column>) {
                collect({attr_tag::summary_categ, col.name}, summarize_categorical(c, max_categories));
            } else if constexpr (std::is_same_v<C, datetime_column>) {
                collect({attr_tag::summary_datetime, col.name}, summarize_datetime(c));
            }
            // other_column: not summarized
        }, col.data);
    }
}

// ---------- map stage ----------
// Local contributions of one partition for every needed attribute.
// Size/shape attributes describe the stored (untransformed) value; row
// counts and summaries use the transformed view when a transform is set.
inline void build_local_contributions(const job_params& p, const partition& part,
                                      const collect_fn& collect) {
    const auto& needs = p.needs;
    const frame& r = part.value;

    if (is_needed(needs, attr::split_size_distn) || is_needed(needs, attr::tot_object_size)) {
        const double obj_size = p.estimate_size(r);
        if (is_needed(needs, attr::split_size_distn))
            collect({attr_tag::split_size_distn, {}}, value_pool{obj_size});
        if (is_needed(needs, attr::tot_object_size))
            collect({attr_tag::tot_object_size, {}}, obj_size);
    }
    if (is_needed(needs, attr::keys))
        collect({attr_tag::keys, {}}, key_list{part.key});
    if (is_needed(needs, attr::n_div))
        collect({attr_tag::n_div, {}}, std::uint64_t{1});

    const bool row_level = is_needed(needs, attr::n_row) ||
                           is_needed(needs, attr::split_row_distn) ||
                           is_needed(needs, attr::summary);
    if (!row_level) return;

    frame transformed;
    const frame* view = &r;
    if (p.trans_fn) {
        transformed = (*p.trans_fn)(part.key, r);
        view = &transformed;
    }

    const auto rows = static_cast<std::uint64_t>(view->rows());
    if (is_needed(needs, attr::n_row))
        collect({attr_tag::n_row, {}}, rows);
    if (is_needed(needs, attr::split_row_distn))
        collect({attr_tag::split_row_distn, {}}, value_pool{static_cast<double>(rows)});
    if (is_needed(needs, attr::summary))
        collect_summary(*view, p.max_categories, collect);
}

}
