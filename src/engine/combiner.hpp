// src/engine/combiner.hpp
#pragma once
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "engine/contribution.hpp"

namespace ddattr {

namespace detail {

template <typename T>
T take(contribution& c, const contribution_key& key) {
    if (auto* v = std::get_if<T>(&c)) return std::move(*v);
    throw std::logic_error("unexpected contribution kind for " + to_string(key));
}

}

// ---------- reduce stage ----------
// Merges two partial aggregates sharing `key`. Associative and commutative
// (up to floating-point rounding), except that a binding category cap keeps
// whichever categories arrived first.
inline contribution combine(const contribution_key& key, contribution a, contribution b) {
    switch (key.tag) {
        case attr_tag::tot_object_size:
            return detail::take<double>(a, key) + detail::take<double>(b, key);

        case attr_tag::n_div:
        case attr_tag::n_row:
            return detail::take<std::uint64_t>(a, key) + detail::take<std::uint64_t>(b, key);

        case attr_tag::keys: {
            auto ka = detail::take<key_list>(a, key);
            auto kb = detail::take<key_list>(b, key);
            ka.insert(ka.end(), std::make_move_iterator(kb.begin()), std::make_move_iterator(kb.end()));
            return ka;
        }

        case attr_tag::split_size_distn:
        case attr_tag::split_row_distn:
            return merge_pools(detail::take<value_pool>(a, key), detail::take<value_pool>(b, key));

        case attr_tag::summary_quant: {
            auto qa = detail::take<quant_partial>(a, key);
            const auto qb = detail::take<quant_partial>(b, key);
            quant_partial out;
            out.na_count = qa.na_count + qb.na_count;
            out.moments = merge_moments(qa.moments, qb.moments);
            out.range = merge_ranges(qa.range, qb.range);
            return out;
        }

        case attr_tag::summary_categ:
            return merge_frequencies(detail::take<frequency_accumulator>(a, key),
                                     detail::take<frequency_accumulator>(b, key));

        case attr_tag::summary_datetime: {
            auto da = detail::take<datetime_partial>(a, key);
            const auto db = detail::take<datetime_partial>(b, key);
            da.na_count += db.na_count;
            da.range = merge_ranges(da.range, db.range);
            return da;
        }
    }
    throw std::logic_error("unknown attribute tag");
}

// ---------- finalize ----------
// Turns the fully combined accumulator of `key` into its reportable form.
inline attribute_value finalize(const contribution_key& key, contribution acc) {
    switch (key.tag) {
        case attr_tag::tot_object_size:
            return detail::take<double>(acc, key);

        case attr_tag::n_div:
        case attr_tag::n_row:
            return detail::take<std::uint64_t>(acc, key);

        case attr_tag::keys:
            return detail::take<key_list>(acc, key);

        case attr_tag::split_size_distn:
        case attr_tag::split_row_distn:
            return make_percentiles(detail::take<value_pool>(acc, key));

        case attr_tag::summary_quant: {
            const auto q = detail::take<quant_partial>(acc, key);
            numeric_summary s;
            s.na_count = q.na_count;
            s.stats = to_statistics(q.moments);
            s.min = q.range.min;
            s.max = q.range.max;
            return s;
        }

        case attr_tag::summary_categ: {
            auto f = detail::take<frequency_accumulator>(acc, key);
            categorical_summary s;
            s.na_count = f.na_count;
            s.complete = f.complete();
            s.freq_table = std::move(f.counts);
            return s;
        }

        case attr_tag::summary_datetime: {
            const auto d = detail::take<datetime_partial>(acc, key);
            datetime_summary s;
            s.na_count = d.na_count;
            s.min = d.range.min;
            s.max = d.range.max;
            return s;
        }
    }
    throw std::logic_error("unknown attribute tag");
}

}
