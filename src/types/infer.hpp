// src/types/infer.hpp
#pragma once
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "csv/tokenizer.hpp"
#include "data/frame.hpp"
#include "types/parse_date.hpp"

namespace ddattr {

inline bool is_int64(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}
inline bool is_float64(std::string_view s) {
    if (s.empty()) return false;
    bool dot = false, exp = false, digit = false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) { digit = true; continue; }
        if (c == '.' && !dot && !exp) { dot = true; continue; }
        if ((c == 'e' || c == 'E') && !exp && digit) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            continue;
        }
        return false;
    }
    return digit;
}

inline std::optional<double> parse_number(std::string_view s) {
    if (!is_int64(s) && !is_float64(s)) return std::nullopt;
    const std::string t(s);
    return std::strtod(t.c_str(), nullptr);
}

// Tracks "all non-missing values look like X" for one column of one file.
struct family_votes {
    bool all_numeric  = true;
    bool all_datetime = true;
    std::size_t non_null = 0;

    void observe(std::string_view v) {
        ++non_null;
        if (all_numeric && !is_float64(v) && !is_int64(v)) all_numeric = false;
        if (all_datetime && !parse_datetime(v)) all_datetime = false;
    }

    // nullopt: nothing observed, any family fits
    std::optional<column_family> decide() const {
        if (non_null == 0)  return std::nullopt;
        if (all_numeric)    return column_family::numeric;
        if (all_datetime)   return column_family::datetime;
        return column_family::categorical;
    }
};

// Reconciles the per-file decisions for one column: disagreeing files fall
// back to categorical, which can hold any value.
inline std::optional<column_family> unify_families(std::optional<column_family> a,
                                                   std::optional<column_family> b) {
    if (!a) return b;
    if (!b || *a == *b) return a;
    return column_family::categorical;
}

inline std::optional<column_family> parse_family(std::string_view s) {
    if (ieq(s, "numeric") || ieq(s, "quant"))  return column_family::numeric;
    if (ieq(s, "categorical") || ieq(s, "categ")) return column_family::categorical;
    if (ieq(s, "datetime") || ieq(s, "date"))  return column_family::datetime;
    if (ieq(s, "skip") || ieq(s, "other"))     return column_family::unsupported;
    return std::nullopt;
}

}
