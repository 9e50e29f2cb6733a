// src/data/size_estimate.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "data/frame.hpp"

namespace ddattr {

// bytes -> injected so backends can plug in their own accounting
using size_estimator = std::function<double(const frame&)>;

namespace detail {
constexpr std::size_t column_overhead = 64;
constexpr std::size_t string_overhead = 32;
}

// In-memory footprint of a frame: value storage, the missing flags carried
// by every cell, string payloads and a fixed per-column header.
inline double estimate_object_size(const frame& f) {
    std::size_t bytes = 0;
    for (const auto& c : f.columns) {
        bytes += detail::column_overhead + c.name.size();
        if (const auto* n = std::get_if<numeric_column>(&c.data)) {
            bytes += n->values.size() * sizeof(std::optional<double>);
        } else if (const auto* s = std::get_if<categorical_column>(&c.data)) {
            for (const auto& v : s->values) {
                bytes += sizeof(std::optional<std::string>);
                if (v && v->size() > detail::string_overhead) bytes += v->size();
            }
        } else if (const auto* d = std::get_if<datetime_column>(&c.data)) {
            bytes += d->values.size() * sizeof(std::optional<std::int64_t>);
        } else if (const auto* o = std::get_if<other_column>(&c.data)) {
            bytes += o->rows * sizeof(std::uint64_t);
        }
    }
    return static_cast<double>(bytes);
}

}
