// src/data/frame.hpp
#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace ddattr {

// ---------- column storage ----------
struct numeric_column {
    std::vector<std::optional<double>> values;   // NaN counts as missing too
};

struct categorical_column {
    std::vector<std::optional<std::string>> values;
};

struct datetime_column {
    std::vector<std::optional<std::int64_t>> values;   // seconds since epoch, UTC
};

// anything the engine does not summarize
struct other_column {
    std::size_t rows{0};
    std::string type_name;
};

using column_data = std::variant<numeric_column, categorical_column, datetime_column, other_column>;

enum class column_family { numeric, categorical, datetime, unsupported };

inline const char* to_string(column_family f) {
    switch (f) {
        case column_family::numeric:     return "numeric";
        case column_family::categorical: return "categorical";
        case column_family::datetime:    return "datetime";
        default:                         return "unsupported";
    }
}

struct column {
    std::string name;
    column_data data;

    column_family family() const noexcept {
        switch (data.index()) {
            case 0:  return column_family::numeric;
            case 1:  return column_family::categorical;
            case 2:  return column_family::datetime;
            default: return column_family::unsupported;
        }
    }

    std::size_t size() const noexcept {
        return std::visit([](const auto& c) -> std::size_t {
            using C = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<C, other_column>) return c.rows;
            else return c.values.size();
        }, data);
    }
};

inline bool is_missing(const std::optional<double>& v) noexcept {
    return !v || std::isnan(*v);
}

// ---------- frame ----------
// Row data of one partition. All columns have the same length.
struct frame {
    std::vector<column> columns;

    std::size_t rows() const noexcept { return columns.empty() ? 0 : columns.front().size(); }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(columns.size());
        for (const auto& c : columns) out.push_back(c.name);
        return out;
    }

    const column* find(const std::string& name) const noexcept {
        for (const auto& c : columns) if (c.name == name) return &c;
        return nullptr;
    }
};

struct partition {
    std::string key;
    frame value;
};

}
