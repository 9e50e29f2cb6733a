// src/util/nulls.hpp
#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace ddattr {

inline std::vector<std::string> default_null_tokens() {
    return {"", "NA", "N/A", "null", "NULL", "NaN"};
}

inline bool is_null_like(std::string_view s, const std::vector<std::string>& nulls) {
    for (const auto& n : nulls) {
        if (s == n) return true;
    }
    return false;
}

}
