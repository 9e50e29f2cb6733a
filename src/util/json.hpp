// src/util/json.hpp
#pragma once
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace ddattr {

// Escapes backslash, quote and control chars (< 0x20).
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 16);
    for (unsigned char c : in) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

inline std::string json_string(std::string_view s) {
    return fmt::format("\"{}\"", json_escape(s));
}

// absent and non-finite values become null
inline std::string json_number(std::optional<double> v) {
    if (!v || !std::isfinite(*v)) return "null";
    return fmt::format("{}", *v);
}

inline std::string json_string_array(const std::vector<std::string>& v) {
    std::string out = "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ",";
        out += json_string(v[i]);
    }
    return out + "]";
}

}
