// src/csv/tokenizer.hpp
#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace ddattr {

// ---------- small helpers ----------
inline std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

inline bool ieq(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// ---------- tiny CSV line parser (RFC4180-ish, covers quotes) ----------
inline std::vector<std::string> parse_csv_line(const std::string& line, char delim, char quote) {
    std::vector<std::string> out;
    std::string cur;
    bool inq = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inq) {
            if (c == quote) {
                // double-quote escape -> append one quote, stay in quoted field
                if (i + 1 < line.size() && line[i + 1] == quote) { cur.push_back(quote); ++i; }
                else { inq = false; }
            } else {
                cur.push_back(c);
            }
        } else {
            if (c == quote) { inq = true; }
            else if (c == delim) { out.push_back(cur); cur.clear(); }
            else { cur.push_back(c); }
        }
    }
    out.push_back(cur);
    return out;
}

// true while `line` ends inside an open quoted field
inline bool has_open_quote(const std::string& line, char quote) {
    std::size_t n = static_cast<std::size_t>(std::count(line.begin(), line.end(), quote));
    return (n % 2) == 1;
}

}
