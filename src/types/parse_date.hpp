// src/types/parse_date.hpp
#pragma once
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ddattr {

inline const std::vector<std::string>& default_date_formats() {
    static const std::vector<std::string> fmts = {
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%d",
        "%m/%d/%Y",
    };
    return fmts;
}

inline std::optional<std::tm> parse_date_any(std::string_view s,
                                             const std::vector<std::string>& fmts) {
    // trailing 'Z' means UTC, which is what we assume anyway
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) s.remove_suffix(1);
    for (const auto& fmt : fmts) {
        std::tm tm{};
        std::istringstream iss{std::string{s}};
        iss >> std::get_time(&tm, fmt.c_str());
        if (iss.fail()) continue;
        // the whole field has to match, not just a prefix
        if (iss.peek() != std::char_traits<char>::eof()) continue;
        return tm;
    }
    return std::nullopt;
}

inline std::int64_t to_epoch_seconds(std::tm tm) {
#if defined(_WIN32)
    return static_cast<std::int64_t>(_mkgmtime(&tm));
#else
    return static_cast<std::int64_t>(timegm(&tm));
#endif
}

// seconds since 1970-01-01T00:00:00Z, or nullopt if no format matches
inline std::optional<std::int64_t> parse_datetime(std::string_view s,
                                                  const std::vector<std::string>& fmts = default_date_formats()) {
    if (s.size() < 8) return std::nullopt;
    auto tm = parse_date_any(s, fmts);
    if (!tm) return std::nullopt;
    return to_epoch_seconds(*tm);
}

inline std::string format_datetime(std::int64_t epoch) {
    std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

}
