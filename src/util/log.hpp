// src/util/log.hpp
#pragma once
#include <cstdio>
#include <utility>

#include <fmt/format.h>

namespace ddattr::log {

enum class level { quiet, normal };

inline level& current_level() {
    static level lvl = level::normal;
    return lvl;
}

inline void set_quiet(bool quiet) { current_level() = quiet ? level::quiet : level::normal; }

// progress line: "* ..."
template <typename... Args>
inline void info(fmt::format_string<Args...> f, Args&&... args) {
    if (current_level() == level::quiet) return;
    fmt::print(stderr, "* {}\n", fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> f, Args&&... args) {
    fmt::print(stderr, "WARN: {}\n", fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(fmt::format_string<Args...> f, Args&&... args) {
    fmt::print(stderr, "ERROR: {}\n", fmt::format(f, std::forward<Args>(args)...));
}

}
