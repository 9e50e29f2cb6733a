// src/stats/frequency.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <string>

namespace ddattr {

constexpr std::size_t default_max_categories = 10000;

// Category counts for one column, bounded by `cap` distinct categories.
// Once the cap is reached newly seen categories are dropped (not merged into
// existing ones), so a binding cap makes the retained set depend on the order
// contributions were combined in.
struct frequency_accumulator {
    std::map<std::string, std::uint64_t> counts;
    std::uint64_t na_count{0};
    std::uint64_t rows{0};      // rows observed, missing included
    std::size_t cap{default_max_categories};

    void add(const std::string& value) {
        ++rows;
        auto it = counts.find(value);
        if (it != counts.end()) { ++it->second; return; }
        if (counts.size() < cap) counts.emplace(value, 1);
    }

    void add_missing() { ++rows; ++na_count; }

    std::uint64_t tracked_total() const noexcept {
        std::uint64_t s = 0;
        for (const auto& kv : counts) s += kv.second;
        return s;
    }

    // false when categories were dropped because of the cap
    bool complete() const noexcept { return rows == tracked_total() + na_count; }
};

// The result takes the smaller cap; categories of `a` beyond it are dropped
// (highest keys first) so counts.size() <= cap holds afterwards.
inline frequency_accumulator merge_frequencies(frequency_accumulator a,
                                               const frequency_accumulator& b) {
    if (b.cap < a.cap) a.cap = b.cap;
    while (a.counts.size() > a.cap) a.counts.erase(std::prev(a.counts.end()));
    for (const auto& [value, count] : b.counts) {
        auto it = a.counts.find(value);
        if (it != a.counts.end()) it->second += count;
        else if (a.counts.size() < a.cap) a.counts.emplace(value, count);
    }
    a.na_count += b.na_count;
    a.rows += b.rows;
    return a;
}

}
