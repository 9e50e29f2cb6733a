// src/report/emit_run_json.hpp
#pragma once
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "util/json.hpp"

namespace ddattr {

struct run_stage {
    std::string name;
    std::uint64_t calls = 0;
    double ms = 0.0;
};

struct run_info {
    std::string started_at;
    std::string ended_at;
    double wall_ms = 0.0;
    std::uint64_t partitions = 0;
    std::size_t workers = 0;
    bool computed = false;                  // false: nothing was missing
    std::vector<std::string> attributes;    // computed this run
    double rss_peak_mb = 0.0;
};

// Writes run.json (schema v1).
inline void emit_run_json(const std::string& out_path,
                          const run_info& run,
                          const std::vector<run_stage>& stages)
{
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for write: " + out_path);

    f << "{\n";
    f << R"(  "version":"1",)"
      << "\n  " << fmt::format(R"("started_at":"{}",)", run.started_at)
      << "\n  " << fmt::format(R"("ended_at":"{}",)", run.ended_at)
      << "\n  " << fmt::format(R"("wall_time_ms":{},)", run.wall_ms)
      << "\n  " << fmt::format(R"("partitions":{},)", run.partitions)
      << "\n  " << fmt::format(R"("workers":{},)", run.workers)
      << "\n  " << fmt::format(R"("computed":{},)", run.computed ? "true" : "false")
      << "\n  " << fmt::format(R"("attributes":{},)", json_string_array(run.attributes))
      << "\n  " << fmt::format(R"("rss_peak_mb":{},)", run.rss_peak_mb);

    f << "\n  \"stages\":[\n";
    for (size_t i = 0; i < stages.size(); ++i) {
        const auto& s = stages[i];
        f << "    " << fmt::format(R"({{"name":"{}","calls":{},"ms":{}}})", s.name, s.calls, s.ms);
        if (i + 1 < stages.size()) f << ",";
        f << "\n";
    }
    f << "  ]\n";
    f << "}\n";
}

}
