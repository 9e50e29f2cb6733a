// src/metrics/timers.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "report/emit_run_json.hpp"

namespace ddattr {

struct wall_timer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double, std::milli>(t1 - t0).count(); }
};

// accumulates the wall time of one named stage over its calls
struct stage_timer {
    std::string name;
    std::uint64_t calls = 0;
    double total_ms = 0.0;
    wall_timer wt{};

    explicit stage_timer(const char* n) : name(n ? n : "(stage)") {}
    void start() { wt.start(); }
    void stop()  { wt.stop(); total_ms += wt.ms(); ++calls; }

    run_stage as_stage() const { return run_stage{name, calls, total_ms}; }
};

}
