// src/exec/executor.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <vector>

#include "data/frame.hpp"
#include "engine/contribution.hpp"
#include "engine/job_params.hpp"

namespace ddattr {

using setup_fn    = std::function<void()>;
using map_fn      = std::function<void(const job_params&, const partition&, const collect_fn&)>;
using combine_fn  = std::function<contribution(const contribution_key&, contribution, contribution)>;
using finalize_fn = std::function<attribute_value(const contribution_key&, contribution)>;

struct exec_config {
    std::size_t workers = 0;   // 0 = hardware concurrency
};

// One map/combine/finalize pass over a set of partitions.
struct mr_job {
    setup_fn setup;            // once per worker, before its first partition
    map_fn map;
    combine_fn combine;        // must be associative and commutative
    finalize_fn finalize;
    job_params params;
    exec_config config;
};

// Runs a job and returns every finalized (key, value) pair ordered by key.
// Backends are free to group, batch and order combine calls however they
// like; they must deliver all contributions or fail the whole call.
class executor {
public:
    virtual ~executor() = default;
    virtual result_set run(const std::vector<partition>& input, const mr_job& job) = 0;
};

}
