// src/exec/local_executor.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <future>
#include <map>
#include <thread>
#include <utility>
#include <vector>

#include "exec/executor.hpp"

namespace ddattr {

// In-process backend: partitions are split into contiguous slices, one
// std::async task per slice. Each task folds its contributions per key as
// they are emitted; the per-task partials are merged afterwards.
class local_executor : public executor {
public:
    using partial_map = std::map<contribution_key, contribution>;

    result_set run(const std::vector<partition>& input, const mr_job& job) override {
        std::size_t workers = job.config.workers;
        if (workers == 0) workers = std::max<unsigned>(1, std::thread::hardware_concurrency());
        workers = std::max<std::size_t>(1, std::min(workers, input.size()));

        std::vector<std::future<partial_map>> futures;
        const std::size_t per = input.empty() ? 0 : (input.size() + workers - 1) / workers;
        for (std::size_t begin = 0; begin < input.size(); begin += per) {
            const std::size_t end = std::min(input.size(), begin + per);
            futures.push_back(std::async(std::launch::async, [&input, &job, begin, end]() {
                return map_slice(input, begin, end, job);
            }));
        }

        // get() rethrows the first worker failure
        partial_map merged;
        for (auto& f : futures) {
            for (auto& [key, value] : f.get()) fold(merged, key, std::move(value), job);
        }

        result_set out;
        out.reserve(merged.size());
        for (auto& [key, value] : merged) {
            out.emplace_back(key, job.finalize(key, std::move(value)));
        }
        return out;
    }

private:
    static void fold(partial_map& acc, const contribution_key& key, contribution value,
                     const mr_job& job) {
        auto it = acc.find(key);
        if (it == acc.end()) {
            acc.emplace(key, std::move(value));
            return;
        }
        it->second = job.combine(key, std::move(it->second), std::move(value));
    }

    static partial_map map_slice(const std::vector<partition>& input, std::size_t begin,
                                 std::size_t end, const mr_job& job) {
        if (job.setup) job.setup();
        partial_map acc;
        const collect_fn collect = [&acc, &job](contribution_key key, contribution value) {
            fold(acc, key, std::move(value), job);
        };
        for (std::size_t i = begin; i < end; ++i) job.map(job.params, input[i], collect);
        return acc;
    }
};

}
