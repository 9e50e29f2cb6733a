// src/engine/update_attributes.hpp
#pragma once
#include <string>
#include <utility>
#include <vector>

#include "data/dataset.hpp"
#include "data/size_estimate.hpp"
#include "engine/assembler.hpp"
#include "engine/combiner.hpp"
#include "engine/local_builder.hpp"
#include "engine/need_planner.hpp"
#include "exec/executor.hpp"
#include "util/log.hpp"

namespace ddattr {

struct update_report {
    bool computed = false;                 // false: everything was already there
    std::vector<std::string> attributes;   // names computed by this call
};

inline mr_job make_attribute_job(const dataset& ds, attribute_need needs,
                                 const engine_config& cfg, size_estimator estimate_size,
                                 exec_config exec_cfg = {}) {
    mr_job job;
    job.map = build_local_contributions;
    job.combine = combine;
    job.finalize = finalize;
    job.params.needs = std::move(needs);
    job.params.trans_fn = ds.trans_fn();
    job.params.estimate_size = std::move(estimate_size);
    job.params.max_categories = cfg.max_categories;
    job.config = exec_cfg;
    return job;
}

// Fills in every missing (implemented) attribute of `ds` with one pass over
// its partitions. Calling it again once everything is known is a no-op that
// reports computed == false.
// Throws precondition_error for a transformed view, before any work starts.
inline update_report update_attributes(dataset& ds, executor& exec,
                                       const engine_config& cfg = {},
                                       size_estimator estimate_size = estimate_object_size,
                                       exec_config exec_cfg = {}) {
    attribute_need needs = plan_needs(ds, cfg);

    update_report report;
    if (!any_needed(needs)) {
        log::info("All (implemented) attributes have already been computed.");
        return report;
    }
    for (const auto& [name, needed] : needs) {
        if (needed) report.attributes.push_back(name);
    }

    log::info("Running map/reduce to get missing attributes...");
    const mr_job job = make_attribute_job(ds, needs, cfg, std::move(estimate_size), exec_cfg);
    result_set results = exec.run(ds.partitions(), job);

    ds.set_attributes(assemble_attributes(ds, job.params.needs, std::move(results)));
    report.computed = true;
    return report;
}

}
