// src/engine/job_params.hpp
#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "data/dataset.hpp"
#include "data/size_estimate.hpp"
#include "stats/frequency.hpp"

namespace ddattr {

// attribute name -> must be computed in this pass
using attribute_need = std::map<std::string, bool>;

inline bool is_needed(const attribute_need& needs, const std::string& name) {
    auto it = needs.find(name);
    return it != needs.end() && it->second;
}

inline bool any_needed(const attribute_need& needs) {
    for (const auto& kv : needs) if (kv.second) return true;
    return false;
}

// Everything the map stage needs besides the partition itself.
struct job_params {
    attribute_need needs;
    std::optional<transform_fn> trans_fn;
    size_estimator estimate_size = estimate_object_size;
    std::size_t max_categories = default_max_categories;
};

}
