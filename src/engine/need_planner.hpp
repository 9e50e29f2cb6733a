// src/engine/need_planner.hpp
#pragma once
#include <cstddef>
#include <set>
#include <stdexcept>
#include <string>

#include "attrs/attribute_names.hpp"
#include "data/dataset.hpp"
#include "engine/job_params.hpp"
#include "stats/frequency.hpp"

namespace ddattr {

// attributes must be computed on base data, not through an unresolved transform
class precondition_error : public std::logic_error {
public:
    explicit precondition_error(const std::string& msg) : std::logic_error(msg) {}
};

// Which attributes each kind of dataset carries and which of them this engine
// knows how to compute. Required attributes that are not implemented are
// skipped silently.
struct engine_config {
    std::set<std::string> required_ddo{
        attr::keys, attr::tot_object_size, attr::split_size_distn, attr::n_div, attr::example};
    std::set<std::string> required_ddf{
        attr::n_row, attr::split_row_distn, attr::summary, attr::vars};
    std::set<std::string> implemented{
        attr::keys, attr::tot_object_size, attr::split_size_distn, attr::n_div,
        attr::n_row, attr::split_row_distn, attr::summary};
    std::size_t max_categories = default_max_categories;
};

inline attribute_need plan_needs(const dataset& ds, const engine_config& cfg) {
    if (ds.transformed())
        throw precondition_error("Cannot compute attributes of a transformed divided data object");

    std::set<std::string> required = cfg.required_ddo;
    if (ds.kind() == dataset_kind::ddf)
        required.insert(cfg.required_ddf.begin(), cfg.required_ddf.end());

    attribute_need needs;
    for (const auto& name : required) {
        if (cfg.implemented.count(name) == 0) continue;
        needs[name] = !ds.has_attribute(name);
    }
    return needs;
}

}
