// src/data/dataset.hpp
#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "attrs/attribute_names.hpp"
#include "attrs/global_attributes.hpp"
#include "data/frame.hpp"

namespace ddattr {

enum class dataset_kind { ddo, ddf };

inline const char* to_string(dataset_kind k) { return k == dataset_kind::ddf ? "ddf" : "ddo"; }

// per-partition function applied to (key, value) before row-level attributes
using transform_fn = std::function<frame(const std::string& key, const frame& value)>;

// Descriptor of a partitioned dataset plus its attribute store.
// Copies share the partition data.
class dataset {
public:
    dataset(dataset_kind kind, std::vector<partition> parts)
        : kind_(kind),
          parts_(std::make_shared<const std::vector<partition>>(std::move(parts)))
    {
        if (!parts_->empty()) vars_ = parts_->front().value.names();
    }

    dataset_kind kind() const noexcept { return kind_; }
    const std::vector<partition>& partitions() const noexcept { return *parts_; }

    // declared column order (the first partition's columns unless set)
    const std::vector<std::string>& vars() const noexcept { return vars_; }
    void set_vars(std::vector<std::string> v) { vars_ = std::move(v); }

    const std::optional<transform_fn>& trans_fn() const noexcept { return trans_fn_; }
    void set_trans_fn(transform_fn fn) { trans_fn_ = std::move(fn); }

    // A view wrapping this dataset with a deferred transformation.
    // Attributes must be computed on the base data, not through the view.
    dataset add_transform(transform_fn fn) const {
        dataset view = *this;
        view.pending_ = std::move(fn);
        return view;
    }
    bool transformed() const noexcept { return static_cast<bool>(pending_); }
    const transform_fn& pending_transform() const noexcept { return pending_; }

    // ---------- attribute store ----------
    const global_attributes& attributes() const noexcept { return attrs_; }

    bool has_attribute(const std::string& name) const {
        if (name == attr::keys)             return attrs_.keys.has_value();
        if (name == attr::key_hashes)       return attrs_.key_hashes.has_value();
        if (name == attr::tot_object_size)  return attrs_.tot_object_size.has_value();
        if (name == attr::split_size_distn) return attrs_.split_size_distn.has_value();
        if (name == attr::n_div)            return attrs_.n_div.has_value();
        if (name == attr::n_row)            return attrs_.n_row.has_value();
        if (name == attr::split_row_distn)  return attrs_.split_row_distn.has_value();
        if (name == attr::summary)          return attrs_.summary.has_value();
        if (name == attr::vars)             return !vars_.empty();
        return false;
    }

    // overwrite every attribute set in `a`, keep the rest
    void set_attributes(const global_attributes& a) {
        if (a.tot_object_size)  attrs_.tot_object_size = a.tot_object_size;
        if (a.n_div)            attrs_.n_div = a.n_div;
        if (a.n_row)            attrs_.n_row = a.n_row;
        if (a.keys)             attrs_.keys = a.keys;
        if (a.key_hashes)       attrs_.key_hashes = a.key_hashes;
        if (a.split_size_distn) attrs_.split_size_distn = a.split_size_distn;
        if (a.split_row_distn)  attrs_.split_row_distn = a.split_row_distn;
        if (a.summary)          attrs_.summary = a.summary;
    }

private:
    dataset_kind kind_;
    std::shared_ptr<const std::vector<partition>> parts_;
    std::vector<std::string> vars_;
    std::optional<transform_fn> trans_fn_;
    transform_fn pending_;
    global_attributes attrs_;
};

}
