// src/report/emit_attributes_json.hpp
#pragma once
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "data/dataset.hpp"
#include "types/parse_date.hpp"
#include "util/json.hpp"

namespace ddattr {

// ---------- JSON fragments ----------
inline std::string json_percentiles(const percentile_table& t) {
    std::string out = "[";
    for (size_t i = 0; i < t.size(); ++i) {
        if (i) out += ",";
        out += fmt::format(R"({{"p":{:.2f},"v":{}}})", t[i].prob, json_number(t[i].value));
    }
    return out + "]";
}

inline std::string json_datetime(const std::optional<std::int64_t>& v) {
    return v ? json_string(format_datetime(*v)) : std::string("null");
}

inline std::string json_summary_entry(const std::string& name, const summary_entry& e) {
    if (const auto* n = std::get_if<numeric_summary>(&e)) {
        return fmt::format(
            R"({{"name":{},"type":"numeric","nna":{},"stats":{{"mean":{},"var":{},"skewness":{},"kurtosis":{}}},"range":[{},{}]}})",
            json_string(name), n->na_count,
            json_number(n->stats.mean), json_number(n->stats.variance),
            json_number(n->stats.skewness), json_number(n->stats.kurtosis),
            json_number(n->min), json_number(n->max));
    }
    if (const auto* c = std::get_if<categorical_summary>(&e)) {
        std::string table = "[";
        bool first = true;
        for (const auto& [value, freq] : c->freq_table) {
            if (!first) table += ",";
            first = false;
            table += fmt::format(R"({{"value":{},"freq":{}}})", json_string(value), freq);
        }
        table += "]";
        return fmt::format(R"({{"name":{},"type":"categorical","nna":{},"complete":{},"freqTable":{}}})",
                           json_string(name), c->na_count, c->complete ? "true" : "false", table);
    }
    const auto& d = std::get<datetime_summary>(e);
    return fmt::format(R"({{"name":{},"type":"datetime","nna":{},"range":[{},{}]}})",
                       json_string(name), d.na_count, json_datetime(d.min), json_datetime(d.max));
}

// Writes attributes.json (schema v1): every attribute the dataset carries.
inline void emit_attributes_json(const std::string& out_path,
                                 const std::string& source_path,
                                 const dataset& ds)
{
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for write: " + out_path);

    const auto& a = ds.attributes();
    std::vector<std::string> fields;
    if (a.n_div)            fields.push_back(fmt::format(R"("nDiv":{})", *a.n_div));
    if (a.n_row)            fields.push_back(fmt::format(R"("nRow":{})", *a.n_row));
    if (a.tot_object_size)  fields.push_back(fmt::format(R"("totObjectSize":{})", json_number(a.tot_object_size)));
    if (a.split_size_distn) fields.push_back(fmt::format(R"("splitSizeDistn":{})", json_percentiles(*a.split_size_distn)));
    if (a.split_row_distn)  fields.push_back(fmt::format(R"("splitRowDistn":{})", json_percentiles(*a.split_row_distn)));
    if (a.keys)             fields.push_back(fmt::format(R"("keys":{})", json_string_array(*a.keys)));
    if (a.key_hashes)       fields.push_back(fmt::format(R"("keyHashes":{})", json_string_array(*a.key_hashes)));
    if (a.summary) {
        std::string s = R"("summary":[)";
        for (size_t i = 0; i < a.summary->size(); ++i) {
            if (i) s += ",\n    ";
            s += json_summary_entry((*a.summary)[i].first, (*a.summary)[i].second);
        }
        fields.push_back(s + "]");
    }

    f << fmt::format(
R"({{
  "version":"1",
  "dataset":{{"kind":"{}","source_path":{},"vars":{}}},
  "attributes":{{)",
        to_string(ds.kind()), json_string(source_path), json_string_array(ds.vars()));

    for (size_t i = 0; i < fields.size(); ++i) {
        f << "\n    " << fields[i];
        if (i + 1 < fields.size()) f << ",";
    }
    f << "\n  }\n}\n";
}

}
