// src/io/dataset_loader.hpp
#pragma once
#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "data/dataset.hpp"
#include "io/csv_table.hpp"
#include "types/infer.hpp"
#include "types/parse_date.hpp"
#include "util/log.hpp"

namespace ddattr {

struct load_options {
    csv_options csv;
    dataset_kind kind = dataset_kind::ddf;
    std::map<std::string, column_family> forced_families;   // column name -> family
};

// ---------- typed conversion ----------
inline column make_column(const std::string& name,
                          std::vector<std::optional<std::string>>& cells,
                          column_family family) {
    column col;
    col.name = name;
    switch (family) {
        case column_family::numeric: {
            numeric_column c;
            c.values.reserve(cells.size());
            // values that do not parse become missing
            for (const auto& v : cells) c.values.push_back(v ? parse_number(*v) : std::nullopt);
            col.data = std::move(c);
            break;
        }
        case column_family::datetime: {
            datetime_column c;
            c.values.reserve(cells.size());
            for (const auto& v : cells) c.values.push_back(v ? parse_datetime(*v) : std::nullopt);
            col.data = std::move(c);
            break;
        }
        case column_family::categorical: {
            categorical_column c;
            c.values = std::move(cells);
            col.data = std::move(c);
            break;
        }
        default:
            col.data = other_column{cells.size(), "string"};
            break;
    }
    return col;
}

inline std::vector<std::filesystem::path> list_partition_files(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) throw std::runtime_error("Not a directory: " + dir.string());

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".csv") files.push_back(entry.path());
    }
    if (ec) throw std::runtime_error("Failed to list " + dir.string() + ": " + ec.message());
    std::sort(files.begin(), files.end());
    return files;
}

// A directory of CSV files, one partition per file keyed by the file stem.
// Column families are inferred over all files so that a column gets the same
// family everywhere; forced families win. Declared vars are the union of all
// files' columns, so an empty or narrower first file hides nothing.
inline dataset load_dataset_dir(const std::filesystem::path& dir, const load_options& opt) {
    const auto files = list_partition_files(dir);
    if (files.empty()) throw std::runtime_error("No .csv partitions in " + dir.string());

    std::vector<csv_table> tables;
    tables.reserve(files.size());
    std::map<std::string, std::optional<column_family>> families;
    std::vector<std::string> vars;   // every column, in first-seen order

    for (const auto& f : files) {
        tables.push_back(read_csv_table(f, opt.csv));
        const auto& t = tables.back();
        for (size_t c = 0; c < t.names.size(); ++c) {
            family_votes votes;
            for (const auto& v : t.cells[c]) if (v) votes.observe(*v);
            auto it = families.find(t.names[c]);
            if (it == families.end()) {
                families.emplace(t.names[c], votes.decide());
                vars.push_back(t.names[c]);
            } else {
                it->second = unify_families(it->second, votes.decide());
            }
        }
    }

    std::vector<partition> parts;
    parts.reserve(tables.size());
    for (size_t i = 0; i < tables.size(); ++i) {
        auto& t = tables[i];
        partition p;
        p.key = files[i].stem().string();
        for (size_t c = 0; c < t.names.size(); ++c) {
            column_family fam = families[t.names[c]].value_or(column_family::numeric);
            auto forced = opt.forced_families.find(t.names[c]);
            if (forced != opt.forced_families.end()) fam = forced->second;
            p.value.columns.push_back(make_column(t.names[c], t.cells[c], fam));
        }
        parts.push_back(std::move(p));
    }

    log::info("Loaded {} partitions from {}", parts.size(), dir.string());
    dataset ds(opt.kind, std::move(parts));
    ds.set_vars(std::move(vars));
    return ds;
}

}
