// src/io/csv_table.hpp
#pragma once
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "csv/tokenizer.hpp"
#include "util/nulls.hpp"

namespace ddattr {

struct csv_options {
    char delimiter = ',';
    char quote = '"';
    bool has_header = true;
    std::vector<std::string> null_tokens = default_null_tokens();
};

// One CSV file as untyped cells; nullopt marks a null token.
struct csv_table {
    std::vector<std::string> names;
    std::vector<std::vector<std::optional<std::string>>> cells;   // [column][row]

    std::size_t rows() const noexcept { return cells.empty() ? 0 : cells.front().size(); }
};

inline csv_table read_csv_table(const std::filesystem::path& path, const csv_options& opt) {
    std::ifstream is(path, std::ios::binary);
    if (!is) throw std::runtime_error("Failed to open: " + path.string());

    csv_table t;
    bool header_read = false;
    std::string line, record;
    std::size_t lineno = 0;

    while (std::getline(is, line)) {
        ++lineno;
        // handle CRLF
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // a quoted field may span physical lines
        if (!record.empty()) record += '\n';
        record += line;
        if (has_open_quote(record, opt.quote)) continue;

        auto fields = parse_csv_line(record, opt.delimiter, opt.quote);
        record.clear();

        if (!header_read) {
            header_read = true;
            if (opt.has_header) {
                for (auto& f : fields) t.names.emplace_back(trim(f));
            } else {
                // synthesize names from first row's width
                for (size_t i = 0; i < fields.size(); ++i) t.names.push_back("col" + std::to_string(i + 1));
            }
            t.cells.resize(t.names.size());
            if (opt.has_header) continue;
        }

        if (fields.size() == 1 && trim(fields[0]).empty() && t.names.size() > 1) continue;   // blank line
        if (fields.size() != t.names.size()) {
            throw std::runtime_error(fmt::format("{}:{}: expected {} fields, found {}",
                                                 path.string(), lineno, t.names.size(), fields.size()));
        }
        for (size_t c = 0; c < fields.size(); ++c) {
            const auto v = trim(fields[c]);
            if (is_null_like(v, opt.null_tokens)) t.cells[c].emplace_back(std::nullopt);
            else t.cells[c].emplace_back(std::string(v));
        }
    }
    if (!record.empty()) throw std::runtime_error("Unterminated quoted field in " + path.string());
    return t;
}

}
