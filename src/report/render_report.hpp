// src/report/render_report.hpp
#pragma once
#include <mustache.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "data/dataset.hpp"
#include "types/parse_date.hpp"

#if defined(_WIN32)
  #include <windows.h>
#elif defined(__APPLE__)
  #include <mach-o/dyld.h>
#endif

namespace ddattr {

// ---------- utils ----------
inline std::filesystem::path exe_dir() {
#if defined(_WIN32)
    wchar_t buf[MAX_PATH]{};
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len == MAX_PATH) return std::filesystem::current_path();
    return std::filesystem::path(buf).parent_path();
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string tmp(size, '\0');
    if (_NSGetExecutablePath(tmp.data(), &size) != 0) return std::filesystem::current_path();
    std::error_code ec;
    auto p = std::filesystem::weakly_canonical(std::filesystem::path(tmp), ec);
    if (ec) p = std::filesystem::path(tmp);
    return p.parent_path();
#else
    std::error_code ec;
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) return std::filesystem::current_path();
    return p.parent_path();
#endif
}

inline std::filesystem::path first_existing(const std::vector<std::filesystem::path>& candidates,
                                            std::string* tried = nullptr) {
    for (const auto& c : candidates) {
        std::error_code ec;
        if (std::filesystem::exists(c, ec) && std::filesystem::is_regular_file(c, ec)) {
            return c;
        }
        if (tried) *tried += "  - " + c.string() + "\n";
    }
    return {};
}

// Exact path, else <exe_dir>/templates/<name>, else <cwd>/templates/<name>.
inline std::filesystem::path resolve_template(const std::filesystem::path& template_path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::exists(template_path, ec) && fs::is_regular_file(template_path, ec)) return template_path;

    const fs::path name = template_path.filename();
    std::string tried;
    fs::path resolved = first_existing({exe_dir() / "templates" / name,
                                        fs::current_path() / "templates" / name}, &tried);
    if (resolved.empty()) {
        std::ostringstream msg;
        msg << "Template not found. Looked at:\n" << tried
            << "Original requested path: " << template_path.string();
        throw std::runtime_error(msg.str());
    }
    return resolved;
}

// ---------- context ----------
namespace detail {

using mdata = kainjow::mustache::data;

inline std::string fmt_opt(const std::optional<double>& v) {
    return v ? fmt::format("{:.6g}", *v) : std::string("NA");
}

inline std::string fmt_opt_time(const std::optional<std::int64_t>& v) {
    return v ? format_datetime(*v) : std::string("NA");
}

inline mdata percentile_rows(const percentile_table& t) {
    mdata rows{mdata::type::list};
    for (std::size_t pct : {0, 5, 25, 50, 75, 95, 100}) {
        if (pct >= t.size()) continue;
        mdata row;
        row.set("pct", std::to_string(pct));
        row.set("value", fmt_opt(t[pct].value));
        rows.push_back(row);
    }
    return rows;
}

// most frequent categories first, at most `top`
inline mdata top_categories(const categorical_summary& c, std::size_t top) {
    std::vector<std::pair<std::string, std::uint64_t>> v(c.freq_table.begin(), c.freq_table.end());
    std::stable_sort(v.begin(), v.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    if (v.size() > top) v.resize(top);
    mdata rows{mdata::type::list};
    for (const auto& [value, freq] : v) {
        mdata row;
        row.set("value", value);
        row.set("freq", std::to_string(freq));
        rows.push_back(row);
    }
    return rows;
}

}

inline kainjow::mustache::data report_context(const dataset& ds, const std::string& source_path,
                                              std::size_t top_categories = 10) {
    using detail::mdata;
    const auto& a = ds.attributes();

    mdata ctx;
    ctx.set("source_path", source_path);
    ctx.set("kind", std::string(to_string(ds.kind())));

    mdata shape{mdata::type::list};
    auto add_shape = [&](const char* name, std::string value) {
        mdata row;
        row.set("name", std::string(name));
        row.set("value", std::move(value));
        shape.push_back(row);
    };
    if (a.n_div)           add_shape(attr::n_div, std::to_string(*a.n_div));
    if (a.n_row)           add_shape(attr::n_row, std::to_string(*a.n_row));
    if (a.tot_object_size) add_shape(attr::tot_object_size, fmt::format("{:.0f} bytes", *a.tot_object_size));
    if (a.keys)            add_shape(attr::keys, fmt::format("{} keys", a.keys->size()));
    ctx.set("shape", shape);

    ctx.set("has_split_size", a.split_size_distn.has_value());
    ctx.set("has_split_rows", a.split_row_distn.has_value());
    if (a.split_size_distn) ctx.set("split_size", detail::percentile_rows(*a.split_size_distn));
    if (a.split_row_distn)  ctx.set("split_rows", detail::percentile_rows(*a.split_row_distn));

    mdata numeric{mdata::type::list}, categorical{mdata::type::list}, datetime{mdata::type::list};
    bool has_numeric = false, has_categorical = false, has_datetime = false;
    if (a.summary) {
        for (const auto& [name, entry] : *a.summary) {
            mdata row;
            row.set("name", name);
            if (const auto* n = std::get_if<numeric_summary>(&entry)) {
                row.set("nna", std::to_string(n->na_count));
                row.set("mean", detail::fmt_opt(n->stats.mean));
                row.set("var", detail::fmt_opt(n->stats.variance));
                row.set("skewness", detail::fmt_opt(n->stats.skewness));
                row.set("kurtosis", detail::fmt_opt(n->stats.kurtosis));
                row.set("min", detail::fmt_opt(n->min));
                row.set("max", detail::fmt_opt(n->max));
                numeric.push_back(row);
                has_numeric = true;
            } else if (const auto* c = std::get_if<categorical_summary>(&entry)) {
                row.set("nna", std::to_string(c->na_count));
                row.set("levels", std::to_string(c->freq_table.size()));
                row.set("complete", c->complete);
                row.set("top", detail::top_categories(*c, top_categories));
                categorical.push_back(row);
                has_categorical = true;
            } else if (const auto* d = std::get_if<datetime_summary>(&entry)) {
                row.set("nna", std::to_string(d->na_count));
                row.set("min", detail::fmt_opt_time(d->min));
                row.set("max", detail::fmt_opt_time(d->max));
                datetime.push_back(row);
                has_datetime = true;
            }
        }
    }
    ctx.set("has_numeric", has_numeric);
    ctx.set("has_categorical", has_categorical);
    ctx.set("has_datetime", has_datetime);
    ctx.set("numeric", numeric);
    ctx.set("categorical", categorical);
    ctx.set("datetime", datetime);
    return ctx;
}

// ---------- main ----------
/**
 * Renders report.html from the dataset's attributes.
 *
 * @param template_path  Exact path or "report.mustache". If not found, tries:
 *                       <exe_dir>/templates/<name>, then <cwd>/templates/<name>.
 */
inline void render_report(const std::filesystem::path& template_path,
                          const dataset& ds,
                          const std::string& source_path,
                          const std::filesystem::path& out_html) {
    const auto resolved = resolve_template(template_path);

    std::ifstream tf(resolved, std::ios::binary);
    if (!tf) throw std::runtime_error("Failed to read template: " + resolved.string());
    std::ostringstream tss; tss << tf.rdbuf();

    kainjow::mustache::mustache m{tss.str()};
    if (!m.is_valid()) throw std::runtime_error("Mustache template parse error: " + m.error_message());

    const std::string rendered = m.render(report_context(ds, source_path));

    std::ofstream out(out_html, std::ios::binary);
    if (!out) throw std::runtime_error("Failed to write: " + out_html.string());
    out << rendered;
}

}
