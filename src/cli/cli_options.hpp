// src/cli/cli_options.hpp
#pragma once
#include <CLI/CLI.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "data/dataset.hpp"
#include "io/dataset_loader.hpp"
#include "types/infer.hpp"

struct AppOptions {
    // Required/paths
    std::string input;                  // directory of partition files
    std::string run_id;
    std::string output_root = "artifacts";
    std::string report_template = "templates/report.mustache";

    // Engine
    std::string kind = "ddf";           // "ddo" | "ddf"
    std::size_t workers = 0;            // 0 = hardware concurrency
    std::size_t max_categories = 10000;

    // CSV parsing
    std::string delimiter = ",";        // single char, e.g. ","
    std::string quote     = "\"";       // single char, e.g. "\""
    bool        has_header = true;      // header row present?
    std::vector<std::string> force_type;   // "column=family"

    bool quiet = false;
};

// thrown once CLI11 has printed help, version or an argument error
struct CliExit {
    int code = 0;
};

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"ddattr: attributes of a partitioned dataset"};
    app.set_version_flag("--version", "0.2.0");
    app.set_config("--config", "ddattr.toml", "Read options from a TOML/INI file");

    // Required/basic
    app.add_option("--input",       opt.input,      "Directory with one CSV file per partition")->required();
    app.add_option("--run-id",      opt.run_id,     "Run identifier (artifact sub-directory)");
    app.add_option("--output-root", opt.output_root,"Artifacts output root");
    app.add_option("--template",    opt.report_template, "Report template (mustache)");

    // Engine
    app.add_option("--kind", opt.kind, "Dataset kind: ddo (key/value) or ddf (data frame)")
        ->check(CLI::IsMember({"ddo", "ddf"}));
    app.add_option("--workers", opt.workers, "Worker tasks (0 = all cores)");
    app.add_option("--max-categories", opt.max_categories,
                   "Distinct values tracked per categorical column");

    // CSV parsing
    app.add_option("-d,--delimiter", opt.delimiter,
                   "CSV delimiter (single character, default ',')")->default_val(",");
    app.add_option("-q,--quote",     opt.quote,
                   "CSV quote (single character, default '\"')")->default_val("\"");
    app.add_option("--has-header",   opt.has_header,
                   "CSV has a header row (true/false)")->default_val(true);
    app.add_option("--force-type",   opt.force_type,
                   "Column family override, column=numeric|categorical|datetime|skip");

    app.add_flag("--quiet", opt.quiet, "Only print warnings and errors");

    app.allow_windows_style_options();
    try {
        app.parse(argc, argv);

        // --- Validation ---
        auto one_char = [](const std::string& s, const char* name){
            if (s.size() != 1)
                throw CLI::ValidationError{name, "must be a single character"};
        };
        one_char(opt.delimiter, "delimiter");
        one_char(opt.quote,     "quote");

        if (opt.max_categories == 0)
            throw CLI::ValidationError{"max-categories", "must be > 0"};
        for (const auto& f : opt.force_type) {
            const auto eq = f.find('=');
            if (eq == std::string::npos || eq == 0 || !ddattr::parse_family(f.substr(eq + 1)))
                throw CLI::ValidationError{"force-type",
                                           "expected column=numeric|categorical|datetime|skip, got " + f};
        }
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        throw CliExit{code == 0 ? 0 : 1};
    }

    return opt;
}

inline ddattr::load_options to_load_options(const AppOptions& opt) {
    ddattr::load_options lo;
    lo.csv.delimiter = opt.delimiter[0];
    lo.csv.quote = opt.quote[0];
    lo.csv.has_header = opt.has_header;
    lo.kind = opt.kind == "ddo" ? ddattr::dataset_kind::ddo : ddattr::dataset_kind::ddf;
    for (const auto& f : opt.force_type) {
        const auto eq = f.find('=');
        lo.forced_families[f.substr(0, eq)] = *ddattr::parse_family(f.substr(eq + 1));
    }
    return lo;
}

inline std::filesystem::path ensure_artifacts_dir(const std::string& root, const std::string& run_id) {
    namespace fs = std::filesystem;
    fs::path dir = fs::path(root) / run_id;
    fs::create_directories(dir);
    return dir;
}
