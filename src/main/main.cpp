#include <fmt/format.h>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "cli/cli_options.hpp"
#include "engine/update_attributes.hpp"
#include "exec/local_executor.hpp"
#include "io/dataset_loader.hpp"
#include "metrics/process_stats.hpp"
#include "metrics/timers.hpp"
#include "report/emit_attributes_json.hpp"
#include "report/emit_run_json.hpp"
#include "report/render_report.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

// ---------- small helpers ----------
static std::tm utc_now() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return tm;
}

static std::string now_iso_utc() {
    const std::tm tm = utc_now();
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

static std::string gen_run_id() {
    const std::tm tm = utc_now();
    char buf[64];
    std::strftime(buf, sizeof(buf), "ddattr-%Y%m%d-%H%M%S", &tm);
    return std::string(buf);
}

int main(int argc, char** argv) try {
    auto opt = parse_cli(argc, argv);
    if (opt.run_id.empty())
        opt.run_id = gen_run_id();
    ddattr::log::set_quiet(opt.quiet);

    const fs::path input_path = opt.input;
    if (!fs::exists(input_path)) {
        ddattr::log::error("input not found: {}", input_path.string());
        return 2; // IO error
    }

    ddattr::wall_timer wt_all; wt_all.start();
    ddattr::run_info run;
    run.started_at = now_iso_utc();
    std::vector<ddattr::run_stage> stages;

    // --- stage: load partitions
    ddattr::stage_timer st_load("load_partitions");
    st_load.start();
    ddattr::dataset ds = ddattr::load_dataset_dir(input_path, to_load_options(opt));
    st_load.stop();
    stages.push_back(st_load.as_stage());

    // --- stage: one map/reduce pass for the missing attributes
    ddattr::engine_config cfg;
    cfg.max_categories = opt.max_categories;
    ddattr::exec_config exec_cfg;
    exec_cfg.workers = opt.workers;

    ddattr::stage_timer st_attrs("update_attributes");
    st_attrs.start();
    ddattr::local_executor exec;
    const auto report = ddattr::update_attributes(ds, exec, cfg, ddattr::estimate_object_size, exec_cfg);
    st_attrs.stop();
    stages.push_back(st_attrs.as_stage());

    // --- artifacts
    const fs::path out_dir     = ensure_artifacts_dir(opt.output_root, opt.run_id);
    const fs::path attrs_json  = out_dir / "attributes.json";
    const fs::path run_json    = out_dir / "run.json";
    const fs::path report_html = out_dir / "report.html";

    ddattr::stage_timer st_emit("emit_artifacts");
    st_emit.start();
    ddattr::emit_attributes_json(attrs_json.string(), input_path.string(), ds);
    try {
        ddattr::render_report(opt.report_template, ds, input_path.string(), report_html);
    } catch (const std::exception& re) {
        ddattr::log::warn("report render failed: {}", re.what());
    }
    st_emit.stop();
    stages.push_back(st_emit.as_stage());

    wt_all.stop();
    run.ended_at = now_iso_utc();
    run.wall_ms = wt_all.ms();
    run.partitions = ds.partitions().size();
    run.workers = opt.workers ? opt.workers : std::max(1u, std::thread::hardware_concurrency());
    run.computed = report.computed;
    run.attributes = report.attributes;
    run.rss_peak_mb = ddattr::process_peak_rss_mb();
    ddattr::emit_run_json(run_json.string(), run, stages);

    fmt::print("OK {}\n", out_dir.string());
    return 0;
}
catch (const CliExit& e) {
    return e.code; // usage/errors already printed by CLI11
}
catch (const ddattr::precondition_error& e) {
    ddattr::log::error("{}", e.what());
    return 3;
}
catch (const std::exception& e) {
    ddattr::log::error("{}", e.what());
    return 4; // internal error
}
