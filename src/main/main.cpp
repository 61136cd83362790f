#include <fmt/format.h>
#include <filesystem>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../cli/cli_options.hpp"
#include "../cli/exit_codes.hpp"
#include "../core/cumulative.hpp"
#include "../core/equalize.hpp"
#include "../core/histogram.hpp"
#include "../csv/array_loader.hpp"
#include "../csv/grid_reader.hpp"
#include "../metrics/process_stats.hpp"
#include "../metrics/timers.hpp"
#include "../report/emit_result_json.hpp"
#include "../report/emit_run_json.hpp"
#include "../report/render_report.hpp"

namespace fs = std::filesystem;
using namespace histeq;

// ---------- small helpers ----------
static std::string utc_strftime(const char* format) {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[64];
    std::strftime(buf, sizeof(buf), format, &tm);
    return std::string(buf);
}

static std::string now_iso_utc() { return utc_strftime("%Y-%m-%dT%H:%M:%SZ"); }
static std::string gen_project_id() { return utc_strftime("histeq-%Y%m%d-%H%M%S"); }

static std::vector<ReportRow> report_rows(const std::vector<double>& centers,
                                          const std::vector<double>& values) {
    std::vector<ReportRow> rows(centers.size());
    for (std::size_t i = 0; i < centers.size(); ++i) rows[i] = ReportRow{ centers[i], values[i] };
    return rows;
}

int main(int argc, char** argv) try {
    auto opt = parse_cli(argc, argv);
    if (opt.project_id.empty())
        opt.project_id = gen_project_id();

    const fs::path input_path = opt.input;
    if (!fs::exists(input_path)) {
        fmt::print(stderr, "ERROR: input not found: {}\n", input_path.string());
        return exit_io_error;
    }
    if (!opt.mask.empty() && !fs::exists(opt.mask)) {
        fmt::print(stderr, "ERROR: mask not found: {}\n", opt.mask);
        return exit_io_error;
    }

    WallTimer wt_all; wt_all.start();
    const auto started_iso = now_iso_utc();
    std::vector<RunStage> stages;

    const csv_dialect dialect{ opt.delimiter[0], opt.quote[0], opt.has_header };
    const auto chunk = static_cast<std::size_t>(opt.chunk_bytes);
    const shape_t shape = opt.shape.empty() ? shape_t{} : parse_shape(opt.shape);

    // --- stages: load_grid, build_array (malformed input is an IO error)
    std::optional<sample_array> loaded;
    std::optional<mask> selection;
    try {
        StageTimer st_load("load_grid");
        st_load.start();
        const csv_grid grid = read_csv_grid(input_path, dialect, chunk);
        std::optional<csv_grid> mask_grid;
        if (!opt.mask.empty()) mask_grid = read_csv_grid(opt.mask, dialect, chunk);
        st_load.stop();
        stages.push_back(st_load.as_stage());

        StageTimer st_build("build_array");
        st_build.start();
        const std::optional<dtype> type =
            opt.dtype == "auto" ? std::nullopt : std::optional<dtype>(parse_dtype(opt.dtype));
        loaded = grid_to_array(grid, type, shape);
        if (mask_grid) selection = grid_to_mask(*mask_grid, shape);
        st_build.stop();
        stages.push_back(st_build.as_stage());
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return exit_io_error;
    }
    const sample_array& array = *loaded;

    // --- artifacts
    const fs::path out_dir     = ensure_artifacts_dir(opt.output_root, opt.project_id);
    const fs::path result_json = out_dir / "result.json";
    const fs::path run_json    = out_dir / "run.json";
    const fs::path report_html = out_dir / "report.html";

    histogram_options hopt;
    hopt.nbins = opt.nbins;
    hopt.range = parse_source_range(opt.source_range);
    hopt.normalize = opt.normalize;

    const ResultHeader header{ opt.op, input_path.string(), array.type(), array.shape(),
                               opt.nbins, hopt.range };
    ReportContext report{ opt.op, to_string(array.type()), shape_string(array.shape()), "", {} };

    // --- stage: the requested operation
    StageTimer st_op(opt.op.c_str());
    st_op.start();
    if (opt.op == "histogram" && opt.per_channel) {
        const auto h = make_channel_histograms(array, opt.channel_axis, hopt);
        st_op.stop();
        emit_result_json(result_json, header, h);
    } else if (opt.op == "histogram") {
        const auto h = build_histogram(array, hopt);
        st_op.stop();
        emit_result_json(result_json, header, h);
        report.value_label = h.normalized ? "probability" : "count";
        report.rows = report_rows(h.bin_centers, h.counts);
    } else if (opt.op == "cdf") {
        const auto d = cumulative_distribution(array, opt.nbins);
        st_op.stop();
        emit_result_json(result_json, header, d);
        report.value_label = "cdf";
        report.rows = report_rows(d.bin_centers, d.cdf);
    } else {
        const auto out = equalize_hist(array, opt.nbins, selection);
        st_op.stop();
        emit_result_json(result_json, header, out);
    }
    stages.push_back(st_op.as_stage());

    // --- finalize run stats
    wt_all.stop();
    RunInfo run;
    run.started_iso = started_iso;
    run.ended_iso   = now_iso_utc();
    run.wall_ms     = wt_all.ms();
    run.op          = opt.op;
    run.elements    = array.size();
    run.input_bytes = file_size_bytes(input_path);
    run.rss_peak_mb = process_peak_rss_mb();
    run.stages      = stages;
    emit_run_json(run_json, run);

    // --- render report
    try {
        render_report(find_template("report.mustache"), report, result_json, run_json, report_html);
    } catch (const std::exception& re) {
        fmt::print(stderr, "WARN: report render failed: {}\n", re.what());
    }

    fmt::print("OK {}\n", out_dir.string());
    return exit_ok;
}
catch (const CLI::ParseError& e) {
    return e.get_exit_code() == 0 ? exit_ok : exit_bad_arguments; // already printed by CLI11
}
catch (const std::exception& e) {
    fmt::print(stderr, "ERROR: {}\n", e.what());
    return exit_code_for(e);
}
