#include "report/emit_result_json.hpp"
#include "report/emit_run_json.hpp"
#include "report/render_report.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using namespace histeq;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string& name) {
    const fs::path dir = fs::temp_directory_path() / name;
    fs::create_directories(dir);
    return dir;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}

TEST_CASE("emit_result_json: histogram fields", "[report]")
{
    const auto dir = scratch_dir("histeq_report_hist");
    const sample_array a(std::vector<std::uint8_t>{0, 0, 1, 1, 2, 2, 3, 3}, {2, 4});
    const auto h = make_histogram(a);
    const ResultHeader header{"histogram", "in\\grid.csv", a.type(), a.shape(), 256, source_range::image};

    emit_result_json(dir / "result.json", header, h);
    const std::string text = read_file(dir / "result.json");

    CHECK(contains(text, R"("op":"histogram")"));
    CHECK(contains(text, R"("source_path":"in\\grid.csv")"));
    CHECK(contains(text, R"("dtype":"uint8")"));
    CHECK(contains(text, R"("shape":[2,4])"));
    CHECK(contains(text, R"("normalized":false)"));
    CHECK(contains(text, R"("counts":[2,2,2,2])"));
    fs::remove_all(dir);
}

TEST_CASE("emit_result_json: equalized values and channels", "[report]")
{
    const auto dir = scratch_dir("histeq_report_eq");
    const sample_array a(std::vector<float>{0.25f, 0.5f});
    const ResultHeader header{"equalize", "x.csv", a.type(), a.shape(), 256, source_range::image};

    emit_result_json(dir / "eq.json", header, a);
    CHECK(contains(read_file(dir / "eq.json"), R"("values":[0.25,0.5])"));

    channel_histograms ch;
    ch.bin_centers = {1, 2};
    ch.counts = {{1, 0}, {0, 1}};
    emit_result_json(dir / "ch.json", header, ch);
    const std::string text = read_file(dir / "ch.json");
    CHECK(contains(text, "\"channels\":["));
    CHECK(contains(text, "[0,1]"));
    fs::remove_all(dir);
}

TEST_CASE("emit_run_json: stages and host", "[report]")
{
    const auto dir = scratch_dir("histeq_report_run");
    RunInfo run;
    run.op = "cdf";
    run.elements = 1000;
    run.wall_ms = 500.0;
    run.stages = {RunStage{"load_grid", 1, 1.5}, RunStage{"cdf", 1, 2.0}};

    emit_run_json(dir / "run.json", run);
    const std::string text = read_file(dir / "run.json");
    CHECK(contains(text, R"("throughput_elements_s":2000)"));
    CHECK(contains(text, R"({"name":"load_grid","calls":1,"ms":1.5})"));
    CHECK(contains(text, host_os()));
    fs::remove_all(dir);
}

TEST_CASE("render_report: bin table and embedded json", "[report]")
{
    const auto dir = scratch_dir("histeq_report_html");
    const sample_array a(std::vector<std::int16_t>{-1, 0, 0});
    const auto d = cumulative_distribution(a);
    const ResultHeader header{"cdf", "a.csv", a.type(), a.shape(), 256, source_range::image};
    emit_result_json(dir / "result.json", header, d);
    emit_run_json(dir / "run.json", RunInfo{});

    ReportContext ctx{"cdf", "int16", shape_string(a.shape()), "cdf", {}};
    for (std::size_t i = 0; i < d.size(); ++i) ctx.rows.push_back(ReportRow{d.bin_centers[i], d.cdf[i]});

    const fs::path tmpl = fs::path(HISTEQ_TEST_TEMPLATES_DIR) / "report.mustache";
    render_report(tmpl, ctx, dir / "result.json", dir / "run.json", dir / "report.html");
    const std::string html = read_file(dir / "report.html");

    CHECK(contains(html, "<th>cdf</th>"));
    CHECK(contains(html, "<td>-1</td>"));
    CHECK(contains(html, "\"cdf\":["));
    CHECK_FALSE(contains(html, "listed in"));
    fs::remove_all(dir);
}

TEST_CASE("sanitize_for_script: closing tags are escaped", "[report]")
{
    CHECK(sanitize_for_script("a</script>b</script>") == "a<\\/script>b<\\/script>");
}

TEST_CASE("find_template: missing names list the paths tried", "[report][errors]")
{
    CHECK_THROWS_AS(find_template("no_such_template.mustache"), std::runtime_error);
}
