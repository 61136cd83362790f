#pragma once
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../core/cumulative.hpp"
#include "../core/histogram.hpp"
#include "../core/sample_array.hpp"
#include "../util/json.hpp"

namespace histeq {

// Fields shared by every result.json.
struct ResultHeader {
    std::string op;
    std::string source_path;
    dtype type = dtype::float64;
    shape_t shape;
    int nbins = 256;
    source_range range = source_range::image;
};

namespace detail {

inline std::ofstream open_result(const std::filesystem::path& out_path) {
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for write: " + out_path.string());
    return f;
}

inline void write_header(std::ofstream& f, const ResultHeader& h) {
    f << fmt::format(
R"({{
  "version":"1",
  "op":"{}",
  "source_path":"{}",
  "dtype":"{}",
  "shape":{},
  "nbins":{},
  "source_range":"{}",
)",
        json_escape(h.op),
        json_escape(h.source_path),
        to_string(h.type),
        json_array(h.shape),
        h.nbins,
        to_string(h.range));
}

} // namespace detail

inline void emit_result_json(const std::filesystem::path& out_path, const ResultHeader& h,
                             const histogram& r)
{
    auto f = detail::open_result(out_path);
    detail::write_header(f, h);
    f << fmt::format("  \"normalized\":{},\n", r.normalized ? "true" : "false")
      << "  \"bin_centers\":" << json_array(r.bin_centers) << ",\n"
      << "  \"counts\":" << json_array(r.counts) << "\n}\n";
}

inline void emit_result_json(const std::filesystem::path& out_path, const ResultHeader& h,
                             const channel_histograms& r)
{
    auto f = detail::open_result(out_path);
    detail::write_header(f, h);
    f << fmt::format("  \"normalized\":{},\n", r.normalized ? "true" : "false")
      << "  \"bin_centers\":" << json_array(r.bin_centers) << ",\n"
      << "  \"channels\":[";
    for (std::size_t c = 0; c < r.counts.size(); ++c) {
        if (c) f << ",";
        f << "\n    " << json_array(r.counts[c]);
    }
    f << "\n  ]\n}\n";
}

inline void emit_result_json(const std::filesystem::path& out_path, const ResultHeader& h,
                             const distribution& r)
{
    auto f = detail::open_result(out_path);
    detail::write_header(f, h);
    f << "  \"bin_centers\":" << json_array(r.bin_centers) << ",\n"
      << "  \"cdf\":" << json_array(r.cdf) << "\n}\n";
}

// Equalized output, flat in row-major order.
inline void emit_result_json(const std::filesystem::path& out_path, const ResultHeader& h,
                             const sample_array& r)
{
    auto f = detail::open_result(out_path);
    detail::write_header(f, h);
    f << fmt::format("  \"output_dtype\":\"{}\",\n", to_string(r.type()))
      << "  \"values\":" << r.visit([](const auto& v) { return json_array(v); }) << "\n}\n";
}

}
