#pragma once
#include <CLI/CLI.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "../core/sample_array.hpp"

namespace histeq {

struct AppOptions {
    // Required/paths
    std::string input;
    std::string mask;                   // optional boolean grid, equalize only
    std::string project_id;
    std::string output_root = "artifacts";

    // Operation
    std::string op = "equalize";        // histogram | cdf | equalize
    std::string dtype = "auto";         // auto | int8 ... float64
    std::string shape;                  // e.g. "4,4,3"; empty = rows x cols
    int         nbins = 256;
    std::string source_range = "image";
    bool        normalize = false;
    int         channel_axis = 0;
    bool        per_channel = false;    // set when --channel-axis is given

    // Perf
    int64_t     chunk_bytes = 262144;   // 256 KiB default

    // CSV parsing
    std::string delimiter = ",";        // single char
    std::string quote     = "\"";       // single char
    bool        has_header = false;
};

// "4,4,3" -> {4, 4, 3}
inline shape_t parse_shape(const std::string& s) {
    shape_t shape;
    std::size_t pos = 0;
    while (pos <= s.size()) {
        const std::size_t comma = s.find(',', pos);
        const std::string part = s.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
        if (part.empty() || part.find_first_not_of("0123456789") != std::string::npos)
            throw CLI::ValidationError{"shape", "expected comma-separated positive integers, got '" + s + "'"};
        const unsigned long long d = std::stoull(part);
        if (d == 0) throw CLI::ValidationError{"shape", "dimensions must be > 0"};
        shape.push_back(static_cast<std::size_t>(d));
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return shape;
}

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"histeq: histogram, CDF and histogram equalization of numeric grids"};
    app.set_version_flag("--version", "0.1.0");

    // Required/basic
    app.add_option("--input",       opt.input,      "Path to input CSV grid")->required();
    app.add_option("--mask",        opt.mask,       "Boolean CSV grid selecting elements for the distribution");
    app.add_option("--project-id",  opt.project_id, "Project/run identifier");
    app.add_option("--output-root", opt.output_root,"Artifacts output root");

    // Operation
    app.add_option("--op", opt.op, "Operation")
        ->check(CLI::IsMember({"histogram", "cdf", "equalize"}));
    app.add_option("--dtype", opt.dtype, "Element type (auto infers int64 or float64)")
        ->check(CLI::IsMember({"auto", "int8", "int16", "int32", "int64", "uint8", "uint16",
                               "uint32", "uint64", "float32", "float64"}));
    app.add_option("--shape", opt.shape, "Reshape the grid, e.g. 4,4,3");
    app.add_option("--nbins", opt.nbins, "Bucket count for floating arrays");
    app.add_option("--source-range", opt.source_range, "Histogram value range")
        ->check(CLI::IsMember({"image", "dtype"}));
    app.add_flag("--normalize", opt.normalize, "Histogram counts as probability mass");
    auto* channel = app.add_option("--channel-axis", opt.channel_axis,
                                   "Per-channel histograms along this axis");

    // Perf
    app.add_option("--chunk-bytes", opt.chunk_bytes, "Read chunk size (bytes)");

    // CSV parsing
    app.add_option("-d,--delimiter", opt.delimiter,
                   "CSV delimiter (single character, default ',')")->default_val(",");
    app.add_option("-q,--quote",     opt.quote,
                   "CSV quote (single character, default '\"')")->default_val("\"");
    app.add_option("--has-header",   opt.has_header,
                   "CSV has a header row (true/false)")->default_val(false);

    // Errors are printed here; the caller only maps them to an exit code.
    try {
        app.parse(argc, argv);

        // --- Validation ---
        auto one_char = [](const std::string& s, const char* name){
            if (s.size() != 1)
                throw CLI::ValidationError{name, "must be a single character"};
        };
        one_char(opt.delimiter, "delimiter");
        one_char(opt.quote,     "quote");

        opt.per_channel = channel->count() > 0;
        if (opt.per_channel && opt.op != "histogram")
            throw CLI::ValidationError{"channel-axis", "only applies to --op histogram"};
        if (!opt.mask.empty() && opt.op != "equalize")
            throw CLI::ValidationError{"mask", "only applies to --op equalize"};
        if (opt.nbins <= 0)
            throw CLI::ValidationError{"nbins", "must be > 0"};
        if (opt.chunk_bytes <= 0)
            throw CLI::ValidationError{"chunk-bytes", "must be > 0"};
        if (!opt.shape.empty()) parse_shape(opt.shape);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        throw;
    }

    return opt;
}

inline std::filesystem::path ensure_artifacts_dir(const std::string& root, const std::string& project_id) {
    namespace fs = std::filesystem;
    fs::path dir = fs::path(root) / project_id;
    fs::create_directories(dir);
    return dir;
}

}
