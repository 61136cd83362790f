#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../metrics/timers.hpp"
#include "../util/json.hpp"

namespace histeq {

struct RunInfo {
    std::string started_iso;
    std::string ended_iso;
    double wall_ms = 0.0;
    std::string op;
    std::uint64_t elements = 0;
    std::uintmax_t input_bytes = 0;
    double rss_peak_mb = 0.0;
    std::vector<RunStage> stages;
};

inline const char* host_os() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#else
    return "linux";
#endif
}

inline const char* host_arch() {
#if defined(__x86_64__) || defined(_M_X64)
    return "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#else
    return "unknown";
#endif
}

// Writes run.json (schema v1).
inline void emit_run_json(const std::filesystem::path& out_path, const RunInfo& run) {
    const double secs = run.wall_ms / 1000.0;
    const double eps  = secs > 0.0 ? static_cast<double>(run.elements) / secs : 0.0;

    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for write: " + out_path.string());

    f << "{\n";
    f << R"(  "version":"1",)"
      << "\n  " << fmt::format(R"("started_at":"{}",)", run.started_iso)
      << "\n  " << fmt::format(R"("ended_at":"{}",)", run.ended_iso)
      << "\n  " << fmt::format(R"("op":"{}",)", json_escape(run.op))
      << "\n  " << fmt::format(R"("wall_time_ms":{},)", json_number(run.wall_ms))
      << "\n  " << fmt::format(R"("elements":{},)", run.elements)
      << "\n  " << fmt::format(R"("input_bytes":{},)", run.input_bytes)
      << "\n  " << fmt::format(R"("throughput_elements_s":{},)", json_number(eps))
      << "\n  " << fmt::format(R"("rss_peak_mb":{},)", json_number(run.rss_peak_mb))
      << "\n  " << fmt::format(R"("host":{{"os":"{}","arch":"{}"}},)", host_os(), host_arch());

    f << "\n  \"stages\":[\n";
    for (std::size_t i = 0; i < run.stages.size(); ++i) {
        const auto& s = run.stages[i];
        f << "    "
          << fmt::format(R"({{"name":"{}","calls":{},"ms":{}}})",
                         json_escape(s.name), s.calls, json_number(s.ms));
        if (i + 1 < run.stages.size()) f << ",";
        f << "\n";
    }
    f << "  ]\n";
    f << "}\n";
}

}
