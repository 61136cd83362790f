#pragma once
#include <mustache.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#if defined(_WIN32)
  #include <windows.h>
#elif defined(__APPLE__)
  #include <mach-o/dyld.h>
#endif

#include "../util/json.hpp"

namespace histeq {

// ---------- utils ----------
inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to read " + p.string());
    std::ostringstream oss; oss << f.rdbuf();
    return oss.str();
}

// Prevent "</script>" from prematurely closing the script tag in HTML
inline std::string sanitize_for_script(std::string s) {
    std::string::size_type pos = 0;
    const std::string needle = "</script>";
    const std::string repl   = "<\\/script>";
    while ((pos = s.find(needle, pos)) != std::string::npos) {
        s.replace(pos, needle.size(), repl);
        pos += repl.size();
    }
    return s;
}

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

/**
 * Locates a template by file name. Order: $HISTEQ_TEMPLATES_DIR,
 * <exe_dir>/templates, <cwd>/templates. Throws with the list of tried paths.
 */
inline std::filesystem::path find_template(const std::string& name) {
    namespace fs = std::filesystem;
    std::vector<fs::path> candidates;
    if (const char* env = std::getenv("HISTEQ_TEMPLATES_DIR")) candidates.push_back(fs::path(env) / name);
    candidates.push_back(exe_dir() / "templates" / name);
    candidates.push_back(fs::current_path() / "templates" / name);

    std::string tried;
    for (const auto& c : candidates) {
        std::error_code ec;
        if (fs::exists(c, ec) && fs::is_regular_file(c, ec)) return c;
        tried += "  - " + c.string() + "\n";
    }
    throw std::runtime_error("Template not found. Looked at:\n" + tried);
}

// One row of the bin table in the report.
struct ReportRow {
    double center = 0.0;
    double value = 0.0;
};

struct ReportContext {
    std::string op;
    std::string dtype;
    std::string shape;
    std::string value_label;       // column header for ReportRow::value
    std::vector<ReportRow> rows;   // empty for equalize
};

// ---------- main ----------
/**
 * Renders report.html from a Mustache template. The two JSON blobs are
 * embedded raw, so the template must use triple braces:
 * {{{result_json}}}, {{{run_json}}}.
 */
inline void render_report(const std::filesystem::path& template_path,
                          const ReportContext& report,
                          const std::filesystem::path& result_json_path,
                          const std::filesystem::path& run_json_path,
                          const std::filesystem::path& out_html) {
    const std::string tmpl = read_file(template_path);

    kainjow::mustache::mustache m{tmpl};
    if (!m.is_valid()) throw std::runtime_error("Mustache template parse error: " + m.error_message());

    using kainjow::mustache::data;

    data rows{data::type::list};
    for (const auto& r : report.rows) {
        data row;
        row.set("center", data(json_number(r.center)));
        row.set("value",  data(json_number(r.value)));
        rows.push_back(row);
    }

    // Be explicit about value types to avoid odd overload resolution issues
    data ctx;
    ctx.set("op",          data(report.op));
    ctx.set("dtype",       data(report.dtype));
    ctx.set("shape",       data(report.shape));
    ctx.set("value_label", data(report.value_label));
    ctx.set("has_rows",    data(!report.rows.empty()));
    ctx.set("rows",        rows);
    ctx.set("result_json", data(sanitize_for_script(read_file(result_json_path))));
    ctx.set("run_json",    data(sanitize_for_script(read_file(run_json_path))));

    const std::string rendered = m.render(ctx);

    std::ofstream out(out_html, std::ios::binary);
    if (!out) throw std::runtime_error("Failed to write: " + out_html.string());
    out << rendered;
}

}
