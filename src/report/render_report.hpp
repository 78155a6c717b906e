#pragma once
#include <fmt/format.h>
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

#include "report/collapse_summary.hpp"
#include "report/emit_collapse_json.hpp"
#include "report/range_label.hpp"

namespace prc {

// ---------- utils ----------
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
 * Finds the report template. An existing `requested` path wins; otherwise its
 * file name is looked up in $PRC_TEMPLATES_DIR, <exe_dir>/templates and
 * <cwd>/templates, in that order.
 */
inline std::filesystem::path resolve_template(const std::filesystem::path& requested) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::is_regular_file(requested, ec)) return requested;

    const fs::path name = requested.filename();
    std::vector<fs::path> candidates;
    if (const char* env = std::getenv("PRC_TEMPLATES_DIR")) candidates.push_back(fs::path(env) / name);
    candidates.push_back(exe_dir() / "templates" / name);
    candidates.push_back(fs::current_path() / "templates" / name);

    std::string tried;
    for (const auto& c : candidates) {
        if (fs::is_regular_file(c, ec)) return c;
        tried += "  - " + c.string() + "\n";
    }
    throw std::runtime_error("Template not found. Looked at:\n" + tried +
                             "Requested path: " + requested.string());
}

// ---------- main ----------
// Renders the report from template text. Buckets are exposed as a list of
// {label, from, to, doc_count, share_pct}; the JSON artifact as {{{collapse_json}}}.
inline std::string render_report_html(const std::string& tmpl, const CollapseSummary& s) {
    namespace mu = kainjow::mustache;

    mu::mustache m{tmpl};
    if (!m.is_valid()) throw std::runtime_error("Mustache template parse error: " + m.error_message());

    const std::uint64_t total = s.output_docs();
    mu::data rows{mu::data::type::list};
    for (const auto& b : s.buckets) {
        const double share = total ? 100.0 * static_cast<double>(b.doc_count) / static_cast<double>(total) : 0.0;
        mu::data row;
        row.set("label",     range_label(b));
        row.set("from",      lower_bound_text(b));
        row.set("to",        upper_bound_text(b));
        row.set("doc_count", std::to_string(b.doc_count));
        row.set("share_pct", fmt::format("{:.1f}", share));
        rows.push_back(row);
    }

    mu::data ctx;
    ctx.set("source_path",   s.source_path);
    ctx.set("source_kind",   s.source_kind);
    ctx.set("started_at",    s.started_at);
    ctx.set("target_count",  std::to_string(s.target_count));
    ctx.set("input_buckets", std::to_string(s.input_buckets));
    ctx.set("total_docs",    std::to_string(total));
    ctx.set("buckets",       rows);
    ctx.set("collapse_json", mu::data(sanitize_for_script(collapse_json(s))));

    return m.render(ctx);
}

inline void render_report(const std::filesystem::path& template_path,
                          const CollapseSummary& summary,
                          const std::filesystem::path& out_html) {
    const auto resolved = resolve_template(template_path);
    std::ifstream tf(resolved, std::ios::binary);
    if (!tf) throw std::runtime_error("Failed to read template: " + resolved.string());
    std::ostringstream tss; tss << tf.rdbuf();

    const std::string rendered = render_report_html(tss.str(), summary);

    std::ofstream out(out_html, std::ios::binary);
    if (!out) throw std::runtime_error("Failed to write: " + out_html.string());
    out << rendered;
}

}
