#pragma once
#include <fmt/format.h>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

#include "money/decimal.hpp"
#include "report/collapse_summary.hpp"
#include "report/range_label.hpp"
#include "util/json_escape.hpp"

namespace prc {

// Bounds are written as strings so the decimal survives JSON number parsing.
inline std::string json_bound(const std::optional<decimal>& d) {
    return d ? fmt::format("\"{}\"", *d) : std::string("null");
}

// collapse.json (schema v1) as a string; also embedded in report.html.
inline std::string collapse_json(const CollapseSummary& s) {
    std::string out;
    out += "{\n";
    out += R"(  "version":"1",)";
    out += "\n  " + fmt::format(R"("started_at":"{}",)", json_escape(s.started_at));
    out += "\n  " + fmt::format(R"("source":{{"kind":"{}","path":"{}","plan":{}}},)",
                                json_escape(s.source_kind), json_escape(s.source_path),
                                s.plan.empty() ? std::string("null") : "\"" + json_escape(s.plan) + "\"");
    out += "\n  " + fmt::format(R"("target_count":{},)", s.target_count);
    out += "\n  " + fmt::format(R"("input":{{"buckets":{},"non_empty":{},"doc_count":{},"null_prices":{}}},)",
                                s.input_buckets, s.input_non_empty, s.input_docs, s.null_prices);

    out += "\n  \"buckets\":[\n";
    for (std::size_t i = 0; i < s.buckets.size(); ++i) {
        const auto& b = s.buckets[i];
        out += fmt::format(R"(    {{"from":{},"to":{},"doc_count":{},"label":"{}"}})",
                           json_bound(b.from), json_bound(b.to), b.doc_count, json_escape(range_label(b)));
        if (i + 1 < s.buckets.size()) out += ",";
        out += "\n";
    }
    out += "  ],\n";

    out += "  \"stages\":[\n";
    for (std::size_t i = 0; i < s.stages.size(); ++i) {
        out += fmt::format(R"(    {{"name":"{}","ms":{:.3f}}})", json_escape(s.stages[i].name), s.stages[i].ms);
        if (i + 1 < s.stages.size()) out += ",";
        out += "\n";
    }
    out += "  ]\n";
    out += "}\n";
    return out;
}

inline void emit_collapse_json(const std::string& out_path, const CollapseSummary& s) {
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for write: " + out_path);
    f << collapse_json(s);
}

}
