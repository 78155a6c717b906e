#pragma once
#include <CLI/CLI.hpp>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "csv/dialect.hpp"
#include "csv/price_reader.hpp"
#include "money/decimal.hpp"

struct AppOptions {
    // Input (exactly one)
    std::string buckets;                // backend range-aggregation export
    std::string prices;                 // raw product/price table

    // Run
    std::string config = "config/prc.toml";
    std::string project_id;
    std::string output_root = "artifacts";
    std::string report_template = "templates/report.mustache";
    int         target = 3;
    bool        no_report = false;
    bool        verbose = false;

    // Prices input
    std::string              column = "price";
    std::string              match;     // COLUMN=VALUE
    std::string              plan = "fine";
    std::vector<std::string> edges;
    std::vector<double>      percentiles = {20.0, 40.0, 60.0, 80.0};
    std::string              round_to = "10";

    // CSV parsing
    std::string delimiter = ",";
    std::string quote     = "\"";
    bool        has_header = true;

    prc::csv_dialect dialect() const {
        prc::csv_dialect d;
        d.delimiter  = delimiter.empty() ? ',' : delimiter[0];
        d.quote      = quote.empty() ? '"' : quote[0];
        d.has_header = has_header;
        return d;
    }

    std::optional<prc::row_match> row_filter() const {
        if (match.empty()) return std::nullopt;
        return prc::parse_row_match(match);
    }

    std::vector<prc::decimal> edge_values() const {
        std::vector<prc::decimal> out;
        for (const auto& e : edges) out.push_back(prc::decimal::parse(prc::trim_view(e)));
        return out;
    }
};

// Thrown once CLI11 has printed help, version or a parse error.
struct cli_exit {
    int code;
};

inline AppOptions parse_cli(int argc, char** argv) {
    AppOptions opt;
    CLI::App app{"Price Range Collapser: merge fine-grained price buckets into a few balanced ranges"};
    app.set_version_flag("--version", "0.1.0");
    app.set_config("--config", opt.config, "Read options from a TOML/INI file");

    // Input
    auto* source = app.add_option_group("source", "Where the buckets come from");
    source->add_option("--buckets", opt.buckets, "CSV of range buckets (from,to,doc_count)");
    source->add_option("--prices",  opt.prices,  "CSV of items with a price column");
    source->require_option(1);

    // Run
    app.add_option("-t,--target",     opt.target,          "Number of ranges to collapse into")->capture_default_str();
    app.add_option("--project-id",    opt.project_id,      "Run identifier (artifact sub-directory)");
    app.add_option("--output-root",   opt.output_root,     "Artifacts output root")->capture_default_str();
    app.add_option("--template",      opt.report_template, "Mustache template for report.html")->capture_default_str();
    app.add_flag("--no-report",       opt.no_report,       "Skip writing collapse.json and report.html");
    app.add_flag("-v,--verbose",      opt.verbose,         "Log progress to stderr");

    // Prices input
    app.add_option("--column", opt.column, "Price column name (0-based index without a header)")->capture_default_str();
    app.add_option("--match",  opt.match,  "Only rows where COLUMN=VALUE");
    app.add_option("--plan",   opt.plan,   "Range plan for prices: fine | edges | percentile")
        ->capture_default_str();
    app.add_option("--edges",       opt.edges,       "Edges for --plan edges, e.g. 100,200")->delimiter(',');
    app.add_option("--percentiles", opt.percentiles, "Percentiles for --plan percentile")->delimiter(',');
    app.add_option("--round-to",    opt.round_to,    "Round percentile edges to this step")->capture_default_str();

    // CSV parsing
    app.add_option("-d,--delimiter", opt.delimiter,
                   "CSV delimiter (single character, default ',')")->default_val(",");
    app.add_option("-q,--quote",     opt.quote,
                   "CSV quote (single character, default '\"')")->default_val("\"");
    app.add_option("--has-header",   opt.has_header,
                   "CSV has a header row (true/false)")->default_val(true);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        throw cli_exit{app.exit(e)};
    }

    // --- Validation ---
    auto one_char = [](const std::string& s, const char* name){
        if (s.size() != 1)
            throw CLI::ValidationError{name, "must be a single character"};
    };
    one_char(opt.delimiter, "delimiter");
    one_char(opt.quote,     "quote");

    if (opt.plan != "fine" && opt.plan != "edges" && opt.plan != "percentile")
        throw CLI::ValidationError{"plan", "must be one of fine, edges, percentile"};
    if (opt.plan == "edges" && opt.edges.empty())
        throw CLI::ValidationError{"edges", "required with --plan edges"};
    if (!opt.prices.empty() && opt.column.empty())
        throw CLI::ValidationError{"column", "must not be empty"};
    if (!prc::decimal::try_parse(opt.round_to) || prc::decimal::parse(opt.round_to).units() <= 0)
        throw CLI::ValidationError{"round-to", "must be a positive decimal"};
    for (const auto& e : opt.edges) {
        if (!prc::decimal::try_parse(prc::trim_view(e)))
            throw CLI::ValidationError{"edges", "'" + e + "' is not a decimal price"};
    }
    if (!opt.match.empty() && (opt.match.find('=') == std::string::npos || opt.match.front() == '='))
        throw CLI::ValidationError{"match", "must look like COLUMN=VALUE"};

    return opt;
}

inline std::filesystem::path ensure_artifacts_dir(const std::string& root, const std::string& project_id) {
    namespace fs = std::filesystem;
    fs::path dir = fs::path(root) / project_id;
    fs::create_directories(dir);
    return dir;
}
