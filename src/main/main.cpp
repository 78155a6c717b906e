#include <fmt/format.h>
#include <filesystem>
#include <ctime>
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include "../cli/cli_options.hpp"
#include "../collapse/backend_adapter.hpp"
#include "../collapse/collapser.hpp"
#include "../csv/bucket_reader.hpp"
#include "../csv/price_reader.hpp"
#include "../metrics/timers.hpp"
#include "../ranges/range_plan.hpp"
#include "../report/collapse_summary.hpp"
#include "../report/emit_collapse_json.hpp"
#include "../report/range_label.hpp"
#include "../report/render_report.hpp"
#include "../util/log.hpp"

namespace fs = std::filesystem;

// ---------- small helpers ----------
static std::string now_iso_utc() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

static std::string gen_project_id() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[64];
    std::strftime(buf, sizeof(buf), "price-ranges-%Y%m%d-%H%M%S", &tm);
    return std::string(buf);
}

// Picks the range plan for prices input and records the one actually used.
static prc::range_plan choose_plan(const AppOptions& opt, const prc::price_sample& sample,
                                   prc::CollapseSummary& summary) {
    auto chosen = prc::select_plan(opt.plan, sample, opt.edge_values(), opt.percentiles,
                                   prc::decimal::parse(opt.round_to));
    if (chosen.name != opt.plan)
        prc::log::warn("price distribution too narrow for {} ranges; using the {} plan", opt.plan, chosen.name);
    prc::log::info("{} plan: {} edges", chosen.name, chosen.plan.edges.size());
    summary.plan = chosen.name;
    return std::move(chosen.plan);
}

static void print_ranges(const std::vector<prc::price_range_bucket>& buckets) {
    std::uint64_t total = 0;
    for (const auto& b : buckets) total += b.doc_count;

    fmt::print("{:<28} {:>10} {:>7}\n", "range", "documents", "share");
    for (const auto& b : buckets) {
        const double share = total ? 100.0 * static_cast<double>(b.doc_count) / static_cast<double>(total) : 0.0;
        fmt::print("{:<28} {:>10} {:>6.1f}%\n", prc::range_label(b), b.doc_count, share);
    }
}

int main(int argc, char** argv) try {
    auto opt = parse_cli(argc, argv);
    prc::log::set_verbose(opt.verbose);
    if (opt.project_id.empty())
        opt.project_id = gen_project_id();

    const bool prices_mode = !opt.prices.empty();
    const fs::path input_path = prices_mode ? opt.prices : opt.buckets;
    if (!fs::exists(input_path)) {
        prc::log::error("input not found: {}", input_path.string());
        return 2; // IO error
    }

    prc::CollapseSummary summary;
    summary.started_at   = now_iso_utc();
    summary.source_kind  = prices_mode ? "prices" : "buckets";
    summary.source_path  = input_path.string();
    summary.target_count = opt.target;

    // --- stage: load_input
    std::vector<prc::native_range_bucket> native;
    std::vector<prc::price_range_bucket>  aggregated;
    try {
        prc::StageTimer st_load("load_input");
        if (prices_mode) {
            const auto sample = prc::read_prices(input_path, opt.column, opt.dialect(), opt.row_filter());
            prc::log::info("read {} prices ({} null) from {}", sample.size(), sample.null_count, input_path.string());
            summary.null_prices = sample.null_count;

            const auto plan = choose_plan(opt, sample, summary);
            aggregated = prc::aggregate(sample.values, plan);
        } else {
            native = prc::read_native_buckets(input_path, opt.dialect());
            prc::log::info("read {} buckets from {}", native.size(), input_path.string());
        }
        summary.stages.push_back(st_load.stop());
    } catch (const prc::csv_error& e) {
        prc::log::error("{}", e.what());
        return 2;
    } catch (const std::invalid_argument& e) {
        prc::log::error("{}", e.what());
        return 1; // bad plan or filter arguments
    }

    // --- stage: collapse
    try {
        prc::StageTimer st_collapse("collapse");
        if (prices_mode) {
            prc::record_input(summary, aggregated);
            summary.buckets = prc::collapse(aggregated, opt.target);
        } else {
            const auto input = prc::from_native(native);
            prc::record_input(summary, input);
            summary.buckets = prc::collapse(input, opt.target);
        }
        summary.stages.push_back(st_collapse.stop());
    } catch (const prc::empty_distribution& e) {
        prc::log::error("empty distribution: {}", e.what());
        return 3;
    } catch (const std::invalid_argument& e) {
        prc::log::error("invalid argument: {}", e.what());
        return 3;
    }
    prc::log::info("collapsed {} buckets ({} non-empty) into {}",
              summary.input_buckets, summary.input_non_empty, summary.buckets.size());

    print_ranges(summary.buckets);

    if (opt.no_report) return 0;

    // --- artifacts
    const fs::path out_dir      = ensure_artifacts_dir(opt.output_root, opt.project_id);
    const fs::path collapse_js  = out_dir / "collapse.json";
    const fs::path report_html  = out_dir / "report.html";

    prc::emit_collapse_json(collapse_js.string(), summary);

    try {
        prc::render_report(opt.report_template, summary, report_html);
    } catch (const std::exception& re) {
        prc::log::warn("report render failed: {}", re.what());
    }

    fmt::print("OK {}\n", out_dir.string());
    return 0;
}
catch (const cli_exit& e) {
    return e.code; // CLI11 already printed help/version/error
}
catch (const CLI::ParseError& e) {
    prc::log::error("{}", e.what());
    return 1;
}
catch (const std::exception& e) {
    prc::log::error("{}", e.what());
    return 4; // internal error
}
