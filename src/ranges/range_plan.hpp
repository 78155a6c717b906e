// src/ranges/range_plan.hpp
#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "collapse/price_range_bucket.hpp"
#include "money/decimal.hpp"
#include "ranges/price_sample.hpp"

namespace prc {

// Edges of a range aggregation request. k strictly increasing edges describe
// k+1 ranges: (-inf, e0), [e0, e1), ..., [e(k-1), +inf).
struct range_plan {
    std::vector<decimal> edges;

    std::size_t range_count() const { return edges.size() + 1; }
};

inline range_plan plan_from_edges(std::vector<decimal> edges) {
    if (edges.empty()) throw std::invalid_argument("range plan needs at least one edge");
    for (std::size_t i = 1; i < edges.size(); ++i) {
        if (!(edges[i - 1] < edges[i]))
            throw std::invalid_argument(fmt::format(
                "range plan edges must be strictly increasing ({} then {})", edges[i - 1], edges[i]));
    }
    return range_plan{std::move(edges)};
}

// The fine-grained 40-range plan: 10 wide up to 200, 50 wide up to 500,
// 100 wide up to 1000, 500 wide up to 5000.
inline range_plan fine_grained_plan() {
    struct band { std::int64_t upto, step; };
    static const band bands[] = {{200, 10}, {500, 50}, {1000, 100}, {5000, 500}};

    std::vector<decimal> edges;
    std::int64_t edge = 0;
    for (const band& b : bands) {
        for (edge += b.step; edge <= b.upto; edge += b.step) edges.push_back(decimal::from_integer(edge));
        edge -= b.step;
    }
    return range_plan{std::move(edges)};
}

/**
 * Derives edges from the price distribution itself: each requested percentile
 * (0..100) is rounded to the nearest multiple of `step` and duplicates are
 * dropped. Returns nullopt when the sample is empty or fewer than three
 * distinct edges survive; such a narrow distribution needs no price ranges.
 */
inline std::optional<range_plan> percentile_plan(const price_sample& sample,
                                                 const std::vector<double>& percentiles,
                                                 decimal step) {
    if (step.units() <= 0) throw std::invalid_argument(fmt::format("rounding step must be > 0 (got {})", step));
    if (sample.empty()) return std::nullopt;

    std::vector<decimal> edges;
    for (double p : percentiles) {
        if (!(p >= 0.0 && p <= 100.0))
            throw std::invalid_argument(fmt::format("percentile must be in [0, 100] (got {})", p));
        const double value = sample.quantile(p / 100.0);
        const auto steps = std::llround(value / step.to_double());
        edges.push_back(decimal::from_units(steps * step.units()));
    }
    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());

    if (edges.size() < 3) return std::nullopt;
    return range_plan{std::move(edges)};
}

// The plan a run actually used; `name` is what the artifacts report.
struct chosen_plan {
    std::string name;
    range_plan  plan;
};

/**
 * Builds the plan named by `kind` ("fine", "edges" or "percentile"). A
 * percentile plan that degenerates falls back to the fine-grained plan and is
 * reported as "fine".
 */
inline chosen_plan select_plan(const std::string& kind,
                               const price_sample& sample,
                               const std::vector<decimal>& edges,
                               const std::vector<double>& percentiles,
                               decimal step) {
    if (kind == "edges") return chosen_plan{kind, plan_from_edges(edges)};
    if (kind == "percentile") {
        if (auto p = percentile_plan(sample, percentiles, step)) return chosen_plan{kind, std::move(*p)};
        return chosen_plan{"fine", fine_grained_plan()};
    }
    if (kind == "fine") return chosen_plan{kind, fine_grained_plan()};
    throw std::invalid_argument(fmt::format("unknown range plan '{}'", kind));
}

// Counts prices into the plan's half-open ranges. Every range is reported,
// empty ones included, in ascending order.
inline std::vector<price_range_bucket> aggregate(const std::vector<decimal>& prices, const range_plan& plan) {
    std::vector<price_range_bucket> out(plan.range_count());
    for (std::size_t i = 0; i < plan.edges.size(); ++i) {
        out[i].to = plan.edges[i];
        out[i + 1].from = plan.edges[i];
    }
    for (decimal p : prices) {
        const auto it = std::upper_bound(plan.edges.begin(), plan.edges.end(), p);
        ++out[static_cast<std::size_t>(it - plan.edges.begin())].doc_count;
    }
    return out;
}

}
