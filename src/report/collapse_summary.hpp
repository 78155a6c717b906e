#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "collapse/price_range_bucket.hpp"
#include "metrics/timers.hpp"

namespace prc {

// Everything one collapse run reports: where the buckets came from, what went
// in, what came out, and how long each stage took.
struct CollapseSummary {
    std::string source_kind;   // "buckets" | "prices"
    std::string source_path;
    std::string plan;          // range plan used for prices input; empty otherwise
    std::string started_at;
    int         target_count = 0;

    std::uint64_t input_buckets   = 0;
    std::uint64_t input_non_empty = 0;
    std::uint64_t input_docs      = 0;
    std::uint64_t null_prices     = 0;

    std::vector<price_range_bucket> buckets;
    std::vector<stage_timing>       stages;

    std::uint64_t output_docs() const {
        std::uint64_t n = 0;
        for (const auto& b : buckets) n += b.doc_count;
        return n;
    }
};

// Fills the input statistics from the sequence handed to the collapser.
inline void record_input(CollapseSummary& s, const std::vector<price_range_bucket>& input) {
    s.input_buckets = input.size();
    s.input_non_empty = 0;
    s.input_docs = 0;
    for (const auto& b : input) {
        if (b.doc_count > 0) ++s.input_non_empty;
        s.input_docs += b.doc_count;
    }
}

}
