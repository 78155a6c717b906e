// src/collapse/collapser.hpp
#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <vector>

#include "collapse/errors.hpp"
#include "collapse/price_range_bucket.hpp"

namespace prc {

namespace detail {

inline price_range_bucket merge_adjacent(const price_range_bucket& lower, const price_range_bucket& upper) {
    return price_range_bucket{lower.from, upper.to, lower.doc_count + upper.doc_count};
}

// One left-to-right scan over consecutive triples (A, B, C).
// A merge consumes the triple and emits two buckets, so the next triple starts
// two positions after A in the shrinking sequence. The scan stops as soon as
// the size reaches `target`; the unvisited tail is carried over unchanged.
inline std::vector<price_range_bucket> collapse_pass(const std::vector<price_range_bucket>& current,
                                                     std::size_t target) {
    std::vector<price_range_bucket> next;
    next.reserve(current.size());

    std::size_t size = current.size();
    std::size_t i = 0;
    while (i + 2 < current.size() && size > target) {
        const price_range_bucket& a = current[i];
        const price_range_bucket& b = current[i + 1];
        const price_range_bucket& c = current[i + 2];

        // strict '<': a tie merges C into B
        if (a.doc_count + b.doc_count < b.doc_count + c.doc_count) {
            next.push_back(merge_adjacent(a, b));
            next.push_back(c);
        } else {
            next.push_back(a);
            next.push_back(merge_adjacent(b, c));
        }
        --size;
        i += 3;
    }
    next.insert(next.end(), current.begin() + static_cast<std::ptrdiff_t>(i), current.end());
    return next;
}

// Outer buckets always read "below"/"and above"; interior `from` follows the
// previous `to` so ranges left by dropped or merged buckets stay covered.
inline void normalize_bounds(std::vector<price_range_bucket>& buckets) {
    if (buckets.empty()) return;
    buckets.front().from.reset();
    for (std::size_t i = 1; i < buckets.size(); ++i) {
        buckets[i].from = buckets[i - 1].to;
    }
    buckets.back().to.reset();
}

}

/**
 * Fails fast on input the collapser cannot reason about: adjacent buckets
 * whose shared bound differs, inverted buckets, open bounds anywhere but the
 * two outer ends, or counts whose sum does not fit in 64 bits.
 */
inline void validate_buckets(const std::vector<price_range_bucket>& buckets) {
    std::uint64_t total = 0;
    for (std::size_t i = 0; i < buckets.size(); ++i) {
        const auto& b = buckets[i];
        if (b.from && b.to && !(*b.from < *b.to)) {
            throw non_contiguous_buckets(fmt::format("bucket {} is empty or inverted: {}", i, b));
        }
        // only the outer ends may be open
        if (i > 0 && !b.from) {
            throw non_contiguous_buckets(fmt::format("bucket {} is open below but is not the first: {}", i, b));
        }
        if (i + 1 < buckets.size() && !b.to) {
            throw non_contiguous_buckets(fmt::format("bucket {} is open above but is not the last: {}", i, b));
        }
        if (i > 0) {
            const auto& prev = buckets[i - 1];
            if (prev.to && b.from && *prev.to != *b.from) {
                throw non_contiguous_buckets(fmt::format(
                    "buckets {} and {} are not contiguous: {} then {}", i - 1, i, prev, b));
            }
        }
        if (b.doc_count > std::numeric_limits<std::uint64_t>::max() - total) {
            throw std::invalid_argument("total doc_count overflows 64 bits");
        }
        total += b.doc_count;
    }
}

/**
 * Reduces an ascending, contiguous bucket sequence to at most `target_count`
 * buckets.
 *
 * Zero-count buckets are dropped first. While too many buckets remain, the
 * lighter of the two adjacent pairs in each scanned triple is merged (left
 * pair only when strictly lighter). The result always starts unbounded below
 * and ends unbounded above. The input is not modified.
 *
 * Throws std::invalid_argument for target_count < 1 or malformed input
 * (non_contiguous_buckets), and empty_distribution when every count is zero.
 */
inline std::vector<price_range_bucket> collapse(const std::vector<price_range_bucket>& buckets,
                                                int target_count) {
    if (target_count < 1) {
        throw std::invalid_argument(fmt::format("target_count must be >= 1 (got {})", target_count));
    }
    validate_buckets(buckets);

    std::vector<price_range_bucket> current;
    current.reserve(buckets.size());
    std::copy_if(buckets.begin(), buckets.end(), std::back_inserter(current),
                 [](const price_range_bucket& b) { return b.doc_count > 0; });
    if (current.empty()) {
        throw empty_distribution(fmt::format("all {} buckets have doc_count == 0", buckets.size()));
    }

    const auto target = static_cast<std::size_t>(target_count);
    while (current.size() > target) {
        if (current.size() < 3) {
            // two buckets, target 1: no triple to scan
            current = {detail::merge_adjacent(current[0], current[1])};
            break;
        }
        current = detail::collapse_pass(current, target);
    }

    detail::normalize_bounds(current);
    return current;
}

}
