// src/collapse/backend_adapter.hpp
#pragma once
#include <fmt/format.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "collapse/collapser.hpp"
#include "collapse/price_range_bucket.hpp"

namespace prc {

// A range bucket as a search backend reports it: floating-point bounds with
// -inf / +inf standing in for the open ends.
struct native_range_bucket {
    std::string  key;
    double       from = -std::numeric_limits<double>::infinity();
    double       to   =  std::numeric_limits<double>::infinity();
    std::int64_t doc_count = 0;
};

inline price_range_bucket from_native(const native_range_bucket& n) {
    if (std::isnan(n.from) || std::isnan(n.to))
        throw std::invalid_argument(fmt::format("bucket '{}' has a NaN bound", n.key));
    if (n.from == std::numeric_limits<double>::infinity())
        throw std::invalid_argument(fmt::format("bucket '{}' starts at +inf", n.key));
    if (n.to == -std::numeric_limits<double>::infinity())
        throw std::invalid_argument(fmt::format("bucket '{}' ends at -inf", n.key));
    if (n.doc_count < 0)
        throw std::invalid_argument(fmt::format("bucket '{}' has negative doc_count {}", n.key, n.doc_count));

    price_range_bucket b;
    if (std::isfinite(n.from)) b.from = decimal::from_double(n.from);
    if (std::isfinite(n.to))   b.to   = decimal::from_double(n.to);
    b.doc_count = static_cast<std::uint64_t>(n.doc_count);
    return b;
}

// Backend-style key: "*-80.0", "80.0-250.0", "250.0-*". Bounds keep every
// significant cent ("80.25-80.5") so distinct buckets never share a key.
inline std::string native_key(const price_range_bucket& b) {
    auto side = [](const std::optional<decimal>& d) {
        if (!d) return std::string("*");
        std::string s = d->to_string();
        while (s.back() == '0' && s[s.size() - 2] != '.') s.pop_back();
        return s;
    };
    return side(b.from) + "-" + side(b.to);
}

inline native_range_bucket to_native(const price_range_bucket& b) {
    if (b.doc_count > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        throw std::invalid_argument(fmt::format("doc_count {} does not fit the backend type", b.doc_count));

    native_range_bucket n;
    n.key = native_key(b);
    if (b.from) n.from = b.from->to_double();
    if (b.to)   n.to   = b.to->to_double();
    n.doc_count = static_cast<std::int64_t>(b.doc_count);
    return n;
}

inline std::vector<price_range_bucket> from_native(const std::vector<native_range_bucket>& native) {
    std::vector<price_range_bucket> out;
    out.reserve(native.size());
    for (const auto& n : native) out.push_back(from_native(n));
    return out;
}

inline std::vector<native_range_bucket> to_native(const std::vector<price_range_bucket>& buckets) {
    std::vector<native_range_bucket> out;
    out.reserve(buckets.size());
    for (const auto& b : buckets) out.push_back(to_native(b));
    return out;
}

inline std::vector<price_range_bucket> collapse_native(const std::vector<native_range_bucket>& native,
                                                       int target_count) {
    return collapse(from_native(native), target_count);
}

}
