// src/collapse/price_range_bucket.hpp
#pragma once
#include <fmt/format.h>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>

#include "money/decimal.hpp"

namespace prc {

// One half-open price range [from, to) and the number of documents in it.
// An absent bound means unbounded on that side.
struct price_range_bucket {
    std::optional<decimal> from;
    std::optional<decimal> to;
    std::uint64_t          doc_count{0};
};

inline bool operator==(const price_range_bucket& a, const price_range_bucket& b) {
    return a.from == b.from && a.to == b.to && a.doc_count == b.doc_count;
}
inline bool operator!=(const price_range_bucket& a, const price_range_bucket& b) { return !(a == b); }

// Ordering for tests and sorted containers: absent `from` sorts first,
// absent `to` sorts last.
inline bool operator<(const price_range_bucket& a, const price_range_bucket& b) {
    auto key = [](const price_range_bucket& x) {
        return std::make_tuple(x.from.has_value(), x.from.value_or(decimal{}),
                               !x.to.has_value(), x.to.value_or(decimal{}),
                               x.doc_count);
    };
    return key(a) < key(b);
}

inline std::string lower_bound_text(const price_range_bucket& b) {
    return b.from ? b.from->to_string() : std::string("-inf");
}
inline std::string upper_bound_text(const price_range_bucket& b) {
    return b.to ? b.to->to_string() : std::string("+inf");
}

inline std::string to_string(const price_range_bucket& b) {
    return fmt::format("[{}, {}) -> {}", lower_bound_text(b), upper_bound_text(b), b.doc_count);
}

inline std::ostream& operator<<(std::ostream& os, const price_range_bucket& b) { return os << to_string(b); }

}

template <>
struct fmt::formatter<prc::price_range_bucket> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const prc::price_range_bucket& b, FormatContext& ctx) const -> decltype(ctx.out()) {
        const std::string s = prc::to_string(b);
        return fmt::formatter<std::string_view>::format(std::string_view(s), ctx);
    }
};
