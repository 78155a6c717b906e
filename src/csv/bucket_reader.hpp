// src/csv/bucket_reader.hpp
#pragma once
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "collapse/backend_adapter.hpp"
#include "csv/dialect.hpp"
#include "csv/record_reader.hpp"
#include "util/strings.hpp"

namespace prc {

namespace detail {

inline std::optional<double> parse_double_strict(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(t.c_str(), &end);
    if (errno == ERANGE || end == t.c_str() || *end != '\0' || std::isnan(v)) return std::nullopt;
    return v;
}

inline std::optional<std::int64_t> parse_int64_strict(const std::string& text) {
    const std::string t = trim(text);
    if (t.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE || end == t.c_str() || *end != '\0') return std::nullopt;
    return static_cast<std::int64_t>(v);
}

// Open-ended bounds: an empty cell or "*" means unbounded on that side.
// Other null tokens (NA, NaN, ...) are not bounds.
inline std::optional<double> parse_bound(const std::string& cell, double open_value) {
    const std::string_view t = trim_view(cell);
    if (t.empty() || t == "*") return open_value;
    return parse_double_strict(cell);
}

}

/**
 * Reads a backend range-aggregation export with columns from,to,doc_count
 * (and an optional key). Without a header the first three columns are used in
 * that order. Unbounded edges may be written empty, as "*", or as -inf / inf;
 * only the first row may be open below and only the last open above.
 */
inline std::vector<native_range_bucket> read_native_buckets(const std::filesystem::path& path,
                                                            const csv_dialect& dialect) {
    record_reader rd(path, dialect);
    const std::size_t from_col  = rd.column("from", 0);
    const std::size_t to_col    = rd.column("to", 1);
    const std::size_t count_col = rd.column("doc_count", 2);

    std::optional<std::size_t> key_col;
    if (dialect.has_header) {
        for (std::size_t i = 0; i < rd.header().size(); ++i)
            if (ieq(trim_view(rd.header()[i]), "key")) key_col = i;
    }

    constexpr double inf = std::numeric_limits<double>::infinity();
    std::vector<native_range_bucket> out;
    std::vector<std::string> f;
    while (rd.next(f)) {
        const std::size_t need = std::max({from_col, to_col, count_col});
        if (f.size() <= need) rd.fail(fmt::format("expected at least {} fields, got {}", need + 1, f.size()));

        native_range_bucket b;
        const auto from = detail::parse_bound(f[from_col], -inf);
        if (!from) rd.fail(fmt::format("invalid 'from' bound '{}'", f[from_col]));
        const auto to = detail::parse_bound(f[to_col], inf);
        if (!to) rd.fail(fmt::format("invalid 'to' bound '{}'", f[to_col]));
        const auto count = detail::parse_int64_strict(f[count_col]);
        if (!count) rd.fail(fmt::format("invalid doc_count '{}'", f[count_col]));

        b.from = *from;
        b.to = *to;
        b.doc_count = *count;
        if (key_col && *key_col < f.size()) b.key = trim(f[*key_col]);
        out.push_back(std::move(b));
    }
    return out;
}

}
