// src/csv/price_reader.hpp
#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "csv/dialect.hpp"
#include "csv/record_reader.hpp"
#include "money/decimal.hpp"
#include "ranges/price_sample.hpp"
#include "util/nulls.hpp"
#include "util/strings.hpp"

namespace prc {

// Keeps only rows whose `column` equals `value` (case-insensitive).
struct row_match {
    std::string column;
    std::string value;
};

inline row_match parse_row_match(const std::string& text) {
    const auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0)
        throw std::invalid_argument(fmt::format("match must look like COLUMN=VALUE (got '{}')", text));
    return row_match{trim(text.substr(0, eq)), trim(text.substr(eq + 1))};
}

namespace detail {

// With a header the column is looked up by name; without one it must be a
// 0-based index.
inline std::size_t resolve_column(const record_reader& rd, const std::string& column) {
    if (rd.dialect().has_header) return rd.column(column);
    const std::string t = trim(column);
    if (t.empty() || t.find_first_not_of("0123456789") != std::string::npos)
        throw csv_error(fmt::format("{}: without a header, column must be an index (got '{}')",
                                    rd.path().string(), column));
    // ten or more digits cannot name a field
    if (t.size() > 9)
        throw csv_error(fmt::format("{}: column index {} is out of range", rd.path().string(), t));
    return static_cast<std::size_t>(std::stoul(t));
}

}

/**
 * Reads one price column into a sample. Null-like cells are counted but not
 * sampled; anything else must be an exact decimal with at most two fraction
 * digits.
 */
inline price_sample read_prices(const std::filesystem::path& path,
                                const std::string& column,
                                const csv_dialect& dialect,
                                const std::optional<row_match>& match = std::nullopt) {
    record_reader rd(path, dialect);
    const std::size_t price_col = detail::resolve_column(rd, column);
    std::optional<std::size_t> match_col;
    if (match) match_col = detail::resolve_column(rd, match->column);

    price_sample sample;
    std::vector<std::string> f;
    while (rd.next(f)) {
        if (match_col) {
            if (*match_col >= f.size() || !ieq(trim_view(f[*match_col]), match->value)) continue;
        }
        if (price_col >= f.size() || is_null_like(f[price_col], dialect.null_tokens)) {
            sample.add_null();
            continue;
        }
        const auto price = decimal::try_parse(trim_view(f[price_col]));
        if (!price) rd.fail(fmt::format("invalid price '{}'", f[price_col]));
        sample.add(*price);
    }
    return sample;
}

}
