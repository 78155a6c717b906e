// src/csv/record_reader.hpp
#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "csv/dialect.hpp"
#include "util/strings.hpp"

namespace prc {

// RFC4180-ish: quoted fields, doubled quote as escape. One physical line.
inline std::vector<std::string> parse_csv_line(const std::string& line, char delim, char quote) {
    std::vector<std::string> out;
    std::string cur;
    bool inq = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inq) {
            if (c == quote) {
                if (i + 1 < line.size() && line[i + 1] == quote) { cur.push_back(quote); ++i; }
                else { inq = false; }
            } else {
                cur.push_back(c);
            }
        } else {
            if (c == quote) { inq = true; }
            else if (c == delim) { out.push_back(cur); cur.clear(); }
            else { cur.push_back(c); }
        }
    }
    out.push_back(cur);
    return out;
}

// Streams records from a delimited file. The header row, when the dialect has
// one, is consumed up front and exposed through column().
class record_reader {
public:
    record_reader(const std::filesystem::path& p, csv_dialect dialect)
        : path_(p), dialect_(std::move(dialect))
    {
        in_.open(path_, std::ios::binary);
        if (!in_) throw csv_error("Failed to open: " + path_.string());
        if (dialect_.has_header) {
            std::vector<std::string> fields;
            if (next(fields)) header_ = std::move(fields);
            else throw csv_error(fmt::format("{}: missing header row", path_.string()));
        }
    }

    // Reads the next non-blank record; false at EOF.
    bool next(std::vector<std::string>& fields) {
        std::string line;
        while (std::getline(in_, line)) {
            ++line_no_;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (trim_view(line).empty()) continue;
            fields = parse_csv_line(line, dialect_.delimiter, dialect_.quote);
            return true;
        }
        return false;
    }

    // Index of a header column (case-insensitive), or of the positional
    // fallback when the file has no header.
    std::size_t column(std::string_view name, std::optional<std::size_t> positional = std::nullopt) const {
        if (!dialect_.has_header) {
            if (positional) return *positional;
            throw csv_error(fmt::format("{}: column '{}' needs a header row", path_.string(), name));
        }
        for (std::size_t i = 0; i < header_.size(); ++i) {
            if (ieq(trim_view(header_[i]), name)) return i;
        }
        throw csv_error(fmt::format("{}: no column named '{}'", path_.string(), name));
    }

    const std::vector<std::string>& header() const noexcept { return header_; }
    const csv_dialect& dialect() const noexcept { return dialect_; }
    std::size_t line_no() const noexcept { return line_no_; }
    const std::filesystem::path& path() const noexcept { return path_; }

    [[noreturn]] void fail(std::string_view what) const {
        throw csv_error(fmt::format("{}:{}: {}", path_.string(), line_no_, what));
    }

private:
    std::filesystem::path path_;
    csv_dialect dialect_;
    std::ifstream in_;
    std::vector<std::string> header_;
    std::size_t line_no_ = 0;
};

}
