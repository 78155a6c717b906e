// src/money/decimal.hpp
#pragma once
#include <fmt/format.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace prc {

// Fixed-point money value: a signed count of minor units (cents).
// Scale matches the source price field (scaled_float, scaling_factor 100).
class decimal {
public:
    static constexpr int          scale = 2;
    static constexpr std::int64_t units_per_whole = 100;

    constexpr decimal() = default;

    static constexpr decimal from_units(std::int64_t units) noexcept {
        decimal d;
        d.units_ = units;
        return d;
    }

    static decimal from_integer(std::int64_t whole) {
        constexpr std::int64_t lim = std::numeric_limits<std::int64_t>::max() / units_per_whole;
        if (whole > lim || whole < -lim)
            throw std::invalid_argument(fmt::format("decimal overflow: {}", whole));
        return from_units(whole * units_per_whole);
    }

    // Rounds half away from zero to the scale. Only the backend adapter
    // should need this; everything else stays in exact units.
    static decimal from_double(double v) {
        if (!std::isfinite(v))
            throw std::invalid_argument("decimal from non-finite value");
        const double scaled = v * static_cast<double>(units_per_whole);
        if (!(std::fabs(scaled) < 9.0e18))
            throw std::invalid_argument(fmt::format("decimal out of range: {}", v));
        return from_units(static_cast<std::int64_t>(std::llround(scaled)));
    }

    static std::optional<decimal> try_parse(std::string_view s) {
        std::size_t i = 0;
        bool neg = false;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) { neg = s[i] == '-'; ++i; }

        constexpr std::int64_t whole_lim = std::numeric_limits<std::int64_t>::max() / units_per_whole;
        std::int64_t whole = 0;
        std::int64_t frac = 0;
        int frac_digits = 0;
        bool digit = false;

        for (; i < s.size() && s[i] >= '0' && s[i] <= '9'; ++i) {
            digit = true;
            whole = whole * 10 + (s[i] - '0');
            if (whole > whole_lim) return std::nullopt;
        }
        if (i < s.size() && s[i] == '.') {
            ++i;
            for (; i < s.size() && s[i] >= '0' && s[i] <= '9'; ++i) {
                digit = true;
                if (frac_digits < scale) {
                    frac = frac * 10 + (s[i] - '0');
                    ++frac_digits;
                } else if (s[i] != '0') {
                    return std::nullopt; // would need rounding
                }
            }
        }
        if (!digit || i != s.size()) return std::nullopt;

        for (; frac_digits < scale; ++frac_digits) frac *= 10;
        if (whole > (std::numeric_limits<std::int64_t>::max() - frac) / units_per_whole) return std::nullopt;
        const std::int64_t units = whole * units_per_whole + frac;
        return from_units(neg ? -units : units);
    }

    static decimal parse(std::string_view s) {
        if (auto d = try_parse(s)) return *d;
        throw std::invalid_argument(fmt::format("not a decimal with at most {} fraction digits: '{}'", scale, s));
    }

    constexpr std::int64_t units() const noexcept { return units_; }

    double to_double() const noexcept {
        return static_cast<double>(units_) / static_cast<double>(units_per_whole);
    }

    std::string to_string() const {
        const bool neg = units_ < 0;
        const std::uint64_t mag = neg ? (~static_cast<std::uint64_t>(units_) + 1u)
                                      : static_cast<std::uint64_t>(units_);
        return fmt::format("{}{}.{:02}", neg ? "-" : "", mag / units_per_whole, mag % units_per_whole);
    }

    friend constexpr decimal operator+(decimal a, decimal b) noexcept { return from_units(a.units_ + b.units_); }
    friend constexpr decimal operator-(decimal a, decimal b) noexcept { return from_units(a.units_ - b.units_); }

    friend constexpr bool operator==(decimal a, decimal b) noexcept { return a.units_ == b.units_; }
    friend constexpr bool operator!=(decimal a, decimal b) noexcept { return a.units_ != b.units_; }
    friend constexpr bool operator< (decimal a, decimal b) noexcept { return a.units_ <  b.units_; }
    friend constexpr bool operator<=(decimal a, decimal b) noexcept { return a.units_ <= b.units_; }
    friend constexpr bool operator> (decimal a, decimal b) noexcept { return a.units_ >  b.units_; }
    friend constexpr bool operator>=(decimal a, decimal b) noexcept { return a.units_ >= b.units_; }

private:
    std::int64_t units_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, decimal d) { return os << d.to_string(); }

}

template <>
struct fmt::formatter<prc::decimal> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const prc::decimal& d, FormatContext& ctx) const -> decltype(ctx.out()) {
        const std::string s = d.to_string();
        return fmt::formatter<std::string_view>::format(std::string_view(s), ctx);
    }
};
