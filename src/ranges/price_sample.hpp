#pragma once
#include <algorithm>
#include <cstddef>
#include <vector>

#include "money/decimal.hpp"

namespace prc {

// Running summary of a price column plus the sample kept for percentiles.
struct price_sample {
    std::size_t null_count{0};
    std::vector<decimal> values;
    decimal min{}, max{};

    void add_null() { ++null_count; }
    void add(decimal x) {
        if (values.empty()) { min = max = x; }
        else {
            if (x < min) min = x;
            if (x > max) max = x;
        }
        values.push_back(x);
    }
    std::size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }

    // Linear interpolation between closest ranks, q in [0, 1].
    double quantile(double q) const {
        if (values.empty()) return 0.0;
        std::vector<double> v;
        v.reserve(values.size());
        for (decimal d : values) v.push_back(d.to_double());
        std::sort(v.begin(), v.end());
        q = std::clamp(q, 0.0, 1.0);
        double pos = q * static_cast<double>(v.size() - 1);
        std::size_t i = static_cast<std::size_t>(pos);
        double frac = pos - static_cast<double>(i);
        if (i + 1 < v.size()) return v[i] * (1.0 - frac) + v[i + 1] * frac;
        return v[i];
    }
};

}
