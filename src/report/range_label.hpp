#pragma once
#include <fmt/format.h>
#include <string>

#include "collapse/price_range_bucket.hpp"

namespace prc {

// Display text for a collapsed range; open ends read "under"/"and above".
inline std::string range_label(const price_range_bucket& b) {
    if (b.from && b.to) return fmt::format("{} - {}", *b.from, *b.to);
    if (b.to)           return fmt::format("under {}", *b.to);
    if (b.from)         return fmt::format("{} and above", *b.from);
    return "any price";
}

}
