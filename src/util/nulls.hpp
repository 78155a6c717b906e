#pragma once
#include <string_view>
#include <string>
#include <vector>

#include "util/strings.hpp"

namespace prc {

// Case-insensitive match against the dialect's null tokens, after trimming.
inline bool is_null_like(std::string_view s, const std::vector<std::string>& nulls) {
    const std::string_view t = trim_view(s);
    for (const auto& n : nulls) {
        if (ieq(t, n)) return true;
    }
    return false;
}

}
