// src/util/json_escape.hpp
#pragma once
#include <fmt/format.h>
#include <string>
#include <string_view>

namespace prc {

// JSON string escaper: backslash, quote, and control chars (< 0x20).
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 16);
    for (unsigned char c : in) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else          out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

}
