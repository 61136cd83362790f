// src/util/json.hpp
#pragma once
#include <fmt/format.h>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace histeq {

// Minimal JSON string escaper.
// Escapes: backslash, quote, control chars (< 0x20), and common whitespace.
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
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// JSON has no NaN/Inf; they become null.
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    return fmt::format("{}", v);
}

template <class T>
std::string json_array(const std::vector<T>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i) out += ",";
        out += json_number(static_cast<double>(values[i]));
    }
    out += "]";
    return out;
}

}
