#pragma once
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/dtype.hpp"

namespace histeq {

enum class cell_kind { integer_, real_, boolean_, text_ };

inline bool is_int64(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

inline bool is_float64(std::string_view s) {
    if (s.empty()) return false;
    if (s == "nan" || s == "NaN" || s == "inf" || s == "-inf" || s == "+inf") return true;
    bool dot = false, exp = false, digit = false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) { digit = true; continue; }
        if (c == '.' && !dot && !exp) { dot = true; continue; }
        if ((c == 'e' || c == 'E') && !exp && digit) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            if (i + 1 >= s.size()) return false;
            continue;
        }
        return false;
    }
    return digit;
}

inline std::optional<bool> parse_bool(std::string_view s) {
    if (s == "1" || s == "true" || s == "TRUE" || s == "True" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "FALSE" || s == "False" || s == "no") return false;
    return std::nullopt;
}

inline cell_kind classify_cell(std::string_view s) {
    if (is_int64(s))        return cell_kind::integer_;
    if (is_float64(s))      return cell_kind::real_;
    if (parse_bool(s))      return cell_kind::boolean_;
    return cell_kind::text_;
}

/**
 * Element type able to hold every cell: int64 when all cells are integers,
 * float64 when all are numeric. Returns nullopt (and the offending index)
 * when some cell is not a number.
 */
inline std::optional<dtype> infer_dtype(const std::vector<std::string>& cells,
                                        std::size_t* bad_index = nullptr)
{
    bool all_int = true;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        switch (classify_cell(cells[i])) {
            case cell_kind::integer_: break;
            case cell_kind::real_:    all_int = false; break;
            default:
                if (bad_index) *bad_index = i;
                return std::nullopt;
        }
    }
    return all_int ? dtype::int64 : dtype::float64;
}

}
