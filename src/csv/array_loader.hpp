#pragma once
#include <charconv>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include "../core/dtype.hpp"
#include "../core/sample_array.hpp"
#include "../types/infer.hpp"
#include "grid_reader.hpp"

namespace histeq {

namespace detail {

inline std::string cell_position(const csv_grid& g, std::size_t i) {
    return "row " + std::to_string(i / g.cols + 1) + ", column " + std::to_string(i % g.cols + 1);
}

template <class T>
T parse_cell(const csv_grid& g, std::size_t i) {
    std::string_view s = g.cells[i];
    if constexpr (std::is_integral_v<T>) {
        if (!s.empty() && s[0] == '+') s.remove_prefix(1);
        T v{};
        const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec == std::errc::result_out_of_range)
            throw std::runtime_error(cell_position(g, i) + ": '" + g.cells[i] + "' does not fit " +
                                     to_string(dtype_of<T>::value));
        if (ec != std::errc() || end != s.data() + s.size())
            throw std::runtime_error(cell_position(g, i) + ": '" + g.cells[i] +
                                     "' is not an integer");
        return v;
    } else {
        if (!is_float64(s))
            throw std::runtime_error(cell_position(g, i) + ": '" + g.cells[i] + "' is not a number");
        return static_cast<T>(std::strtod(g.cells[i].c_str(), nullptr));
    }
}

template <class T>
sample_array cells_to_array(const csv_grid& g, shape_t shape) {
    std::vector<T> values(g.cells.size());
    for (std::size_t i = 0; i < values.size(); ++i) values[i] = parse_cell<T>(g, i);
    return sample_array(std::move(values), std::move(shape));
}

inline shape_t grid_shape(const csv_grid& g, const shape_t& requested) {
    if (requested.empty()) return {g.rows, g.cols};
    if (shape_size(requested) != g.cells.size())
        throw std::runtime_error("shape " + shape_string(requested) + " does not hold the " +
                                 std::to_string(g.cells.size()) + " cells of a " +
                                 std::to_string(g.rows) + "x" + std::to_string(g.cols) + " grid");
    return requested;
}

} // namespace detail

/**
 * Builds an array from grid cells. Without `type` the element type is
 * inferred (int64 or float64). An empty `shape` keeps the grid's rows x cols.
 */
inline sample_array grid_to_array(const csv_grid& g, std::optional<dtype> type,
                                  const shape_t& shape = {})
{
    shape_t s = detail::grid_shape(g, shape);
    if (!type) {
        std::size_t bad = 0;
        type = infer_dtype(g.cells, &bad);
        if (!type)
            throw std::runtime_error(detail::cell_position(g, bad) + ": '" + g.cells[bad] +
                                     "' is not a number");
    }
    switch (*type) {
        case dtype::int8:    return detail::cells_to_array<std::int8_t>(g, std::move(s));
        case dtype::int16:   return detail::cells_to_array<std::int16_t>(g, std::move(s));
        case dtype::int32:   return detail::cells_to_array<std::int32_t>(g, std::move(s));
        case dtype::int64:   return detail::cells_to_array<std::int64_t>(g, std::move(s));
        case dtype::uint8:   return detail::cells_to_array<std::uint8_t>(g, std::move(s));
        case dtype::uint16:  return detail::cells_to_array<std::uint16_t>(g, std::move(s));
        case dtype::uint32:  return detail::cells_to_array<std::uint32_t>(g, std::move(s));
        case dtype::uint64:  return detail::cells_to_array<std::uint64_t>(g, std::move(s));
        case dtype::float32: return detail::cells_to_array<float>(g, std::move(s));
        default:             return detail::cells_to_array<double>(g, std::move(s));
    }
}

// Mask from boolean cells (1/0, true/false, yes/no).
inline mask grid_to_mask(const csv_grid& g, const shape_t& shape = {}) {
    shape_t s = detail::grid_shape(g, shape);
    std::vector<bool> flags(g.cells.size());
    for (std::size_t i = 0; i < flags.size(); ++i) {
        const auto b = parse_bool(g.cells[i]);
        if (!b)
            throw std::runtime_error(detail::cell_position(g, i) + ": '" + g.cells[i] +
                                     "' is not a boolean");
        flags[i] = *b;
    }
    return mask(std::move(flags), std::move(s));
}

}
