#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace histeq {

enum class dtype { int8, int16, int32, int64, uint8, uint16, uint32, uint64, float32, float64 };

inline const char* to_string(dtype t) {
    switch (t) {
        case dtype::int8:    return "int8";
        case dtype::int16:   return "int16";
        case dtype::int32:   return "int32";
        case dtype::int64:   return "int64";
        case dtype::uint8:   return "uint8";
        case dtype::uint16:  return "uint16";
        case dtype::uint32:  return "uint32";
        case dtype::uint64:  return "uint64";
        case dtype::float32: return "float32";
        default:             return "float64";
    }
}

inline dtype parse_dtype(std::string_view s) {
    static constexpr dtype all[] = {
        dtype::int8,  dtype::int16,  dtype::int32,  dtype::int64,   dtype::uint8,
        dtype::uint16, dtype::uint32, dtype::uint64, dtype::float32, dtype::float64};
    for (dtype t : all) {
        if (s == to_string(t)) return t;
    }
    throw std::invalid_argument("unknown dtype: " + std::string(s));
}

inline bool is_integer(dtype t) { return t != dtype::float32 && t != dtype::float64; }

// Maps an element type to its tag; only the ten supported types are valid.
template <class T> struct dtype_of;
template <> struct dtype_of<std::int8_t>   { static constexpr dtype value = dtype::int8; };
template <> struct dtype_of<std::int16_t>  { static constexpr dtype value = dtype::int16; };
template <> struct dtype_of<std::int32_t>  { static constexpr dtype value = dtype::int32; };
template <> struct dtype_of<std::int64_t>  { static constexpr dtype value = dtype::int64; };
template <> struct dtype_of<std::uint8_t>  { static constexpr dtype value = dtype::uint8; };
template <> struct dtype_of<std::uint16_t> { static constexpr dtype value = dtype::uint16; };
template <> struct dtype_of<std::uint32_t> { static constexpr dtype value = dtype::uint32; };
template <> struct dtype_of<std::uint64_t> { static constexpr dtype value = dtype::uint64; };
template <> struct dtype_of<float>         { static constexpr dtype value = dtype::float32; };
template <> struct dtype_of<double>        { static constexpr dtype value = dtype::float64; };

template <class T>
struct type_range_t {
    T min;
    T max;
};

/**
 * Representable value range of an element type.
 * Integers report their full numeric limits. Floating types report the
 * nominal intensity range of floating images, [-1, 1], not the IEEE limits:
 * equal-width buckets over [-FLT_MAX, FLT_MAX] would overflow the bin width.
 */
template <class T>
constexpr type_range_t<T> type_range() {
    if constexpr (std::is_integral_v<T>) {
        return {std::numeric_limits<T>::min(), std::numeric_limits<T>::max()};
    } else {
        return {T(-1), T(1)};
    }
}

}
