#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace histeq {

// Width and signedness of an integer type, e.g. {16, true} for int16_t.
struct integer_type {
    unsigned bits = 8;
    bool is_signed = false;

    bool operator==(const integer_type& o) const noexcept {
        return bits == o.bits && is_signed == o.is_signed;
    }
    bool operator!=(const integer_type& o) const noexcept { return !(*this == o); }
};

inline std::string to_string(integer_type t) {
    return (t.is_signed ? "int" : "uint") + std::to_string(t.bits);
}

// Smallest type holding `value`; unsigned for non-negative values.
inline integer_type min_integer_type(std::int64_t value) {
    if (value >= 0) {
        const auto u = static_cast<std::uint64_t>(value);
        if (u <= std::numeric_limits<std::uint8_t>::max())  return {8, false};
        if (u <= std::numeric_limits<std::uint16_t>::max()) return {16, false};
        if (u <= std::numeric_limits<std::uint32_t>::max()) return {32, false};
        return {64, false};
    }
    if (value >= std::numeric_limits<std::int8_t>::min())  return {8, true};
    if (value >= std::numeric_limits<std::int16_t>::min()) return {16, true};
    if (value >= std::numeric_limits<std::int32_t>::min()) return {32, true};
    return {64, true};
}

// Smallest unsigned type holding a value span.
inline integer_type min_span_type(std::uint64_t span) {
    if (span <= std::numeric_limits<std::uint8_t>::max())  return {8, false};
    if (span <= std::numeric_limits<std::uint16_t>::max()) return {16, false};
    if (span <= std::numeric_limits<std::uint32_t>::max()) return {32, false};
    return {64, false};
}

/**
 * Smallest type that holds every value of both `a` and `b`.
 * Mixing signedness needs a signed type wider than the unsigned side, so
 * uint64 with any signed type has no result and is rejected.
 */
inline integer_type promote_types(integer_type a, integer_type b) {
    if (a.is_signed == b.is_signed)
        return {a.bits > b.bits ? a.bits : b.bits, a.is_signed};

    const integer_type s = a.is_signed ? a : b;
    const integer_type u = a.is_signed ? b : a;
    if (s.bits > u.bits) return s;
    if (u.bits >= 64)
        throw std::invalid_argument("no integer type holds both " + to_string(a) + " and " +
                                    to_string(b));
    return {u.bits * 2, true};
}

// Type in which `value - low` is computed for values in [low, low + span].
inline integer_type offset_type(std::int64_t low, std::uint64_t span) {
    return promote_types(min_span_type(span), min_integer_type(low));
}

template <class T> struct type_tag { using type = T; };

// Calls f(type_tag<W>{}) with W the fixed-width type described by `t`.
template <class F>
void with_integer_type(integer_type t, F&& f) {
    switch ((t.is_signed ? 100u : 0u) + t.bits) {
        case 8:   f(type_tag<std::uint8_t>{});  break;
        case 16:  f(type_tag<std::uint16_t>{}); break;
        case 32:  f(type_tag<std::uint32_t>{}); break;
        case 64:  f(type_tag<std::uint64_t>{}); break;
        case 108: f(type_tag<std::int8_t>{});   break;
        case 116: f(type_tag<std::int16_t>{});  break;
        case 132: f(type_tag<std::int32_t>{});  break;
        case 164: f(type_tag<std::int64_t>{});  break;
        default:
            throw std::invalid_argument("unsupported integer type: " + to_string(t));
    }
}

// `value - offset` computed in W. The caller picks W with offset_type() so
// the difference is non-negative and representable.
template <class W, class T>
inline std::uint64_t offset_value(T value, W offset) noexcept {
    return static_cast<std::uint64_t>(static_cast<W>(static_cast<W>(value) - offset));
}

}
