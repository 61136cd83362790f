#include "core/offset.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace histeq;

TEST_CASE("min_integer_type: picks the narrowest type for a value", "[offset]")
{
    CHECK(min_integer_type(0) == integer_type{8, false});
    CHECK(min_integer_type(255) == integer_type{8, false});
    CHECK(min_integer_type(256) == integer_type{16, false});
    CHECK(min_integer_type(70000) == integer_type{32, false});
    CHECK(min_integer_type(-1) == integer_type{8, true});
    CHECK(min_integer_type(-128) == integer_type{8, true});
    CHECK(min_integer_type(-129) == integer_type{16, true});
    CHECK(min_integer_type(-40000) == integer_type{32, true});
    CHECK(min_integer_type(std::numeric_limits<std::int64_t>::min()) == integer_type{64, true});
}

TEST_CASE("min_span_type: unsigned type for a value span", "[offset]")
{
    CHECK(min_span_type(0) == integer_type{8, false});
    CHECK(min_span_type(65535) == integer_type{16, false});
    CHECK(min_span_type(65536) == integer_type{32, false});
    CHECK(min_span_type(std::uint64_t{1} << 40) == integer_type{64, false});
}

TEST_CASE("promote_types: mixed signedness widens past the unsigned side", "[offset]")
{
    CHECK(promote_types({8, false}, {8, true}) == integer_type{16, true});
    CHECK(promote_types({16, false}, {8, true}) == integer_type{32, true});
    CHECK(promote_types({8, false}, {16, true}) == integer_type{16, true});
    CHECK(promote_types({32, false}, {64, true}) == integer_type{64, true});
    CHECK(promote_types({16, false}, {32, false}) == integer_type{32, false});
    CHECK(promote_types({8, true}, {32, true}) == integer_type{32, true});
    CHECK_THROWS_AS(promote_types({64, false}, {8, true}), std::invalid_argument);
}

TEST_CASE("offset_type: holds both the minimum and the shifted maximum", "[offset]")
{
    // int8 full range: span 255 needs uint8, -128 needs int8 -> int16
    CHECK(offset_type(-128, 255) == integer_type{16, true});
    CHECK(offset_type(-2, 4) == integer_type{8, true});
    CHECK(offset_type(-2, 200) == integer_type{16, true});
    CHECK(offset_type(std::numeric_limits<std::int64_t>::min(), 10) == integer_type{64, true});
}

TEST_CASE("offset_value: shifts without wrapping", "[offset]")
{
    CHECK(offset_value(std::int8_t{127}, std::int16_t{-128}) == 255u);
    CHECK(offset_value(std::int8_t{-128}, std::int16_t{-128}) == 0u);
    const auto lo = std::numeric_limits<std::int64_t>::min();
    CHECK(offset_value(lo + 7, lo) == 7u);
}

TEST_CASE("with_integer_type: dispatches to the matching fixed-width type", "[offset]")
{
    std::size_t width = 0;
    bool is_signed = false;
    with_integer_type({32, true}, [&](auto tag) {
        using W = typename decltype(tag)::type;
        width = sizeof(W);
        is_signed = std::numeric_limits<W>::is_signed;
    });
    CHECK(width == 4);
    CHECK(is_signed);
    CHECK_THROWS_AS(with_integer_type({12, true}, [](auto) {}), std::invalid_argument);
}
