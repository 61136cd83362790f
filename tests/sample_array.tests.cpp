#include "core/dtype.hpp"
#include "core/sample_array.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace histeq;

TEST_CASE("sample_array: element type follows the stored vector", "[sample_array]")
{
    CHECK(sample_array(std::vector<std::int8_t>{1}).type() == dtype::int8);
    CHECK(sample_array(std::vector<std::uint32_t>{1}).type() == dtype::uint32);
    CHECK(sample_array(std::vector<float>{1.0f}).type() == dtype::float32);
    CHECK(sample_array().type() == dtype::float64);
    CHECK(sample_array().empty());
}

TEST_CASE("sample_array: shape must hold every element", "[sample_array]")
{
    const sample_array a(std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6}, {2, 3});
    CHECK(a.ndim() == 2);
    CHECK(a.size() == 6);
    CHECK(a.value_at(4) == 5.0);
    CHECK(shape_string(a.shape()) == "(2, 3)");

    CHECK_THROWS_AS(sample_array(std::vector<std::uint8_t>{1, 2, 3}, {2, 2}), std::invalid_argument);
    CHECK_THROWS_AS(sample_array(std::vector<std::uint8_t>{1}, shape_t{}), std::invalid_argument);
    CHECK_THROWS_AS(a.reshaped({4}), std::invalid_argument);
    CHECK(a.reshaped({3, 2, 1}).shape() == shape_t{3, 2, 1});
}

TEST_CASE("sample_array: typed access checks the element type", "[sample_array]")
{
    const sample_array a(std::vector<std::int16_t>{-5, 5});
    CHECK(a.values<std::int16_t>() == std::vector<std::int16_t>{-5, 5});
    CHECK_THROWS_AS(a.values<std::int32_t>(), std::invalid_argument);
}

TEST_CASE("select: keeps masked elements in row-major order", "[sample_array][mask]")
{
    const sample_array a(std::vector<double>{1.5, 2.5, 3.5, 4.5}, {2, 2});
    const mask m({false, true, true, false}, {2, 2});

    CHECK(m.count() == 2);
    const auto s = select(a, m);
    CHECK(s.shape() == shape_t{2});
    CHECK(s.values<double>() == std::vector<double>{2.5, 3.5});

    CHECK_THROWS_AS(select(a, mask({true, true, true, true}, {1, 4})), shape_mismatch);
    CHECK_THROWS_AS(mask({true, false}, {3}), std::invalid_argument);
}

TEST_CASE("parse_dtype: names round-trip", "[dtype]")
{
    CHECK(parse_dtype("uint16") == dtype::uint16);
    CHECK(std::string(to_string(parse_dtype("float32"))) == "float32");
    CHECK(is_integer(dtype::int64));
    CHECK_FALSE(is_integer(dtype::float64));
    CHECK_THROWS_AS(parse_dtype("int128"), std::invalid_argument);
}

TEST_CASE("type_range: integer limits and the nominal float range", "[dtype]")
{
    CHECK(type_range<std::int8_t>().min == -128);
    CHECK(type_range<std::uint16_t>().max == 65535);
    CHECK(type_range<float>().min == -1.0f);
    CHECK(type_range<double>().max == 1.0);
}
