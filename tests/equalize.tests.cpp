#include "core/equalize.hpp"
#include "core/histogram.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace histeq;
using Catch::Approx;

TEST_CASE("equalize_hist: keeps the shape and returns floating values", "[equalize]")
{
    const sample_array a(std::vector<std::uint16_t>{10, 20, 30, 40, 50, 60}, {2, 3});
    const auto out = equalize_hist(a);

    CHECK(out.shape() == shape_t{2, 3});
    CHECK(out.type() == dtype::float64);
    const auto& v = out.values<double>();
    for (std::size_t i = 1; i < v.size(); ++i) CHECK(v[i] > v[i - 1]);
    CHECK(v.back() == 1.0);

    const sample_array f(std::vector<float>{0.1f, 0.2f, 0.3f});
    CHECK(equalize_hist(f).type() == dtype::float32);
}

TEST_CASE("equalize_hist: constant input maps to one everywhere", "[equalize]")
{
    const sample_array a(std::vector<std::int8_t>{5, 5, 5, 5}, {2, 2});
    const auto out = equalize_hist(a);

    CHECK(out.values<double>() == std::vector<double>{1.0, 1.0, 1.0, 1.0});
}

TEST_CASE("equalize_hist: mask picks the distribution but every element is remapped", "[equalize][mask]")
{
    const sample_array a(std::vector<std::int64_t>{1, 2, 3, 4}, {2, 2});
    const mask m({true, false, false, true}, {2, 2});

    const auto out = equalize_hist(a, 256, m);
    CHECK(out.shape() == shape_t{2, 2});
    CHECK(out.values<double>() == std::vector<double>{0.5, 0.5, 0.5, 1.0});
}

TEST_CASE("equalize_hist: values outside the masked range clamp", "[equalize][mask]")
{
    const sample_array a(std::vector<double>{0.0, 1.0, 2.0, 3.0, 10.0});
    const mask m({false, true, true, true, false}, {5});

    const auto out = equalize_hist(a, 4, m);
    const auto& v = out.values<double>();
    CHECK(v[0] == v[1]);
    CHECK(v[4] == 1.0);
}

TEST_CASE("equalize_hist: mask errors", "[equalize][mask][errors]")
{
    const sample_array a(std::vector<std::uint8_t>{1, 2, 3, 4}, {2, 2});

    CHECK_THROWS_AS(equalize_hist(a, 256, mask({true, true, true, true}, {4})), shape_mismatch);
    CHECK_THROWS_AS(equalize_hist(a, 256, mask({true, true, true, true}, {4})), std::invalid_argument);
    CHECK_THROWS_AS(equalize_hist(a, 256, mask({false, false, false, false}, {2, 2})),
                    std::invalid_argument);
}

TEST_CASE("equalize_hist: output of uniform data is already near the identity", "[equalize]")
{
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> u(0.0, 1.0);
    std::vector<double> v(10000);
    for (auto& x : v) x = u(rng);

    const auto once = equalize_hist(sample_array(v));
    const auto twice = equalize_hist(once);
    const auto& a = once.values<double>();
    const auto& b = twice.values<double>();
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        CHECK(a[i] >= 0.0);
        CHECK(a[i] <= 1.0);
        CHECK(b[i] == Approx(a[i]).margin(0.03));
    }
}

TEST_CASE("equalize_hist: flattens a low-contrast histogram", "[equalize]")
{
    std::mt19937 rng(99);
    std::normal_distribution<double> n(128.0, 6.0);
    std::vector<std::uint8_t> v(20000);
    for (auto& x : v) x = static_cast<std::uint8_t>(std::min(255.0, std::max(0.0, n(rng))));

    const auto out = equalize_hist(sample_array(v));
    const auto h = make_histogram(out, 10);
    for (double c : h.counts) CHECK(c == Approx(2000.0).margin(1400.0));
}

TEST_CASE("equalize_hist: inputs without exact bins fail before any output", "[equalize][errors]")
{
    const std::int64_t big = std::int64_t{1} << 53;
    CHECK_THROWS_AS(equalize_hist(sample_array(std::vector<std::int64_t>{big, big + 1, big + 2, big + 3})),
                    std::invalid_argument);

    try {
        (void)equalize_hist(sample_array(std::vector<double>{1e16, 1e16 + 2}));
        FAIL("expected an error");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()).find("too narrow") != std::string::npos);
    }
}

TEST_CASE("equalize_hist: subnormal ranges are remapped", "[equalize]")
{
    const auto out = equalize_hist(sample_array(std::vector<double>{0.0, 1e-310}));
    const auto& v = out.values<double>();
    CHECK(v[0] < v[1]);
    CHECK(v[1] == 1.0);
}
