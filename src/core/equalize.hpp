#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "cumulative.hpp"
#include "interp.hpp"
#include "sample_array.hpp"

namespace histeq {

/**
 * Remaps every element of `a` through the cumulative distribution of its
 * values, flattening the output distribution towards uniform on [0, 1].
 *
 * With a mask, only the selected elements shape the distribution but every
 * element is still remapped. The result has the shape of `a`; its element
 * type is float32 for float32 input and float64 otherwise.
 *
 * Throws shape_mismatch when the mask shape differs from `a`, and
 * std::invalid_argument when no element is left to build the distribution.
 */
inline sample_array equalize_hist(const sample_array& a, int nbins = 256,
                                  const std::optional<mask>& m = std::nullopt)
{
    distribution d = m ? cumulative_distribution(select(a, *m), nbins)
                       : cumulative_distribution(a, nbins);
    const linear_lookup lookup(std::move(d.bin_centers), std::move(d.cdf));

    return a.visit([&](const auto& v) {
        using T = typename std::decay_t<decltype(v)>::value_type;
        using out_t = std::conditional_t<std::is_same_v<T, float>, float, double>;

        std::vector<out_t> out(v.size());
        const auto n = static_cast<std::ptrdiff_t>(v.size());

#pragma omp parallel for schedule(static) if (v.size() >= detail::parallel_min_elements)
        for (std::ptrdiff_t i = 0; i < n; ++i) {
            const auto k = static_cast<std::size_t>(i);
            out[k] = static_cast<out_t>(lookup(static_cast<double>(v[k])));
        }
        return sample_array(std::move(out), a.shape());
    });
}

}
