#pragma once
#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "histogram.hpp"
#include "sample_array.hpp"

namespace histeq {

struct distribution {
    std::vector<double> cdf;          // non-decreasing, cdf.back() == 1
    std::vector<double> bin_centers;

    std::size_t size() const noexcept { return cdf.size(); }
};

// Normalized running sum of the image-range histogram of `a`.
inline distribution cumulative_distribution(const sample_array& a, int nbins = 256) {
    histogram h = make_histogram(a, nbins, source_range::image, false);

    distribution d;
    d.cdf.resize(h.counts.size());
    std::partial_sum(h.counts.begin(), h.counts.end(), d.cdf.begin());

    const double total = d.cdf.back();
    if (total == 0.0)
        throw division_by_zero("cannot build a distribution from a histogram with zero total count");
    for (double& c : d.cdf) c /= total;

    d.bin_centers = std::move(h.bin_centers);
    return d;
}

}
