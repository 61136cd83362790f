#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include "dtype.hpp"
#include "errors.hpp"
#include "offset.hpp"
#include "sample_array.hpp"
#include "../util/log.hpp"

namespace histeq {

enum class source_range { image, dtype };

inline const char* to_string(source_range r) {
    return r == source_range::dtype ? "dtype" : "image";
}

inline source_range parse_source_range(std::string_view s) {
    if (s == "image") return source_range::image;
    if (s == "dtype") return source_range::dtype;
    throw std::invalid_argument("source_range must be 'image' or 'dtype', got '" +
                                std::string(s) + "'");
}

// Upper bound on allocated bins, whether from nbins or an integer value range.
constexpr std::size_t default_max_bins = std::size_t{1} << 24;

struct histogram_options {
    int nbins = 256;                  // bucket count, float arrays only
    source_range range = source_range::image;
    bool normalize = false;
    std::size_t max_bins = default_max_bins;
};

struct histogram {
    std::vector<double> counts;       // frequencies, or probability mass when normalized
    std::vector<double> bin_centers;  // strictly increasing
    bool normalized = false;

    std::size_t size() const noexcept { return counts.size(); }
};

struct channel_histograms {
    std::vector<std::vector<double>> counts;  // one row per channel
    std::vector<double> bin_centers;
    bool normalized = false;
};

namespace detail {

// Arrays smaller than this are counted serially.
constexpr std::size_t parallel_min_elements = std::size_t{1} << 16;
// Per-thread count buffers are only used up to this many bins.
constexpr std::size_t parallel_max_bins = std::size_t{1} << 16;

inline void validate_options(const histogram_options& o) {
    if (o.nbins <= 0)
        throw std::invalid_argument("nbins must be > 0, got " + std::to_string(o.nbins));
    if (static_cast<std::size_t>(o.nbins) > o.max_bins)
        throw std::invalid_argument("nbins " + std::to_string(o.nbins) + " exceeds the limit of " +
                                    std::to_string(o.max_bins) + " bins");
    if (o.range != source_range::image && o.range != source_range::dtype)
        throw std::invalid_argument("source_range must be 'image' or 'dtype'");
}

// ---------- integer values: one bin per value ----------
template <class T>
struct integer_layout {
    T lo{};
    T hi{};
    std::size_t nbins = 0;
};

// Integer bin centers are doubles, exact only up to 2^53 in magnitude.
constexpr std::int64_t exact_integer_limit = std::int64_t{1} << 53;

template <class T>
bool exact_in_double(T x) {
    if constexpr (std::is_signed_v<T>) {
        const auto w = static_cast<std::int64_t>(x);
        return w >= -exact_integer_limit && w <= exact_integer_limit;
    } else {
        return static_cast<std::uint64_t>(x) <= static_cast<std::uint64_t>(exact_integer_limit);
    }
}

template <class T>
integer_layout<T> integer_bins(const std::vector<T>& v, const histogram_options& o) {
    integer_layout<T> l;
    if (o.range == source_range::image) {
        auto [mn, mx] = std::minmax_element(v.begin(), v.end());
        l.lo = *mn;
        l.hi = *mx;
    } else {
        l.lo = type_range<T>().min;
        l.hi = type_range<T>().max;
    }
    if (!exact_in_double(l.lo) || !exact_in_double(l.hi))
        throw std::invalid_argument("integer value range [" + std::to_string(l.lo) + ", " +
                                    std::to_string(l.hi) + "] exceeds +/-2^53, where bin "
                                    "centers are no longer exact");
    // Modular unsigned difference is exact for any lo <= hi of a 64-bit or narrower type.
    const std::uint64_t span = static_cast<std::uint64_t>(l.hi) - static_cast<std::uint64_t>(l.lo);
    if (span >= o.max_bins)
        throw std::invalid_argument("integer value range [" + std::to_string(l.lo) + ", " +
                                    std::to_string(l.hi) + "] needs more than " +
                                    std::to_string(o.max_bins) + " bins");
    l.nbins = static_cast<std::size_t>(span) + 1;
    return l;
}

template <class W, class T>
std::vector<std::uint64_t> count_offset_values(const std::vector<T>& v, W offset,
                                               std::uint64_t first_bin, std::size_t nbins)
{
    std::vector<std::uint64_t> counts(nbins, 0);
    const auto n = static_cast<std::ptrdiff_t>(v.size());

#pragma omp parallel if (v.size() >= parallel_min_elements && nbins <= parallel_max_bins)
    {
        std::vector<std::uint64_t> local(nbins, 0);
#pragma omp for nowait
        for (std::ptrdiff_t i = 0; i < n; ++i) {
            ++local[offset_value(v[static_cast<std::size_t>(i)], offset) - first_bin];
        }
#pragma omp critical(histeq_merge_counts)
        for (std::size_t k = 0; k < nbins; ++k) counts[k] += local[k];
    }
    return counts;
}

/**
 * Counts every value of `v` into the bins of `l`.
 * Negative lower bounds are shifted to zero first, in an integer type wide
 * enough for both the shifted maximum and the original minimum. With a
 * non-negative lower bound the values are used as-is and counting starts at
 * bin `lo`, so bins below the smallest value are never allocated.
 */
template <class T>
std::vector<std::uint64_t> count_integers(const std::vector<T>& v, const integer_layout<T>& l) {
    if constexpr (std::is_signed_v<T>) {
        if (l.lo < 0) {
            std::vector<std::uint64_t> counts;
            const integer_type wide = offset_type(static_cast<std::int64_t>(l.lo),
                                                  static_cast<std::uint64_t>(l.nbins - 1));
            with_integer_type(wide, [&](auto tag) {
                using W = typename decltype(tag)::type;
                counts = count_offset_values(v, static_cast<W>(l.lo), 0, l.nbins);
            });
            return counts;
        }
    }
    return count_offset_values(v, T{0}, static_cast<std::uint64_t>(l.lo), l.nbins);
}

template <class T>
std::vector<double> integer_centers(const integer_layout<T>& l) {
    using wide_t = std::conditional_t<std::is_signed_v<T>, std::int64_t, std::uint64_t>;
    std::vector<double> centers(l.nbins);
    for (std::size_t i = 0; i < l.nbins; ++i)
        centers[i] = static_cast<double>(static_cast<wide_t>(l.lo) + static_cast<wide_t>(i));
    return centers;
}

// ---------- floating values: equal-width buckets ----------
struct bucket_layout {
    double first = 0.0;
    double last = 0.0;
    std::size_t nbins = 0;

    double width() const { return (last - first) / static_cast<double>(nbins); }

    double edge(std::size_t i) const {
        if (i >= nbins) return last;
        return first + width() * static_cast<double>(i);
    }

    double center(std::size_t i) const { return (edge(i) + edge(i + 1)) / 2.0; }

    // Bucket of `x`, or nbins when x lies outside [first, last] or is NaN.
    // Buckets are half-open except the last, which also holds `last`.
    std::size_t index(double x) const {
        if (!(x >= first && x <= last)) return nbins;
        // (x - first) <= (last - first), so the quotient is at most ~nbins
        const double q = (x - first) / width();
        std::size_t idx = q < static_cast<double>(nbins) ? static_cast<std::size_t>(q) : nbins - 1;
        if (x < edge(idx)) {
            --idx;
        } else if (idx + 1 < nbins && x >= edge(idx + 1)) {
            ++idx;
        }
        return idx;
    }
};

/**
 * Rejects layouts whose buckets cannot be told apart in double precision:
 * a bucket width that underflows to zero, or a range so narrow relative to
 * its magnitude that neighbouring edges or centers round to the same value.
 */
inline void check_bucket_resolution(const bucket_layout& b) {
    bool ok = b.width() > 0.0;
    for (std::size_t i = 1; ok && i < b.nbins; ++i) {
        ok = b.edge(i) > b.edge(i - 1) && b.center(i) > b.center(i - 1);
    }
    if (!ok)
        throw std::invalid_argument(fmt::format(
            "data range [{}, {}] is too narrow for {} distinct buckets at double precision",
            b.first, b.last, b.nbins));
}

template <class T>
bucket_layout float_bins(const std::vector<T>& v, const histogram_options& o) {
    bucket_layout b;
    b.nbins = static_cast<std::size_t>(o.nbins);
    if (o.range == source_range::dtype) {
        b.first = static_cast<double>(type_range<T>().min);
        b.last = static_cast<double>(type_range<T>().max);
        return b;
    }
    double mn = static_cast<double>(v.front());
    double mx = mn;
    for (T x : v) {
        const double d = static_cast<double>(x);
        if (!std::isfinite(d))
            throw std::invalid_argument("autodetected range of the data is not finite");
        mn = std::min(mn, d);
        mx = std::max(mx, d);
    }
    if (mn == mx) {
        mn -= 0.5;
        mx += 0.5;
    }
    if (!std::isfinite(mx - mn))
        throw std::invalid_argument("data range is too wide for equal-width buckets");
    b.first = mn;
    b.last = mx;
    check_bucket_resolution(b);
    return b;
}

template <class T>
std::vector<std::uint64_t> count_buckets(const std::vector<T>& v, const bucket_layout& b) {
    std::vector<std::uint64_t> counts(b.nbins, 0);
    const auto n = static_cast<std::ptrdiff_t>(v.size());

#pragma omp parallel if (v.size() >= parallel_min_elements && b.nbins <= parallel_max_bins)
    {
        std::vector<std::uint64_t> local(b.nbins, 0);
#pragma omp for nowait
        for (std::ptrdiff_t i = 0; i < n; ++i) {
            const std::size_t idx = b.index(static_cast<double>(v[static_cast<std::size_t>(i)]));
            if (idx < b.nbins) ++local[idx];
        }
#pragma omp critical(histeq_merge_buckets)
        for (std::size_t k = 0; k < b.nbins; ++k) counts[k] += local[k];
    }
    return counts;
}

inline std::vector<double> bucket_centers(const bucket_layout& b) {
    std::vector<double> centers(b.nbins);
    for (std::size_t i = 0; i < b.nbins; ++i) centers[i] = b.center(i);
    return centers;
}

// ---------- shared ----------
inline std::vector<double> to_frequencies(const std::vector<std::uint64_t>& counts, bool normalize) {
    std::vector<double> out(counts.begin(), counts.end());
    if (!normalize) return out;
    double total = 0.0;
    for (double c : out) total += c;
    if (total == 0.0)
        throw division_by_zero("cannot normalize a histogram with zero total count");
    for (double& c : out) c /= total;
    return out;
}

inline void warn_if_color_shape(const shape_t& shape) {
    if (shape.size() == 3 && shape.back() < 4) {
        log_warn("This might be a color image of shape {}. The histogram will be computed on "
                 "the flattened image. You can instead apply this function to each color "
                 "channel, or set channel_axis.", shape_string(shape));
    }
}

// Row-major copy of channel `c` along an axis with `inner` elements per step.
template <class T>
std::vector<T> channel_slice(const std::vector<T>& v, std::size_t channels, std::size_t inner,
                             std::size_t c)
{
    std::vector<T> out;
    out.reserve(v.size() / channels);
    for (std::size_t i = 0; i < v.size(); ++i) {
        if ((i / inner) % channels == c) out.push_back(v[i]);
    }
    return out;
}

} // namespace detail

/**
 * Histogram of every element of `a`, flattened.
 *
 * Integer arrays get one bin per integer value between the bounds chosen by
 * `o.range` and ignore `o.nbins` beyond validating it. Floating arrays get
 * `o.nbins` equal-width buckets.
 *
 * Throws std::invalid_argument for an empty array, bad options or a bin count
 * above `o.max_bins`, and division_by_zero when normalizing an empty histogram.
 */
inline histogram build_histogram(const sample_array& a, const histogram_options& o) {
    detail::validate_options(o);
    if (a.empty()) throw std::invalid_argument("cannot compute the histogram of an empty array");

    detail::warn_if_color_shape(a.shape());

    return a.visit([&](const auto& v) {
        using T = typename std::decay_t<decltype(v)>::value_type;
        histogram h;
        h.normalized = o.normalize;
        if constexpr (std::is_integral_v<T>) {
            const auto layout = detail::integer_bins(v, o);
            h.counts = detail::to_frequencies(detail::count_integers(v, layout), o.normalize);
            h.bin_centers = detail::integer_centers(layout);
        } else {
            const auto layout = detail::float_bins(v, o);
            h.counts = detail::to_frequencies(detail::count_buckets(v, layout), o.normalize);
            h.bin_centers = detail::bucket_centers(layout);
        }
        return h;
    });
}

inline histogram make_histogram(const sample_array& a, int nbins = 256,
                                source_range range = source_range::image, bool normalize = false)
{
    histogram_options o;
    o.nbins = nbins;
    o.range = range;
    o.normalize = normalize;
    return build_histogram(a, o);
}

/**
 * One histogram per index of `channel_axis`, all over the same bins.
 * The bins come from the whole array, so rows are directly comparable.
 * A negative axis counts from the last dimension.
 */
inline channel_histograms make_channel_histograms(const sample_array& a, int channel_axis,
                                                  const histogram_options& o)
{
    detail::validate_options(o);
    if (a.empty()) throw std::invalid_argument("cannot compute the histogram of an empty array");

    const auto ndim = static_cast<int>(a.ndim());
    const int axis = channel_axis < 0 ? channel_axis + ndim : channel_axis;
    if (axis < 0 || axis >= ndim)
        throw std::invalid_argument("channel_axis " + std::to_string(channel_axis) +
                                    " is out of range for an array of shape " +
                                    shape_string(a.shape()));

    const std::size_t channels = a.shape()[static_cast<std::size_t>(axis)];
    std::size_t inner = 1;
    for (std::size_t d = static_cast<std::size_t>(axis) + 1; d < a.ndim(); ++d) inner *= a.shape()[d];

    return a.visit([&](const auto& v) {
        using T = typename std::decay_t<decltype(v)>::value_type;
        channel_histograms out;
        out.normalized = o.normalize;
        if constexpr (std::is_integral_v<T>) {
            const auto layout = detail::integer_bins(v, o);
            for (std::size_t c = 0; c < channels; ++c) {
                const auto slice = detail::channel_slice(v, channels, inner, c);
                out.counts.push_back(detail::to_frequencies(detail::count_integers(slice, layout),
                                                            o.normalize));
            }
            out.bin_centers = detail::integer_centers(layout);
        } else {
            const auto layout = detail::float_bins(v, o);
            for (std::size_t c = 0; c < channels; ++c) {
                const auto slice = detail::channel_slice(v, channels, inner, c);
                out.counts.push_back(detail::to_frequencies(detail::count_buckets(slice, layout),
                                                            o.normalize));
            }
            out.bin_centers = detail::bucket_centers(layout);
        }
        return out;
    });
}

}
