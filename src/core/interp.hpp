#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace histeq {

/**
 * Monotone piecewise-linear function through the points (xp[i], fp[i]).
 *
 * `xp` must be strictly increasing and the same length as `fp`. Inputs below
 * xp.front() map to fp.front(), inputs above xp.back() map to fp.back(),
 * and an input equal to xp[j] maps to fp[j] exactly. NaN maps to NaN.
 */
class linear_lookup {
public:
    linear_lookup(std::vector<double> xp, std::vector<double> fp)
        : xp_(std::move(xp)), fp_(std::move(fp))
    {
        if (xp_.empty()) throw std::invalid_argument("linear_lookup: empty table");
        if (xp_.size() != fp_.size())
            throw std::invalid_argument("linear_lookup: xp and fp differ in length");
        for (std::size_t i = 1; i < xp_.size(); ++i) {
            if (!(xp_[i - 1] < xp_[i]))
                throw std::invalid_argument("linear_lookup: xp must be strictly increasing");
        }
    }

    double operator()(double x) const {
        if (std::isnan(x)) return x;
        if (x <= xp_.front()) return fp_.front();
        if (x >= xp_.back()) return fp_.back();

        // xp[j] <= x < xp[j + 1]
        const auto it = std::upper_bound(xp_.begin(), xp_.end(), x);
        const auto j = static_cast<std::size_t>(it - xp_.begin()) - 1;
        const double slope = (fp_[j + 1] - fp_[j]) / (xp_[j + 1] - xp_[j]);
        return fp_[j] + slope * (x - xp_[j]);
    }

    std::size_t size() const noexcept { return xp_.size(); }

private:
    std::vector<double> xp_;
    std::vector<double> fp_;
};

inline double interp(double x, const std::vector<double>& xp, const std::vector<double>& fp) {
    return linear_lookup(xp, fp)(x);
}

}
