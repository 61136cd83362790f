#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "dtype.hpp"
#include "errors.hpp"

namespace histeq {

using shape_t = std::vector<std::size_t>;

inline std::size_t shape_size(const shape_t& shape) {
    std::size_t n = 1;
    for (std::size_t d : shape) n *= d;
    return n;
}

inline std::string shape_string(const shape_t& shape) {
    std::string s = "(";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i) s += ", ";
        s += std::to_string(shape[i]);
    }
    return s + ")";
}

// N-dimensional row-major buffer of one element type.
class sample_array {
public:
    using storage = std::variant<std::vector<std::int8_t>,  std::vector<std::int16_t>,
                                 std::vector<std::int32_t>, std::vector<std::int64_t>,
                                 std::vector<std::uint8_t>, std::vector<std::uint16_t>,
                                 std::vector<std::uint32_t>, std::vector<std::uint64_t>,
                                 std::vector<float>,        std::vector<double>>;

    sample_array() : data_(std::vector<double>{}), shape_{0} {}

    template <class T>
    explicit sample_array(std::vector<T> values)
        : shape_{values.size()}
    {
        data_ = std::move(values);
    }

    template <class T>
    sample_array(std::vector<T> values, shape_t shape)
        : shape_(std::move(shape))
    {
        if (shape_.empty())
            throw std::invalid_argument("sample_array: shape must have at least one dimension");
        if (shape_size(shape_) != values.size())
            throw std::invalid_argument("sample_array: shape " + shape_string(shape_) +
                                        " does not hold " + std::to_string(values.size()) +
                                        " elements");
        data_ = std::move(values);
    }

    dtype type() const {
        return std::visit([](const auto& v) {
            using T = typename std::decay_t<decltype(v)>::value_type;
            return dtype_of<T>::value;
        }, data_);
    }

    const shape_t& shape() const noexcept { return shape_; }
    std::size_t ndim() const noexcept { return shape_.size(); }
    std::size_t size() const noexcept { return shape_size(shape_); }
    bool empty() const noexcept { return size() == 0; }

    const storage& data() const noexcept { return data_; }

    template <class T>
    const std::vector<T>& values() const {
        const auto* v = std::get_if<std::vector<T>>(&data_);
        if (!v) throw std::invalid_argument(std::string("sample_array: element type is ") +
                                            to_string(type()));
        return *v;
    }

    template <class F>
    decltype(auto) visit(F&& f) const { return std::visit(std::forward<F>(f), data_); }

    // Element at a flat (row-major) index, widened to double.
    double value_at(std::size_t i) const {
        return std::visit([i](const auto& v) { return static_cast<double>(v.at(i)); }, data_);
    }

    sample_array reshaped(shape_t shape) const {
        return std::visit([&](const auto& v) { return sample_array(v, std::move(shape)); }, data_);
    }

private:
    storage data_;
    shape_t shape_;
};

class mask {
public:
    mask(std::vector<bool> flags, shape_t shape)
        : flags_(std::move(flags)), shape_(std::move(shape))
    {
        if (shape_size(shape_) != flags_.size())
            throw std::invalid_argument("mask: shape " + shape_string(shape_) +
                                        " does not hold " + std::to_string(flags_.size()) +
                                        " flags");
    }

    const shape_t& shape() const noexcept { return shape_; }
    std::size_t size() const noexcept { return flags_.size(); }
    bool operator[](std::size_t i) const { return flags_[i]; }

    std::size_t count() const {
        std::size_t n = 0;
        for (bool f : flags_) n += f ? 1 : 0;
        return n;
    }

private:
    std::vector<bool> flags_;
    shape_t shape_;
};

// Flat 1-D array of the elements selected by `m`, in row-major order.
inline sample_array select(const sample_array& a, const mask& m) {
    if (m.shape() != a.shape())
        throw shape_mismatch("mask shape " + shape_string(m.shape()) +
                             " does not match array shape " + shape_string(a.shape()));
    return a.visit([&](const auto& v) {
        using T = typename std::decay_t<decltype(v)>::value_type;
        std::vector<T> out;
        out.reserve(m.count());
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (m[i]) out.push_back(v[i]);
        }
        return sample_array(std::move(out));
    });
}

}
