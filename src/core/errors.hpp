#pragma once
#include <stdexcept>
#include <string>

namespace histeq {

// Bad argument errors are plain std::invalid_argument; these two carry the
// remaining failure kinds so callers can tell them apart.

struct shape_mismatch : std::invalid_argument {
    explicit shape_mismatch(const std::string& what) : std::invalid_argument(what) {}
};

struct division_by_zero : std::domain_error {
    explicit division_by_zero(const std::string& what) : std::domain_error(what) {}
};

}
