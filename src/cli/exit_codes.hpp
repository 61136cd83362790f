#pragma once
#include <exception>
#include <stdexcept>

namespace histeq {

// Process exit codes of the histeq CLI.
enum exit_code : int {
    exit_ok = 0,
    exit_bad_arguments = 1,   // reported by CLI11
    exit_io_error = 2,        // input missing, unreadable or malformed
    exit_rejected_input = 3,  // engine refused the array or options
    exit_internal_error = 4,
};

// Exit code for an exception escaping the pipeline after the input was loaded.
inline int exit_code_for(const std::exception& e) noexcept {
    if (dynamic_cast<const std::invalid_argument*>(&e)) return exit_rejected_input;
    if (dynamic_cast<const std::domain_error*>(&e)) return exit_rejected_input;
    return exit_internal_error;
}

}
