#pragma once
#include <fmt/format.h>
#include <cstdio>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace histeq {

// Receives advisory messages. Failures are thrown, never logged here.
using warning_sink = std::function<void(std::string_view)>;

inline void stderr_warning_sink(std::string_view msg) {
    fmt::print(stderr, "WARN: {}\n", msg);
}

namespace detail {
inline warning_sink& active_warning_sink() {
    static warning_sink sink = stderr_warning_sink;
    return sink;
}
}

template <class... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    const std::string msg = fmt::format(f, std::forward<Args>(args)...);
    detail::active_warning_sink()(msg);
}

// Installs `sink` for the lifetime of the guard, then restores the previous one.
class scoped_warning_sink {
public:
    explicit scoped_warning_sink(warning_sink sink)
        : previous_(std::move(detail::active_warning_sink()))
    {
        detail::active_warning_sink() = std::move(sink);
    }
    ~scoped_warning_sink() { detail::active_warning_sink() = std::move(previous_); }

    scoped_warning_sink(const scoped_warning_sink&) = delete;
    scoped_warning_sink& operator=(const scoped_warning_sink&) = delete;

private:
    warning_sink previous_;
};

}
