#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace histeq {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double,std::milli>(t1 - t0).count(); }
};

struct RunStage {
    std::string name;
    std::uint64_t calls = 0;
    double ms = 0.0;
};

// Times one named pipeline stage; `as_stage()` reports the last call.
struct StageTimer {
    std::string   name;
    std::uint64_t calls = 0;
    WallTimer     wt{};
    double        last_ms = 0.0;

    explicit StageTimer(const char* n) : name(n ? n : "(stage)") {}
    void start() { wt.start(); }
    void stop()  { wt.stop(); last_ms = wt.ms(); ++calls; }

    RunStage as_stage() const { return RunStage{ name, calls, last_ms }; }
};

}
