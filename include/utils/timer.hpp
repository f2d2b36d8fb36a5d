#pragma once

#include <chrono>

namespace d20 {

// Wall-clock stopwatch for benchmarks and verbose run timing
class Timer {
public:
    Timer() { start(); }

    void start() {
        start_ = std::chrono::steady_clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace d20
