#pragma once

#include <chrono>

namespace Lexigraph {

/**
 * @brief Steady-clock stopwatch used to report query latency.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Elapsed milliseconds (fractional) since construction or reset.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    TimePoint start_;
};

} // namespace Lexigraph
