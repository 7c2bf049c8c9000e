#pragma once

#include <chrono>
#include <cstdio>
#include <string>

namespace Broadsheet {

/**
 * @brief Steady-clock stopwatch used for batch and phase timings.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Elapsed milliseconds (sub-millisecond resolution) since construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /**
     * @brief Human-readable duration: "850 ms", "12.4 s" or "3 m 07 s".
     */
    static std::string format(double ms) {
        char buf[48];
        if (ms < 1000.0) {
            std::snprintf(buf, sizeof(buf), "%.0f ms", ms);
        } else if (ms < 60000.0) {
            std::snprintf(buf, sizeof(buf), "%.1f s", ms / 1000.0);
        } else {
            auto total = static_cast<long long>(ms / 1000.0);
            std::snprintf(buf, sizeof(buf), "%lld m %02lld s", total / 60, total % 60);
        }
        return buf;
    }

private:
    TimePoint start_;
};

} // namespace Broadsheet
