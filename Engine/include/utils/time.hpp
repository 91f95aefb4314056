#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace Coalesce {

/**
 * @brief High-resolution timer and high-level timing utilities.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Reset the timer to the current time.
     */
    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /**
     * @brief Get elapsed seconds since last reset or construction.
     */
    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    static double ms_since(TimePoint start) {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

private:
    TimePoint start_;
};

/**
 * @brief ISO-8601 UTC timestamp ("2026-01-31T12:00:00Z") for a wall-clock instant.
 *
 * Fixed width, so timestamps compare correctly as strings.
 */
inline std::string utc_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

inline std::string utc_timestamp() {
    return utc_timestamp(std::chrono::system_clock::now());
}

} // namespace Coalesce
