#pragma once

/**
 * @file Timer.h
 * @brief High-resolution timing utilities
 *
 * Usage:
 * @code
 * Timer timer(true);
 * // ... work ...
 * double elapsed = timer.ElapsedMs();
 *
 * {
 *     ScopedTimer timer("Thinning");
 *     // ... work ...
 * }  // Logs "Thinning: 12.340 ms" at debug level
 * @endcode
 */

#include <VxTrace/Core/Export.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace Vx::Trace::Platform {

/**
 * @brief High-resolution stopwatch with accumulate/restart semantics
 */
class VXTRACE_API Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double>;

    explicit Timer(bool autoStart = false);

    void Start();
    void Stop();
    void Reset();

    bool IsRunning() const { return running_; }

    double ElapsedSeconds() const;
    double ElapsedMs() const;
    double ElapsedUs() const;
    int64_t ElapsedNs() const;
    Duration Elapsed() const;

    /**
     * @brief Elapsed time in milliseconds, then restart
     */
    double Lap();

private:
    TimePoint startTime_;
    Duration accumulated_{0};
    bool running_ = false;
};

/**
 * @brief RAII timer that logs its elapsed time on destruction
 */
class VXTRACE_API ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, bool logOnDestruct = true);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double ElapsedMs() const { return timer_.ElapsedMs(); }

    /// Log current elapsed time without stopping
    void Checkpoint(const std::string& label = "");

    void Cancel() { logOnDestruct_ = false; }

private:
    std::string name_;
    Timer timer_;
    bool logOnDestruct_;
};

/**
 * @brief Milliseconds since the steady clock epoch
 */
VXTRACE_API int64_t GetTimestampMs();

} // namespace Vx::Trace::Platform
