/**
 * @file Timer.cpp
 * @brief Timer implementation
 */

#include <VxTrace/Platform/Timer.h>
#include <VxTrace/Platform/Log.h>

namespace Vx::Trace::Platform {

// ============================================================================
// Timer Implementation
// ============================================================================

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    if (!running_) {
        startTime_ = Clock::now();
        running_ = true;
    }
}

void Timer::Stop() {
    if (running_) {
        accumulated_ += std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
        running_ = false;
    }
}

void Timer::Reset() {
    accumulated_ = Duration{0};
    running_ = false;
}

Timer::Duration Timer::Elapsed() const {
    if (running_) {
        return accumulated_ + std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
    }
    return accumulated_;
}

double Timer::ElapsedSeconds() const {
    return Elapsed().count();
}

double Timer::ElapsedMs() const {
    return ElapsedSeconds() * 1000.0;
}

double Timer::ElapsedUs() const {
    return ElapsedSeconds() * 1000000.0;
}

int64_t Timer::ElapsedNs() const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Elapsed()).count();
}

double Timer::Lap() {
    double elapsed = ElapsedMs();
    Reset();
    Start();
    return elapsed;
}

// ============================================================================
// ScopedTimer Implementation
// ============================================================================

ScopedTimer::ScopedTimer(const std::string& name, bool logOnDestruct)
    : name_(name)
    , timer_(true)
    , logOnDestruct_(logOnDestruct) {
}

ScopedTimer::~ScopedTimer() {
    if (logOnDestruct_) {
        Log::Debug("{}: {:.3f} ms", name_, timer_.ElapsedMs());
    }
}

void ScopedTimer::Checkpoint(const std::string& label) {
    if (label.empty()) {
        Log::Debug("{}: {:.3f} ms", name_, timer_.ElapsedMs());
    } else {
        Log::Debug("{} [{}]: {:.3f} ms", name_, label, timer_.ElapsedMs());
    }
}

int64_t GetTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        Timer::Clock::now().time_since_epoch()).count();
}

} // namespace Vx::Trace::Platform
