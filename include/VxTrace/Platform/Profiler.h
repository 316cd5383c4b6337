#pragma once

/**
 * @file Profiler.h
 * @brief Named timings, counters and memory snapshots for one pipeline run
 *
 * Usage:
 * @code
 * Profiler profiler;
 * {
 *     ScopedProfile scope(&profiler, "edge.canny");
 *     RunCanny(...);
 * }
 * profiler.IncrementCounter("edge.chains", chains.size());
 * Log::Debug("{}", profiler.Summary());
 * @endcode
 */

#include <VxTrace/Core/Export.h>
#include <VxTrace/Platform/Memory.h>
#include <VxTrace/Platform/Timer.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Vx::Trace::Platform {

struct TimingStats {
    uint64_t count = 0;
    double totalMs = 0.0;
    double minMs = 0.0;
    double maxMs = 0.0;

    double AverageMs() const { return count > 0 ? totalMs / static_cast<double>(count) : 0.0; }
};

/**
 * @brief Thread-safe profiler
 */
class VXTRACE_API Profiler {
public:
    explicit Profiler(bool enabled = true) : enabled_(enabled) {}

    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    bool IsEnabled() const { return enabled_; }
    void SetEnabled(bool enabled) { enabled_ = enabled; }

    /// Add one timing sample for an operation
    void Record(const std::string& operation, double elapsedMs);

    void IncrementCounter(const std::string& counter, uint64_t value = 1);

    /// Store a pool statistics snapshot under a label (last one wins)
    void RecordMemory(const std::string& label, const PoolStats& stats);

    std::optional<TimingStats> Timing(const std::string& operation) const;
    uint64_t Counter(const std::string& counter) const;
    std::optional<PoolStats> Memory(const std::string& label) const;

    /// Operation names in lexicographic order
    std::vector<std::string> Operations() const;

    /// Multi-line report, slowest operation first
    std::string Summary() const;

    void Clear();

private:
    mutable std::mutex mutex_;
    bool enabled_;
    std::map<std::string, TimingStats> timings_;
    std::map<std::string, uint64_t> counters_;
    std::map<std::string, PoolStats> memory_;
};

/**
 * @brief RAII timing scope; a null profiler makes it a no-op
 */
class VXTRACE_API ScopedProfile {
public:
    ScopedProfile(Profiler* profiler, std::string operation);
    ~ScopedProfile();

    ScopedProfile(const ScopedProfile&) = delete;
    ScopedProfile& operator=(const ScopedProfile&) = delete;

private:
    Profiler* profiler_;
    std::string operation_;
    Timer timer_;
};

} // namespace Vx::Trace::Platform
