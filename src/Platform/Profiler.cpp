/**
 * @file Profiler.cpp
 * @brief Timing, counter and memory statistics
 */

#include <VxTrace/Platform/Profiler.h>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace Vx::Trace::Platform {

void Profiler::Record(const std::string& operation, double elapsedMs) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto& stats = timings_[operation];
    if (stats.count == 0) {
        stats.minMs = elapsedMs;
        stats.maxMs = elapsedMs;
    } else {
        stats.minMs = std::min(stats.minMs, elapsedMs);
        stats.maxMs = std::max(stats.maxMs, elapsedMs);
    }
    ++stats.count;
    stats.totalMs += elapsedMs;
}

void Profiler::IncrementCounter(const std::string& counter, uint64_t value) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counter] += value;
}

void Profiler::RecordMemory(const std::string& label, const PoolStats& stats) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    memory_[label] = stats;
}

std::optional<TimingStats> Profiler::Timing(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timings_.find(operation);
    if (it == timings_.end()) return std::nullopt;
    return it->second;
}

uint64_t Profiler::Counter(const std::string& counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(counter);
    return it == counters_.end() ? 0 : it->second;
}

std::optional<PoolStats> Profiler::Memory(const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = memory_.find(label);
    if (it == memory_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Profiler::Operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(timings_.size());
    for (const auto& kv : timings_) {
        names.push_back(kv.first);
    }
    return names;
}

std::string Profiler::Summary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<std::string, TimingStats>> sorted(timings_.begin(), timings_.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second.totalMs > b.second.totalMs;
    });

    std::string out = "profile:\n";
    for (const auto& [name, stats] : sorted) {
        out += fmt::format("  {:<28} n={:<5} total={:>9.3f} ms avg={:>8.3f} ms max={:>8.3f} ms\n",
                           name, stats.count, stats.totalMs, stats.AverageMs(), stats.maxMs);
    }
    for (const auto& [name, value] : counters_) {
        out += fmt::format("  {:<28} {}\n", name, value);
    }
    for (const auto& [label, stats] : memory_) {
        out += fmt::format("  {:<28} acquired={} reused={} peak={} B\n",
                           label, stats.acquisitions, stats.reuses, stats.peakBytes);
    }
    return out;
}

void Profiler::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    timings_.clear();
    counters_.clear();
    memory_.clear();
}

// =============================================================================
// ScopedProfile
// =============================================================================

ScopedProfile::ScopedProfile(Profiler* profiler, std::string operation)
    : profiler_(profiler)
    , operation_(std::move(operation))
    , timer_(true) {
}

ScopedProfile::~ScopedProfile() {
    if (profiler_ != nullptr) {
        profiler_->Record(operation_, timer_.ElapsedMs());
    }
}

} // namespace Vx::Trace::Platform
