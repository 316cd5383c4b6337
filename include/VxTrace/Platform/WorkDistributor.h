#pragma once

/**
 * @file WorkDistributor.h
 * @brief Adaptive chunk sizing from measured per-item cost
 *
 * The distributor keeps an exponential moving average of the per-item
 * duration of every named operation and sizes parallel chunks so that each
 * chunk takes roughly targetChunkMs. Until an operation has been measured it
 * falls back to about four chunks per worker.
 */

#include <VxTrace/Core/Export.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace Vx::Trace::Platform {

class VXTRACE_API WorkDistributor {
public:
    struct Options {
        double targetChunkMs = 2.0;      ///< Desired wall time of one chunk
        double smoothing = 0.3;          ///< EMA weight of the newest sample
        size_t minGrain = 1;             ///< Smallest chunk handed out
        size_t minItemsPerWorker = 16;   ///< Below this, extra workers do not pay off
    };

    WorkDistributor();
    explicit WorkDistributor(const Options& options);

    /**
     * @brief Record that items of an operation took elapsedMs in total
     */
    void Record(const std::string& operation, size_t items, double elapsedMs);

    /// Current EMA of the per-item cost
    std::optional<double> AverageItemMs(const std::string& operation) const;

    /**
     * @brief Chunk size for count items spread over workers
     *
     * Result is in [minGrain, ceil(count / workers)].
     */
    size_t ChunkSize(const std::string& operation, size_t count, size_t workers) const;

    /**
     * @brief Suggested worker count for count items
     */
    size_t ThreadCount(size_t count, size_t maxWorkers) const;

    void Reset();

    const Options& GetOptions() const { return options_; }

private:
    Options options_;
    mutable std::mutex mutex_;
    std::map<std::string, double> itemCostMs_;
};

} // namespace Vx::Trace::Platform
