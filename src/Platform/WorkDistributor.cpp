/**
 * @file WorkDistributor.cpp
 * @brief Chunk sizing from measured throughput
 */

#include <VxTrace/Platform/WorkDistributor.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Platform {

WorkDistributor::WorkDistributor() : WorkDistributor(Options{}) {}

WorkDistributor::WorkDistributor(const Options& options) : options_(options) {
    options_.smoothing = std::clamp(options_.smoothing, 0.01, 1.0);
    options_.minGrain = std::max<size_t>(options_.minGrain, 1);
    options_.minItemsPerWorker = std::max<size_t>(options_.minItemsPerWorker, 1);
}

void WorkDistributor::Record(const std::string& operation, size_t items, double elapsedMs) {
    if (items == 0 || !(elapsedMs >= 0.0)) return;

    double perItem = elapsedMs / static_cast<double>(items);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = itemCostMs_.find(operation);
    if (it == itemCostMs_.end()) {
        itemCostMs_.emplace(operation, perItem);
    } else {
        it->second = options_.smoothing * perItem + (1.0 - options_.smoothing) * it->second;
    }
}

std::optional<double> WorkDistributor::AverageItemMs(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = itemCostMs_.find(operation);
    if (it == itemCostMs_.end()) return std::nullopt;
    return it->second;
}

size_t WorkDistributor::ChunkSize(const std::string& operation, size_t count,
                                  size_t workers) const {
    if (count == 0) return options_.minGrain;
    if (workers <= 1) return count;

    size_t evenSplit = (count + workers - 1) / workers;
    size_t lower = std::min(options_.minGrain, evenSplit);

    auto cost = AverageItemMs(operation);
    size_t chunk;
    if (!cost || *cost <= 0.0) {
        size_t tasks = workers * 4;
        chunk = (count + tasks - 1) / tasks;
    } else {
        double items = options_.targetChunkMs / *cost;
        chunk = items >= static_cast<double>(count)
                    ? count
                    : static_cast<size_t>(std::max(1.0, std::floor(items)));
    }
    return std::clamp(chunk, lower, evenSplit);
}

size_t WorkDistributor::ThreadCount(size_t count, size_t maxWorkers) const {
    if (maxWorkers <= 1 || count < 2 * options_.minItemsPerWorker) return 1;
    size_t useful = count / options_.minItemsPerWorker;
    return std::max<size_t>(1, std::min(maxWorkers, useful));
}

void WorkDistributor::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    itemCostMs_.clear();
}

} // namespace Vx::Trace::Platform
