#pragma once

/**
 * @file ExecutionContext.h
 * @brief Per-call resources: workers, pools, profiler, deadline, progress
 *
 * Every pipeline stage receives the context explicitly. Nothing here is
 * process-wide; two concurrent Vectorize calls with separate contexts share
 * no mutable state.
 *
 * Usage:
 * @code
 * ExecutionOptions opts;
 * opts.numThreads = 4;
 * ExecutionContext ctx(opts);
 * ctx.SetProgressCallback([](double pct, const std::string& stage) {
 *     Log::Info("{:.0f}% {}", pct, stage);
 * });
 * auto result = Vectorize(image, config, ctx);
 * @endcode
 */

#include <VxTrace/Core/Export.h>
#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Platform/Memory.h>
#include <VxTrace/Platform/Profiler.h>
#include <VxTrace/Platform/Thread.h>
#include <VxTrace/Platform/Timer.h>
#include <VxTrace/Platform/WorkDistributor.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace Vx::Trace::Platform {

using ProgressCallback = std::function<void(double percent, const std::string& stage)>;

struct ExecutionOptions {
    /// Worker threads: 0 = hardware based, 1 = run everything on the caller
    size_t numThreads = 0;

    /// Wall-clock budget in ms, 0 = unlimited
    double timeBudgetMs = 0.0;

    bool profiling = true;

    ProgressCallback progress;
};

class VXTRACE_API ExecutionContext {
public:
    ExecutionContext();
    explicit ExecutionContext(const ExecutionOptions& options);
    ~ExecutionContext();

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // =========================================================================
    // Workers
    // =========================================================================

    /// Worker pool, nullptr when running sequentially
    ThreadPool* Pool() { return pool_.get(); }

    /// Number of workers (1 when sequential)
    size_t Workers() const { return pool_ ? pool_->Size() : 1; }

    WorkDistributor& Distributor() { return distributor_; }
    Profiler& GetProfiler() { return profiler_; }

    // =========================================================================
    // Pools
    // =========================================================================

    BufferPool<float>& FloatPool() { return floatPool_; }
    BufferPool<uint8_t>& BytePool() { return bytePool_; }
    BufferPool<DotPrimitive>& DotPool() { return dotPool_; }

    /// Record the current statistics of every pool under label.*
    void SnapshotMemory(const std::string& label);

    // =========================================================================
    // Deadline
    // =========================================================================

    /**
     * @brief Restart the budget clock (0 = unlimited)
     */
    void StartBudget(double budgetMs);

    bool HasDeadline() const { return budgetMs_ > 0.0; }
    double BudgetMs() const { return budgetMs_; }
    double ElapsedMs() const { return clock_.ElapsedMs(); }

    /// Remaining ms (infinity when unlimited, never negative)
    double RemainingMs() const;

    bool DeadlineExceeded() const;

    /// True when at least fraction of the budget is used (false if unlimited)
    bool BudgetFractionUsed(double fraction) const;

    /**
     * @brief Stage boundary check
     * @throws TimeBudgetException when the budget is exhausted
     */
    void CheckDeadline(const std::string& stage) const;

    // =========================================================================
    // Progress
    // =========================================================================

    void SetProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

    /// Invoke the callback if set; percent is clamped to [0, 100]
    void ReportProgress(double percent, const std::string& stage) const;

private:
    std::unique_ptr<ThreadPool> pool_;
    WorkDistributor distributor_;
    Profiler profiler_;
    BufferPool<float> floatPool_;
    BufferPool<uint8_t> bytePool_;
    BufferPool<DotPrimitive> dotPool_;
    Timer clock_;
    double budgetMs_ = 0.0;
    ProgressCallback progress_;
};

/**
 * @brief ParallelFor whose grain comes from the distributor
 *
 * The loop is timed and fed back under the operation name, so repeated
 * calls converge to chunks of the distributor's target duration.
 */
template<typename Func>
void ParallelForAdaptive(ExecutionContext& ctx, const std::string& operation,
                         size_t begin, size_t end, Func&& func) {
    if (begin >= end) return;

    size_t count = end - begin;
    size_t workers = ctx.Distributor().ThreadCount(count, ctx.Workers());
    ThreadPool* pool = workers > 1 ? ctx.Pool() : nullptr;
    size_t grain = ctx.Distributor().ChunkSize(operation, count, workers);

    Timer timer(true);
    ParallelFor(pool, begin, end, std::forward<Func>(func), grain);
    ctx.Distributor().Record(operation, count, timer.ElapsedMs());
}

} // namespace Vx::Trace::Platform
