/**
 * @file ExecutionContext.cpp
 * @brief Thread pool, pools, budget and progress for one run
 */

#include <VxTrace/Platform/ExecutionContext.h>
#include <VxTrace/Core/Exception.h>
#include <VxTrace/Platform/Log.h>

#include <algorithm>
#include <limits>

namespace Vx::Trace::Platform {

ExecutionContext::ExecutionContext() : ExecutionContext(ExecutionOptions{}) {}

ExecutionContext::ExecutionContext(const ExecutionOptions& options)
    : profiler_(options.profiling)
    , clock_(true)
    , budgetMs_(options.timeBudgetMs > 0.0 ? options.timeBudgetMs : 0.0)
    , progress_(options.progress)
{
    size_t threads = options.numThreads == 0 ? GetRecommendedThreadCount()
                                             : options.numThreads;
    if (threads > 1) {
        pool_ = std::make_unique<ThreadPool>(threads);
    }
    Log::Debug("execution context: {} worker(s), budget {} ms", Workers(), budgetMs_);
}

ExecutionContext::~ExecutionContext() = default;

void ExecutionContext::SnapshotMemory(const std::string& label) {
    profiler_.RecordMemory(label + ".float", floatPool_.Stats());
    profiler_.RecordMemory(label + ".byte", bytePool_.Stats());
    profiler_.RecordMemory(label + ".dot", dotPool_.Stats());
}

void ExecutionContext::StartBudget(double budgetMs) {
    budgetMs_ = budgetMs > 0.0 ? budgetMs : 0.0;
    clock_.Reset();
    clock_.Start();
}

double ExecutionContext::RemainingMs() const {
    if (!HasDeadline()) return std::numeric_limits<double>::infinity();
    return std::max(0.0, budgetMs_ - clock_.ElapsedMs());
}

bool ExecutionContext::DeadlineExceeded() const {
    return HasDeadline() && clock_.ElapsedMs() >= budgetMs_;
}

bool ExecutionContext::BudgetFractionUsed(double fraction) const {
    return HasDeadline() && clock_.ElapsedMs() >= fraction * budgetMs_;
}

void ExecutionContext::CheckDeadline(const std::string& stage) const {
    if (DeadlineExceeded()) {
        throw TimeBudgetException(stage);
    }
}

void ExecutionContext::ReportProgress(double percent, const std::string& stage) const {
    if (progress_) {
        progress_(std::clamp(percent, 0.0, 100.0), stage);
    }
}

} // namespace Vx::Trace::Platform
