#pragma once

/**
 * @file Thread.h
 * @brief Thread pool and fork-join parallel loops
 *
 * The pool is an explicit instance owned by an ExecutionContext; there is
 * no process-wide pool. Every loop helper takes a ThreadPool pointer and
 * runs sequentially when it is null.
 *
 * Usage:
 * @code
 * ThreadPool pool(4);
 * ParallelFor(&pool, 0, height, [&](size_t y) {
 *     processRow(y);
 * });
 *
 * ParallelForRange(nullptr, 0, height, [&](size_t start, size_t end) {
 *     for (size_t y = start; y < end; ++y) processRow(y);
 * });
 * @endcode
 *
 * Exceptions thrown by a task are rethrown in the caller once every task of
 * the loop has finished. Loop helpers must not be called from inside a pool
 * task of the same pool.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Vx::Trace::Platform {

// ============================================================================
// System Information
// ============================================================================

/**
 * @brief Number of hardware threads, minimum 1
 */
size_t GetNumCores();

/**
 * @brief GetNumCores() - 1, minimum 1
 */
size_t GetRecommendedThreadCount();

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * @brief Fixed-size worker pool
 */
class ThreadPool {
public:
    /**
     * @param numThreads Worker count (0 = GetRecommendedThreadCount())
     */
    explicit ThreadPool(size_t numThreads = 0);

    /// Waits for queued tasks, then joins workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t Size() const { return workers_.size(); }

    bool IsRunning() const { return !stop_; }

    /**
     * @brief Submit a task and get a future for the result
     * @throws std::runtime_error if the pool is stopping
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    /**
     * @brief Submit a fire-and-forget task
     */
    template<typename F>
    void Execute(F&& f);

    /**
     * @brief Block until the queue is empty and no task is running
     */
    void WaitAll();

    size_t PendingTasks() const;

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completionCondition_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> activeTasks_{0};
};

// ============================================================================
// Parallel For
// ============================================================================

/**
 * @brief Call func(i) for every i in [begin, end)
 * @param pool Worker pool, nullptr = run on the calling thread
 * @param grainSize Iterations per task (0 = auto)
 */
template<typename Func>
void ParallelFor(ThreadPool* pool, size_t begin, size_t end, Func&& func,
                 size_t grainSize = 0);

/**
 * @brief Call func(chunkBegin, chunkEnd) over a partition of [begin, end)
 * @param pool Worker pool, nullptr = single call func(begin, end)
 * @param numChunks Chunk count (0 = 2 per worker)
 */
template<typename Func>
void ParallelForRange(ThreadPool* pool, size_t begin, size_t end, Func&& func,
                      size_t numChunks = 0);

/**
 * @brief Grain size giving about 4 tasks per worker
 */
size_t CalculateGrainSize(size_t totalWork, size_t workers, size_t minGrain = 1);

// ============================================================================
// Template Implementations
// ============================================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using ReturnType = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<ReturnType> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

template<typename F>
void ThreadPool::Execute(F&& f) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        tasks_.emplace(std::forward<F>(f));
    }
    condition_.notify_one();
}

namespace Detail {

// Wait for every future, then rethrow the first failure
inline void JoinAll(std::vector<std::future<void>>& futures) {
    std::exception_ptr first;
    for (auto& f : futures) {
        try {
            f.get();
        } catch (...) {
            if (!first) first = std::current_exception();
        }
    }
    if (first) {
        std::rethrow_exception(first);
    }
}

} // namespace Detail

template<typename Func>
void ParallelFor(ThreadPool* pool, size_t begin, size_t end, Func&& func,
                 size_t grainSize) {
    if (begin >= end) return;

    size_t count = end - begin;

    if (pool == nullptr || pool->Size() <= 1 || count == 1) {
        for (size_t i = begin; i < end; ++i) {
            func(i);
        }
        return;
    }

    if (grainSize == 0) {
        grainSize = CalculateGrainSize(count, pool->Size());
    }

    size_t numTasks = (count + grainSize - 1) / grainSize;

    std::vector<std::future<void>> futures;
    futures.reserve(numTasks);

    for (size_t task = 0; task < numTasks; ++task) {
        size_t taskBegin = begin + task * grainSize;
        size_t taskEnd = std::min(taskBegin + grainSize, end);

        futures.push_back(pool->Submit([&func, taskBegin, taskEnd]() {
            for (size_t i = taskBegin; i < taskEnd; ++i) {
                func(i);
            }
        }));
    }

    Detail::JoinAll(futures);
}

template<typename Func>
void ParallelForRange(ThreadPool* pool, size_t begin, size_t end, Func&& func,
                      size_t numChunks) {
    if (begin >= end) return;

    size_t count = end - begin;

    if (pool == nullptr || pool->Size() <= 1 || count == 1) {
        func(begin, end);
        return;
    }

    if (numChunks == 0) {
        numChunks = pool->Size() * 2;
    }
    numChunks = std::min(numChunks, count);

    std::vector<std::future<void>> futures;
    futures.reserve(numChunks);

    size_t chunkSize = count / numChunks;
    size_t remainder = count % numChunks;

    size_t current = begin;
    for (size_t chunk = 0; chunk < numChunks; ++chunk) {
        size_t thisChunkSize = chunkSize + (chunk < remainder ? 1 : 0);
        size_t chunkEnd = current + thisChunkSize;

        futures.push_back(pool->Submit([&func, current, chunkEnd]() {
            func(current, chunkEnd);
        }));

        current = chunkEnd;
    }

    Detail::JoinAll(futures);
}

} // namespace Vx::Trace::Platform
