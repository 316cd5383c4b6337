#pragma once

/**
 * @file Memory.h
 * @brief Aligned allocation and pooled scratch buffers
 */

#include <VxTrace/Core/Constants.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace Vx::Trace::Platform {

// =============================================================================
// Aligned Allocation
// =============================================================================

/**
 * @brief Allocate aligned memory
 * @param size Size in bytes
 * @param alignment Alignment in bytes (default: 64)
 * @return Pointer to aligned memory, or nullptr on failure
 */
void* AlignedAlloc(size_t size, size_t alignment = MEMORY_ALIGNMENT);

/**
 * @brief Free aligned memory
 * @param ptr Pointer previously returned by AlignedAlloc
 */
void AlignedFree(void* ptr);

inline bool IsAligned(const void* ptr, size_t alignment = MEMORY_ALIGNMENT) {
    return (reinterpret_cast<uintptr_t>(ptr) % alignment) == 0;
}

/**
 * @brief Round size up to the alignment boundary
 */
inline size_t AlignedSize(size_t size, size_t alignment = MEMORY_ALIGNMENT) {
    return (size + alignment - 1) & ~(alignment - 1);
}

struct AlignedDeleter {
    void operator()(void* ptr) const {
        AlignedFree(ptr);
    }
};

template<typename T>
using AlignedPtr = std::unique_ptr<T[], AlignedDeleter>;

template<typename T>
AlignedPtr<T> AllocateAligned(size_t count, size_t alignment = MEMORY_ALIGNMENT) {
    T* ptr = static_cast<T*>(AlignedAlloc(count * sizeof(T), alignment));
    return AlignedPtr<T>(ptr);
}

// =============================================================================
// Buffer Pool
// =============================================================================

/**
 * @brief Pool statistics snapshot
 */
struct PoolStats {
    size_t acquisitions = 0;     ///< Total Acquire() calls
    size_t reuses = 0;           ///< Acquisitions served from the free list
    size_t allocations = 0;      ///< Acquisitions that needed a new buffer
    size_t bytesOutstanding = 0; ///< Capacity currently held by live handles
    size_t peakBytes = 0;        ///< Maximum of bytesOutstanding
};

/**
 * @brief Thread-safe pool of scratch vectors
 *
 * Acquire() hands out a buffer resized to the requested count and
 * value-initialized. The returned Handle owns the buffer exclusively and
 * gives it back on destruction, so two live handles never alias.
 * The pool must outlive every handle it issued.
 *
 * @code
 * BufferPool<float> pool;
 * {
 *     auto buf = pool.Acquire(w * h);
 *     Compute(buf.Data(), w, h);
 * }   // returned to the pool here
 * @endcode
 */
template<typename T>
class BufferPool {
public:
    class Handle {
    public:
        Handle() = default;
        Handle(BufferPool* pool, std::vector<T>&& buffer)
            : pool_(pool), buffer_(std::move(buffer)) {}

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        Handle(Handle&& other) noexcept
            : pool_(other.pool_), buffer_(std::move(other.buffer_)) {
            other.pool_ = nullptr;
        }

        Handle& operator=(Handle&& other) noexcept {
            if (this != &other) {
                Reset();
                pool_ = other.pool_;
                buffer_ = std::move(other.buffer_);
                other.pool_ = nullptr;
            }
            return *this;
        }

        ~Handle() { Reset(); }

        /// Return the buffer to its pool early
        void Reset() {
            if (pool_ != nullptr) {
                pool_->Release(std::move(buffer_));
                pool_ = nullptr;
            }
            buffer_ = std::vector<T>();
        }

        std::vector<T>& Get() { return buffer_; }
        const std::vector<T>& Get() const { return buffer_; }
        T* Data() { return buffer_.data(); }
        const T* Data() const { return buffer_.data(); }
        size_t Size() const { return buffer_.size(); }
        bool Valid() const { return pool_ != nullptr; }

        T& operator[](size_t i) { return buffer_[i]; }
        const T& operator[](size_t i) const { return buffer_[i]; }

    private:
        BufferPool* pool_ = nullptr;
        std::vector<T> buffer_;
    };

    /**
     * @param maxFree Maximum number of idle buffers retained
     */
    explicit BufferPool(size_t maxFree = 16) : maxFree_(maxFree) {}

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * @brief Take a buffer of exactly count value-initialized elements
     *
     * Reuses the smallest idle buffer whose capacity suffices.
     */
    Handle Acquire(size_t count) {
        std::vector<T> buffer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.acquisitions;

            size_t best = free_.size();
            for (size_t i = 0; i < free_.size(); ++i) {
                if (free_[i].capacity() >= count &&
                    (best == free_.size() || free_[i].capacity() < free_[best].capacity())) {
                    best = i;
                }
            }
            if (best < free_.size()) {
                buffer = std::move(free_[best]);
                free_.erase(free_.begin() + static_cast<std::ptrdiff_t>(best));
                ++stats_.reuses;
            } else {
                ++stats_.allocations;
            }
        }

        buffer.assign(count, T{});

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.bytesOutstanding += buffer.capacity() * sizeof(T);
            if (stats_.bytesOutstanding > stats_.peakBytes) {
                stats_.peakBytes = stats_.bytesOutstanding;
            }
        }
        return Handle(this, std::move(buffer));
    }

    PoolStats Stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    /// Number of idle buffers currently retained
    size_t FreeCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return free_.size();
    }

    /// Drop all idle buffers
    void Trim() {
        std::lock_guard<std::mutex> lock(mutex_);
        free_.clear();
    }

private:
    void Release(std::vector<T>&& buffer) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t bytes = buffer.capacity() * sizeof(T);
        stats_.bytesOutstanding = bytes > stats_.bytesOutstanding
                                      ? 0 : stats_.bytesOutstanding - bytes;
        if (free_.size() < maxFree_ && buffer.capacity() > 0) {
            buffer.clear();
            free_.push_back(std::move(buffer));
        }
    }

    mutable std::mutex mutex_;
    std::vector<std::vector<T>> free_;
    PoolStats stats_;
    size_t maxFree_;
};

} // namespace Vx::Trace::Platform
