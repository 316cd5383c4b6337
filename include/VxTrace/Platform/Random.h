#pragma once

/**
 * @file Random.h
 * @brief Seeded random number generation
 *
 * Used for:
 * - Poisson-disk seed placement
 * - Stipple candidate jitter and acceptance
 * - Synthetic test images
 *
 * Each pipeline stage owns its own instance seeded from the configuration,
 * so identical inputs give identical output.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace Vx::Trace::Platform {

/**
 * @brief Deterministic generator (MT19937-64)
 *
 * Not thread-safe; give each worker its own instance.
 */
class Random {
public:
    explicit Random(uint64_t seed = 42);

    void SetSeed(uint64_t seed);
    uint64_t GetSeed() const { return seed_; }

    // =========================================================================
    // Integer Generation
    // =========================================================================

    uint32_t Uint32();
    uint64_t Uint64();

    /// Integer in [min, max] (inclusive)
    int32_t Int(int32_t min, int32_t max);

    /// Integer in [0, max)
    size_t Index(size_t max);

    // =========================================================================
    // Floating Point Generation
    // =========================================================================

    /// Double in [0, 1)
    double Double();

    /// Double in [min, max)
    double Double(double min, double max);

    /// N(mean, stddev)
    double Gaussian(double mean = 0.0, double stddev = 1.0);

    /// True with the given probability
    bool Bool(double probabilityTrue = 0.5);

    // =========================================================================
    // Sampling
    // =========================================================================

    /**
     * @brief k unique indices from [0, n), in draw order
     */
    std::vector<size_t> SampleIndices(size_t n, size_t k);

    template<typename T>
    void Shuffle(std::vector<T>& items) {
        // Fisher-Yates with our own draws so results do not depend on the
        // standard library's shuffle implementation
        for (size_t i = items.size(); i > 1; --i) {
            std::swap(items[i - 1], items[Index(i)]);
        }
    }

    std::mt19937_64& Generator() { return gen_; }

private:
    std::mt19937_64 gen_;
    uint64_t seed_;
};

} // namespace Vx::Trace::Platform
