/**
 * @file Random.cpp
 * @brief Random number generation implementation
 */

#include <VxTrace/Platform/Random.h>

#include <cmath>
#include <unordered_set>

namespace Vx::Trace::Platform {

namespace {
// 2^-53, maps the top 53 bits of a draw onto [0, 1)
constexpr double UNIT_SCALE = 1.0 / 9007199254740992.0;
}

Random::Random(uint64_t seed) : gen_(seed), seed_(seed) {}

void Random::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);
}

// =========================================================================
// Integer Generation
// =========================================================================

uint32_t Random::Uint32() {
    return static_cast<uint32_t>(gen_() >> 32);
}

uint64_t Random::Uint64() {
    return gen_();
}

int32_t Random::Int(int32_t min, int32_t max) {
    if (min > max) {
        std::swap(min, max);
    }
    uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(max) - min) + 1;
    return static_cast<int32_t>(min + static_cast<int64_t>(gen_() % span));
}

size_t Random::Index(size_t max) {
    if (max == 0) {
        return 0;
    }
    return static_cast<size_t>(gen_() % static_cast<uint64_t>(max));
}

// =========================================================================
// Floating Point Generation
// =========================================================================

// Distributions are computed by hand: std:: distributions are not
// reproducible across standard library implementations.

double Random::Double() {
    return static_cast<double>(gen_() >> 11) * UNIT_SCALE;
}

double Random::Double(double min, double max) {
    return min + (max - min) * Double();
}

double Random::Gaussian(double mean, double stddev) {
    // Box-Muller
    double u1 = Double();
    double u2 = Double();
    if (u1 < 1e-300) u1 = 1e-300;
    double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * 3.14159265358979323846 * u2);
    return mean + stddev * z;
}

bool Random::Bool(double probabilityTrue) {
    if (probabilityTrue <= 0.0) return false;
    if (probabilityTrue >= 1.0) return true;
    return Double() < probabilityTrue;
}

// =========================================================================
// Sampling
// =========================================================================

std::vector<size_t> Random::SampleIndices(size_t n, size_t k) {
    std::vector<size_t> result;
    if (k >= n) {
        result.resize(n);
        for (size_t i = 0; i < n; ++i) result[i] = i;
        return result;
    }

    result.reserve(k);
    if (k * 4 < n) {
        std::unordered_set<size_t> selected;
        while (result.size() < k) {
            size_t idx = Index(n);
            if (selected.insert(idx).second) {
                result.push_back(idx);
            }
        }
    } else {
        std::vector<size_t> all(n);
        for (size_t i = 0; i < n; ++i) all[i] = i;
        for (size_t i = 0; i < k; ++i) {
            size_t j = i + Index(n - i);
            std::swap(all[i], all[j]);
            result.push_back(all[i]);
        }
    }
    return result;
}

} // namespace Vx::Trace::Platform
