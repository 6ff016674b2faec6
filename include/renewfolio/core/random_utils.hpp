// include/renewfolio/core/random_utils.hpp
#pragma once

#include <cmath>
#include <cstdint>
#include <random>

namespace renewfolio {

/**
 * @brief Generator type threaded through every stochastic call
 */
using RandomEngine = std::mt19937_64;

/**
 * @brief Independent stream identifiers for derive_seed
 */
enum class RandomStream : uint64_t {
    WEATHER = 1,
    PRICE = 2,
    PARAMETERS = 3,
    MARKET_PRICE = 11,
    MARKET_LOAD = 12,
    MARKET_RENEWABLE = 13,
    MARKET_WEATHER = 14
};

/**
 * @brief SplitMix64 finalizer
 */
inline uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

/**
 * @brief Seed for (base seed, stream, index)
 *
 * Realization i always receives the same generator regardless of how many
 * realizations are drawn or in which order they are evaluated.
 */
inline uint64_t derive_seed(uint64_t seed, RandomStream stream, uint64_t index) {
    return splitmix64(splitmix64(seed ^ splitmix64(static_cast<uint64_t>(stream))) + index);
}

inline RandomEngine make_engine(uint64_t seed, RandomStream stream, uint64_t index = 0) {
    return RandomEngine(derive_seed(seed, stream, index));
}

/**
 * @brief Standard normal cumulative distribution function
 */
inline double normal_cdf(double z) {
    return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

}  // namespace renewfolio
