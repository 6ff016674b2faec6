// include/renewfolio/core/statistics.hpp
#pragma once

#include <vector>

namespace renewfolio {
namespace statistics {

/**
 * @brief Arithmetic mean, 0 for an empty sample
 */
double mean(const std::vector<double>& data);

/**
 * @brief Unbiased sample variance around the given mean, 0 below two observations
 */
double sample_variance(const std::vector<double>& data, double mean);

/**
 * @brief Sample standard deviation
 */
double sample_std(const std::vector<double>& data);

/**
 * @brief Quantile with linear interpolation between order statistics
 *
 * Position (n - 1) * p in the sorted sample. The input is taken by value and
 * partially reordered.
 *
 * @param p Probability in [0, 1]
 */
double quantile(std::vector<double> data, double p);

/**
 * @brief Quantile of data that is already sorted ascending
 */
double quantile_sorted(const std::vector<double>& sorted, double p);

}  // namespace statistics
}  // namespace renewfolio
