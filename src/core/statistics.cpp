// src/core/statistics.cpp

#include "renewfolio/core/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace renewfolio {
namespace statistics {

double mean(const std::vector<double>& data) {
    if (data.empty()) return 0.0;
    return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
}

double sample_variance(const std::vector<double>& data, double mean) {
    if (data.size() <= 1) return 0.0;
    double sum_sq = 0.0;
    for (double val : data) {
        double diff = val - mean;
        sum_sq += diff * diff;
    }
    return sum_sq / (data.size() - 1);
}

double sample_std(const std::vector<double>& data) {
    return std::sqrt(sample_variance(data, mean(data)));
}

double quantile_sorted(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0.0;
    p = std::min(std::max(p, 0.0), 1.0);
    const double position = p * (sorted.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(position));
    const size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double weight = position - lower;
    return sorted[lower] + weight * (sorted[upper] - sorted[lower]);
}

double quantile(std::vector<double> data, double p) {
    if (data.empty()) return 0.0;
    std::sort(data.begin(), data.end());
    return quantile_sorted(data, p);
}

}  // namespace statistics
}  // namespace renewfolio
