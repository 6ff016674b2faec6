// src/risk/volatility_model.cpp

#include "renewfolio/risk/volatility_model.hpp"
#include <cmath>

namespace renewfolio {

std::string return_type_to_string(ReturnType type) {
    switch (type) {
        case ReturnType::DIFFERENCE:
            return "DIFFERENCE";
        case ReturnType::LOG:
            return "LOG";
        case ReturnType::SIMPLE:
            return "SIMPLE";
        default:
            return "UNKNOWN";
    }
}

ReturnType return_type_from_string(const std::string& name, ReturnType fallback) {
    if (name == "DIFFERENCE") return ReturnType::DIFFERENCE;
    if (name == "LOG") return ReturnType::LOG;
    if (name == "SIMPLE") return ReturnType::SIMPLE;
    return fallback;
}

Result<double> compute_return(double previous, double current, ReturnType type) {
    if (type == ReturnType::DIFFERENCE) {
        return current - previous;
    }
    if (previous <= 0.0 || current <= 0.0) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  return_type_to_string(type) +
                                      " returns need positive prices, got " +
                                      std::to_string(previous) + " -> " +
                                      std::to_string(current),
                                  "VolatilityModel");
    }
    if (type == ReturnType::LOG) {
        return std::log(current / previous);
    }
    return current / previous - 1.0;
}

Result<std::vector<double>> compute_returns(const TimeSeries& prices, ReturnType type) {
    std::vector<double> returns;
    if (prices.size() < 2) {
        return returns;
    }
    returns.reserve(prices.size() - 1);

    for (size_t t = 1; t < prices.size(); ++t) {
        auto r = compute_return(prices[t - 1], prices[t], type);
        if (r.is_error()) {
            return make_error<std::vector<double>>(
                r.error()->code(),
                std::string(r.error()->what()) + " at index " + std::to_string(t),
                "VolatilityModel");
        }
        returns.push_back(r.value());
    }
    return returns;
}

}  // namespace renewfolio
