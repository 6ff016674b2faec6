// include/renewfolio/risk/volatility_model.hpp
#pragma once

#include <string>
#include <vector>
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/time_series.hpp"

namespace renewfolio {

/**
 * @brief How consecutive prices are turned into returns
 */
enum class ReturnType {
    DIFFERENCE,  // p_t - p_{t-1}; tolerates zero prices
    LOG,         // ln(p_t / p_{t-1})
    SIMPLE       // p_t / p_{t-1} - 1
};

std::string return_type_to_string(ReturnType type);
ReturnType return_type_from_string(const std::string& name, ReturnType fallback);

/**
 * @brief Returns of a price series
 * @return INVALID_DATA for a non-positive price under LOG or SIMPLE
 */
Result<std::vector<double>> compute_returns(const TimeSeries& prices, ReturnType type);

/**
 * @brief Single return from two consecutive prices
 * @return INVALID_DATA for a non-positive previous price under LOG or SIMPLE
 */
Result<double> compute_return(double previous, double current, ReturnType type);

/**
 * @brief Base class for volatility models
 *
 * Models are fitted on prices and forecast per-step volatility of the chosen return
 * type. Implementations are interchangeable behind RiskModel.
 */
class VolatilityModel {
public:
    virtual ~VolatilityModel() = default;

    /**
     * @brief Fit the model to a price series
     * @param prices Hourly prices
     * @return Result indicating success or failure
     */
    virtual Result<void> fit(const TimeSeries& prices) = 0;

    /**
     * @brief Forecast conditional volatility for the next horizon steps
     * @return Series stamped one hour after the last fitted observation onward
     */
    virtual Result<TimeSeries> forecast(int horizon) const = 0;

    /**
     * @brief Conditional volatility of the last fitted step
     */
    virtual Result<double> get_current_volatility() const = 0;

    /**
     * @brief Long-run variance implied by the fitted model
     */
    virtual Result<double> unconditional_variance() const = 0;

    /**
     * @brief Extend the fit with the next observed price
     */
    virtual Result<void> update(double new_price) = 0;

    virtual bool is_fitted() const = 0;

    virtual std::string name() const = 0;
};

}  // namespace renewfolio
