// include/renewfolio/simulation/power_models.hpp
#pragma once

#include "renewfolio/simulation/asset_profile.hpp"

namespace renewfolio {

/**
 * @brief Inverse CDF of the Weibull distribution
 * @param u Probability in (0, 1), clamped away from the endpoints
 */
double weibull_quantile(double u, double shape, double scale);

/**
 * @brief Inverse CDF of the Kumaraswamy(a, b) distribution on [0, 1]
 *
 * Used for the cloud-cover fraction. Closed form, unlike the Beta distribution.
 */
double kumaraswamy_quantile(double u, double a, double b);

/**
 * @brief Monotone piecewise turbine power curve
 *
 * Zero below cut-in, cubic ramp to rated speed, flat at rated output and zero
 * from cut-out upwards.
 */
class WindPowerCurve {
public:
    explicit WindPowerCurve(const WindParameters& params);

    /**
     * @brief Output as a fraction of rated capacity, in [0, 1]
     */
    double capacity_fraction(double wind_speed) const;

private:
    double cut_in_;
    double rated_;
    double cut_out_;
    double ramp_denominator_;
};

/**
 * @brief Weibull scale after seasonal and diurnal modulation
 */
double modulated_weibull_scale(const WindParameters& params, int hour, int day_of_year);

/**
 * @brief Clear-sky output fraction for the hour starting at hour
 *
 * Sine-shaped bell centred on solar noon, zero outside the day length for the given
 * day of year. Exactly zero at night.
 */
double clear_sky_fraction(const SolarParameters& params, int hour, int day_of_year);

/**
 * @brief Ambient temperature in C before noise
 */
double ambient_temperature_c(const SolarParameters& params, int hour, int day_of_year);

/**
 * @brief Linear panel temperature derate, clamped to [0, 1]
 */
double temperature_derate(const SolarParameters& params, double cell_temperature_c);

}  // namespace renewfolio
