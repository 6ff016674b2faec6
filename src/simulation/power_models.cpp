// src/simulation/power_models.cpp

#include "renewfolio/simulation/power_models.hpp"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace renewfolio {

namespace {

constexpr double PROBABILITY_EPSILON = 1e-12;
constexpr double SOLAR_NOON = 12.0;
constexpr double EQUINOX_DAY = 80.0;  // Spring equinox, day-length phase origin

double clamp_probability(double u) {
    return std::min(std::max(u, PROBABILITY_EPSILON), 1.0 - PROBABILITY_EPSILON);
}

double annual_phase(int day_of_year) {
    return std::sin(2.0 * M_PI * (day_of_year - EQUINOX_DAY) / 365.0);
}

}  // namespace

double weibull_quantile(double u, double shape, double scale) {
    u = clamp_probability(u);
    return scale * std::pow(-std::log1p(-u), 1.0 / shape);
}

double kumaraswamy_quantile(double u, double a, double b) {
    u = clamp_probability(u);
    double inner = 1.0 - std::pow(1.0 - u, 1.0 / b);
    return std::min(std::max(std::pow(inner, 1.0 / a), 0.0), 1.0);
}

WindPowerCurve::WindPowerCurve(const WindParameters& params)
    : cut_in_(params.cut_in_speed),
      rated_(params.rated_speed),
      cut_out_(params.cut_out_speed),
      ramp_denominator_(std::pow(params.rated_speed, 3) - std::pow(params.cut_in_speed, 3)) {}

double WindPowerCurve::capacity_fraction(double wind_speed) const {
    if (wind_speed < cut_in_ || wind_speed >= cut_out_) {
        return 0.0;
    }
    if (wind_speed >= rated_) {
        return 1.0;
    }
    double fraction = (std::pow(wind_speed, 3) - std::pow(cut_in_, 3)) / ramp_denominator_;
    return std::min(std::max(fraction, 0.0), 1.0);
}

double modulated_weibull_scale(const WindParameters& params, int hour, int day_of_year) {
    double seasonal =
        1.0 + params.seasonal_amplitude *
                  std::cos(2.0 * M_PI * (day_of_year - params.seasonal_peak_day) / 365.0);
    double diurnal =
        1.0 + params.diurnal_amplitude * std::cos(2.0 * M_PI * (hour - params.diurnal_peak_hour) / 24.0);
    return params.weibull_scale * seasonal * diurnal;
}

double clear_sky_fraction(const SolarParameters& params, int hour, int day_of_year) {
    const double phase = annual_phase(day_of_year);
    const double day_length = 12.0 + params.daylength_amplitude * phase;
    const double sunrise = SOLAR_NOON - day_length / 2.0;

    // Evaluate at the middle of the hour
    const double x = (hour + 0.5 - sunrise) / day_length;
    if (x <= 0.0 || x >= 1.0) {
        return 0.0;
    }

    const double seasonal = (1.0 + params.seasonal_amplitude * phase) /
                            (1.0 + params.seasonal_amplitude);
    return params.clear_sky_peak * seasonal * std::sin(M_PI * x);
}

double ambient_temperature_c(const SolarParameters& params, int hour, int day_of_year) {
    // Warmest around late July, daily maximum mid-afternoon
    return params.ambient_mean_c +
           params.ambient_seasonal_amplitude_c * std::sin(2.0 * M_PI * (day_of_year - 105.0) / 365.0) +
           params.ambient_diurnal_amplitude_c * std::sin(2.0 * M_PI * (hour - 9.0) / 24.0);
}

double temperature_derate(const SolarParameters& params, double cell_temperature_c) {
    double derate = 1.0 + params.temperature_coefficient *
                              (cell_temperature_c - params.reference_temperature_c);
    return std::min(std::max(derate, 0.0), 1.0);
}

}  // namespace renewfolio
