/**
 * @file temperature.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the Hamon and Hargreaves formulas.
 * This file is part of the src/formulas subsystem.
 */

#include "temperature.hpp"

#include <cmath>
#include <limits>

#include "formulas/base/meteorology.hpp"
#include "formulas/base/scheme_support.hpp"

namespace petc
{
namespace formulas
{
namespace
{

constexpr double kMinutesPerDay = 1440.0;

ComputationResult compute_hamon(const FormulaInputs& in, const FormulaParameters& params)
{
    const double coefficient = params.get("coefficient");
    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        result.total[i] = coefficient * hamon_pet(in.at("temperature", i), in.at("latitude", i), in.at("doy", i));
    }
    return result;
}

ComputationResult compute_hargreaves(const FormulaInputs& in, const FormulaParameters& params)
{
    const double coefficient = params.get("coefficient");
    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        result.total[i] = hargreaves_pet(in.at("temperature", i),
                                         in.at("temperature_max", i),
                                         in.at("temperature_min", i),
                                         in.at("latitude", i),
                                         in.at("doy", i),
                                         coefficient);
    }
    return result;
}

} // namespace

double hamon_pet(double temperature_c, double latitude_deg, double day_of_year)
{
    if (std::isnan(temperature_c) || std::isnan(latitude_deg) || std::isnan(day_of_year))
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (temperature_c <= 0.0)
    {
        return 0.0;
    }

    // Saturation vapour pressure [mb] and saturated vapour density [g m-3]
    const double esat = 6.108 * std::exp(17.26939 * temperature_c / (temperature_c + 237.3));
    const double wt = 216.7 * esat / (temperature_c + 273.3);
    const double d = meteorology::daylight_fraction(day_of_year, latitude_deg);

    // m min-1 rate of the hydrology form, converted to mm day-1
    const double metres_per_minute = 1.6169e-6 * d * d * wt * 60.0 / 1000.0;
    return metres_per_minute * 1000.0 * kMinutesPerDay;
}

double hargreaves_pet(double temperature_c,
                      double temperature_max_c,
                      double temperature_min_c,
                      double latitude_deg,
                      double day_of_year,
                      double coefficient)
{
    const double range = temperature_max_c - temperature_min_c;
    if (range < 0.0)
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double ra = meteorology::extraterrestrial_radiation(day_of_year, latitude_deg);
    return coefficient * physical_constants::mj_to_mm_water * ra * std::sqrt(range) * (temperature_c + 17.8);
}

FormulaSpec hamon_spec()
{
    FormulaSpec spec;
    spec.name = "hamon";
    spec.family = FormulaFamily::TemperatureBased;
    spec.description = "Hamon daylight and saturated vapour density PET";
    spec.required_inputs = {"temperature", "latitude", "doy"};
    spec.parameters = {
        {"coefficient", 1.0, "Calibration multiplier"},
    };
    spec.function = compute_hamon;
    return spec;
}

FormulaSpec hargreaves_spec()
{
    FormulaSpec spec;
    spec.name = "hargreaves";
    spec.family = FormulaFamily::TemperatureBased;
    spec.description = "Hargreaves-Samani temperature range reference ET";
    spec.required_inputs = {"temperature", "temperature_max", "temperature_min", "latitude", "doy"};
    spec.parameters = {
        {"coefficient", 0.0023, "Hargreaves coefficient"},
    };
    spec.function = compute_hargreaves;
    return spec;
}

} // namespace formulas
} // namespace petc
