/**
 * @file meteorology.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the shared meteorology helpers used by formula schemes.
 * This file is part of the src/formulas subsystem.
 */

#include "meteorology.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "physical_constants.hpp"

namespace petc
{
namespace meteorology
{

double saturation_vapor_pressure(double temperature_c)
{
    return 0.6108 * std::exp((17.27 * temperature_c) / (temperature_c + 237.3));
}

double svp_slope(double temperature_c)
{
    const double es = saturation_vapor_pressure(temperature_c);
    return 4098.0 * es / ((temperature_c + 237.3) * (temperature_c + 237.3));
}

double psychrometric_constant(double pressure_kpa)
{
    return physical_constants::psychrometric_coefficient * pressure_kpa;
}

double actual_vapor_pressure(double temperature_c, double relative_humidity_pct)
{
    return saturation_vapor_pressure(temperature_c) * relative_humidity_pct / 100.0;
}

double vapor_pressure_deficit(double temperature_c, double relative_humidity_pct)
{
    return saturation_vapor_pressure(temperature_c) - actual_vapor_pressure(temperature_c, relative_humidity_pct);
}

double air_density(double temperature_c, double pressure_kpa, double relative_humidity_pct)
{
    const double t_k = temperature_c + physical_constants::freezing_temperature_k;
    const double p_pa = pressure_kpa * 1000.0;
    const double ea_pa = actual_vapor_pressure(temperature_c, relative_humidity_pct) * 1000.0;
    // Dry air plus water vapour partial densities.
    return (p_pa - ea_pa) / (287.05 * t_k) + ea_pa / (461.5 * t_k);
}

double extraterrestrial_radiation(double day_of_year, double latitude_deg)
{
    using physical_constants::pi;
    const double lat_rad = latitude_deg * pi / 180.0;
    const double dr = 1.0 + 0.033 * std::cos(2.0 * pi * day_of_year / 365.0);
    const double declination = 0.409 * std::sin(2.0 * pi * day_of_year / 365.0 - 1.39);
    const double cos_ws = std::clamp(-std::tan(lat_rad) * std::tan(declination), -1.0, 1.0);
    const double ws = std::acos(cos_ws);
    return (24.0 * 60.0 / pi) * physical_constants::solar_constant_mjm2min * dr *
           (ws * std::sin(lat_rad) * std::sin(declination) +
            std::cos(lat_rad) * std::cos(declination) * std::sin(ws));
}

double daylight_fraction(double day_of_year, double latitude_deg)
{
    using physical_constants::pi;
    const double theta = 0.2163108 + 2.0 * std::atan(0.9671396 * std::tan(0.00860 * (day_of_year - 186.0)));
    const double phi = std::asin(0.39795 * std::cos(theta));
    const double lat_rad = latitude_deg * pi / 180.0;
    const double ratio = (std::sin(0.8333 * pi / 180.0) + std::sin(lat_rad) * std::sin(phi)) /
                         (std::cos(lat_rad) * std::cos(phi));

    if (ratio < -1.0 || ratio > 1.0)
    {
        // Polar day when sun and site share a hemisphere, polar night otherwise.
        return ((phi > 0.0 && latitude_deg > 0.0) || (phi < 0.0 && latitude_deg < 0.0)) ? 2.0 : 0.0;
    }
    return (24.0 - (24.0 / pi) * std::acos(ratio)) / 12.0;
}

double equilibrium_evaporation(double temperature_c, double pressure_kpa, double available_energy)
{
    const double delta = svp_slope(temperature_c);
    const double gamma = psychrometric_constant(pressure_kpa);
    return delta / (delta + gamma) * available_energy / physical_constants::latent_heat_vaporization_mjkg;
}

Co2Response co2_response_from_parameter(double selector)
{
    if (selector == 0.0) return Co2Response::Sqrt;
    if (selector == 1.0) return Co2Response::Linear;
    if (selector == 2.0) return Co2Response::Log;
    throw std::invalid_argument("Unknown CO2 response method selector: " + std::to_string(selector) +
                                " (expected 0=sqrt, 1=linear, 2=log)");
}

double co2_response_factor(double co2_ppm, double reference_ppm, Co2Response method)
{
    if (std::isnan(co2_ppm))
    {
        return co2_ppm;
    }
    if (co2_ppm <= 0.0)
    {
        throw std::domain_error("CO2 concentration must be positive, got " + std::to_string(co2_ppm));
    }

    switch (method)
    {
        case Co2Response::Sqrt:
            return std::sqrt(reference_ppm / co2_ppm);
        case Co2Response::Linear:
        {
            constexpr double beta = 0.3;
            return std::clamp(1.0 - beta * (co2_ppm - reference_ppm) / reference_ppm, 0.5, 1.5);
        }
        case Co2Response::Log:
            return 1.0 - 0.15 * std::log(co2_ppm / reference_ppm);
        default:
            return 1.0;
    }
}

double checked_ratio(double numerator, double denominator, const char* what)
{
    if (denominator == 0.0)
    {
        throw std::domain_error(std::string("division by zero in ") + what);
    }
    return numerator / denominator;
}

double unit_clamp(double value)
{
    return std::clamp(value, 0.0, 1.0);
}

} // namespace meteorology
} // namespace petc
