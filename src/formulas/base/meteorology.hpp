#pragma once

/**
 * @file meteorology.hpp
 * @brief Declarations for the formulas module.
 *
 * Shared near-surface meteorology used by every formula family: vapour
 * pressure terms, psychrometric constant, radiation geometry and the CO2
 * stomatal response. Temperatures are in degC, pressures in kPa.
 * This file is part of the src/formulas subsystem.
 */

namespace petc
{
namespace meteorology
{

/**
 * @brief Saturation vapour pressure (Tetens) [kPa].
 */
double saturation_vapor_pressure(double temperature_c);

/**
 * @brief Slope of the saturation vapour pressure curve [kPa degC-1].
 */
double svp_slope(double temperature_c);

/**
 * @brief Psychrometric constant [kPa degC-1].
 */
double psychrometric_constant(double pressure_kpa);

/**
 * @brief Actual vapour pressure from relative humidity in percent [kPa].
 */
double actual_vapor_pressure(double temperature_c, double relative_humidity_pct);

/**
 * @brief Vapour pressure deficit from relative humidity in percent [kPa].
 */
double vapor_pressure_deficit(double temperature_c, double relative_humidity_pct);

/**
 * @brief Moist air density [kg m-3].
 */
double air_density(double temperature_c, double pressure_kpa, double relative_humidity_pct);

/**
 * @brief Daily extraterrestrial radiation (FAO-56 eq. 21) [MJ m-2 day-1].
 */
double extraterrestrial_radiation(double day_of_year, double latitude_deg);

/**
 * @brief Daylight length as a fraction of 12 hours (CBM model).
 *
 * Polar day yields 2 and polar night 0.
 */
double daylight_fraction(double day_of_year, double latitude_deg);

/**
 * @brief Energy-limited equilibrium evaporation delta/(delta+gamma)*A/lambda [mm day-1].
 */
double equilibrium_evaporation(double temperature_c, double pressure_kpa, double available_energy);

enum class Co2Response
{
    Sqrt = 0,
    Linear = 1,
    Log = 2,
};

/**
 * @brief Parses the numeric response selector used in formula parameters.
 * @throws std::invalid_argument for selectors other than 0, 1 or 2.
 */
Co2Response co2_response_from_parameter(double selector);

/**
 * @brief Stomatal conductance scaling relative to the reference CO2 level.
 * A missing (NaN) concentration yields NaN.
 * @throws std::domain_error for non-positive CO2.
 */
double co2_response_factor(double co2_ppm, double reference_ppm, Co2Response method);

/**
 * @brief Divides and rejects a zero denominator.
 * @throws std::domain_error when the denominator is zero.
 */
double checked_ratio(double numerator, double denominator, const char* what);

/**
 * @brief Clamps a value to [0, 1].
 */
double unit_clamp(double value);

} // namespace meteorology
} // namespace petc
