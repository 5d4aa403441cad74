#pragma once

/**
 * @file temperature.hpp
 * @brief Declarations for the formulas module.
 *
 * Temperature-driven reference formulas that need no radiation or wind
 * measurements.
 * This file is part of the src/formulas subsystem.
 */

#include "formula_base.hpp"

namespace petc
{
namespace formulas
{

/**
 * @brief Hamon PET [mm day-1]; zero at or below freezing.
 */
double hamon_pet(double temperature_c, double latitude_deg, double day_of_year);

/**
 * @brief Hargreaves-Samani reference ET [mm day-1]; NaN when tmax < tmin.
 */
double hargreaves_pet(double temperature_c,
                      double temperature_max_c,
                      double temperature_min_c,
                      double latitude_deg,
                      double day_of_year,
                      double coefficient);

FormulaSpec hamon_spec();
FormulaSpec hargreaves_spec();

} // namespace formulas
} // namespace petc
