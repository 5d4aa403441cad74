#pragma once

/**
 * @file pt_jpl.hpp
 * @brief Declarations for the formulas module.
 *
 * PT-JPL vegetation-constrained Priestley-Taylor formulas. The partitioned
 * variant splits net radiation between canopy and soil by green fraction.
 * This file is part of the src/formulas subsystem.
 */

#include "formula_base.hpp"

namespace petc
{
namespace formulas
{

/**
 * @brief Green canopy fraction from leaf area index.
 */
double green_fraction_from_lai(double lai);

/**
 * @brief Soil moisture constraint, 0 at the critical point and 1 at saturation.
 */
double soil_moisture_constraint(double soil_moisture, double critical_soil_moisture);

FormulaSpec pt_jpl_spec();
FormulaSpec pt_jpl_partition_spec();

} // namespace formulas
} // namespace petc
