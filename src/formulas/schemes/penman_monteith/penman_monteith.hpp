#pragma once

/**
 * @file penman_monteith.hpp
 * @brief Declarations for the formulas module.
 *
 * Combination-equation formulas: FAO-56 grass reference and the general
 * Penman-Monteith form with explicit surface resistance.
 * This file is part of the src/formulas subsystem.
 */

#include "formula_base.hpp"

namespace petc
{
namespace formulas
{

/**
 * @brief FAO-56 reference evapotranspiration for one timestep [mm day-1].
 */
double penman_monteith_fao56(double temperature_c,
                             double relative_humidity_pct,
                             double wind_speed_ms,
                             double net_radiation,
                             double pressure_kpa,
                             double soil_heat_flux,
                             double min_wind_speed);

FormulaSpec penman_monteith_spec();
FormulaSpec penman_monteith_general_spec();

} // namespace formulas
} // namespace petc
