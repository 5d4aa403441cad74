#pragma once

/**
 * @file pml.hpp
 * @brief Declarations for the formulas module.
 *
 * Penman-Monteith-Leuning formulas with canopy conductance limited by
 * leaf area, temperature and vapour pressure deficit. Version 2 adds soil
 * moisture stress on both components.
 * This file is part of the src/formulas subsystem.
 */

#include "formula_base.hpp"

namespace petc
{
namespace formulas
{

struct PmlFluxes
{
    double transpiration = 0.0;
    double evaporation = 0.0;
};

struct PmlParameters
{
    double max_canopy_conductance = 0.006;  // m s-1
    double vpd_scale = 3.0;                 // kPa
    double optimal_temperature = 25.0;      // degC
};

/**
 * @brief Unclamped canopy transpiration and soil evaporation for one timestep.
 * @throws std::domain_error for zero wind speed.
 */
PmlFluxes pml_fluxes(double temperature_c,
                     double relative_humidity_pct,
                     double wind_speed_ms,
                     double net_radiation,
                     double lai,
                     double pressure_kpa,
                     double soil_heat_flux,
                     const PmlParameters& params);

FormulaSpec pml_spec();
FormulaSpec pml_v2_spec();

} // namespace formulas
} // namespace petc
