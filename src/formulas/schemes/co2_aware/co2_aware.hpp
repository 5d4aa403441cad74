#pragma once

/**
 * @file co2_aware.hpp
 * @brief Declarations for the formulas module.
 *
 * Penman-Monteith variants whose surface resistance responds to the
 * atmospheric CO2 concentration.
 * This file is part of the src/formulas subsystem.
 */

#include "formula_base.hpp"

namespace petc
{
namespace formulas
{

FormulaSpec pm_co2_spec();
FormulaSpec pm_co2_lai_spec();

} // namespace formulas
} // namespace petc
