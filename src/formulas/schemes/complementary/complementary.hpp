#pragma once

/**
 * @file complementary.hpp
 * @brief Declarations for the formulas module.
 *
 * Complementary relationship formulas. Each reports a potential
 * evaporation total and exposes the wet-environment terms it was derived
 * from as diagnostics.
 * This file is part of the src/formulas subsystem.
 */

#include "formula_base.hpp"

namespace petc
{
namespace formulas
{

FormulaSpec cr_bouchet_spec();
FormulaSpec cr_advection_aridity_spec();
FormulaSpec cr_nonlinear_spec();
FormulaSpec cr_granger_gray_spec();

} // namespace formulas
} // namespace petc
