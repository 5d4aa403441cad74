#pragma once

/**
 * @file priestley_taylor.hpp
 * @brief Declarations for the formulas module.
 *
 * Radiation-driven Priestley-Taylor formulas, with and without the
 * vapour pressure deficit advection factor.
 * This file is part of the src/formulas subsystem.
 */

#include "formula_base.hpp"

namespace petc
{
namespace formulas
{

FormulaSpec priestley_taylor_spec();
FormulaSpec priestley_taylor_advection_spec();

} // namespace formulas
} // namespace petc
