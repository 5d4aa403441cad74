#pragma once

/**
 * @file factory.hpp
 * @brief Declarations for the formulas module.
 *
 * Builds registries populated with the default formula catalog.
 * This file is part of the src/formulas subsystem.
 */

#include <string>
#include <vector>

#include "formula_registry.hpp"

namespace petc
{

/**
 * @brief Registers the default catalog into a registry, in catalog order.
 * @throws RegistrationError when an option override names an unknown formula
 *         or an undeclared option, or when a name is already registered.
 */
void register_default_formulas(FormulaRegistry& registry, const FormulaOptionsMap& options = {});

/**
 * @brief Builds a fresh registry holding the default catalog.
 */
FormulaRegistry build_formula_registry(const FormulaOptionsMap& options = {});

/**
 * @brief Shared registry holding the default catalog with default options.
 */
const FormulaRegistry& default_formula_registry();

/**
 * @brief Returns names of the default catalog formulas.
 */
std::vector<std::string> get_available_formulas();

} // namespace petc
