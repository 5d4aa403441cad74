/**
 * @file factory.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the default catalog and registry construction.
 * This file is part of the src/formulas subsystem.
 */

#include "factory.hpp"

#include <algorithm>

#include "comparison_errors.hpp"
#include "schemes/co2_aware/co2_aware.hpp"
#include "schemes/complementary/complementary.hpp"
#include "schemes/penman_monteith/penman_monteith.hpp"
#include "schemes/pml/pml.hpp"
#include "schemes/priestley_taylor/priestley_taylor.hpp"
#include "schemes/pt_jpl/pt_jpl.hpp"
#include "schemes/temperature/temperature.hpp"

namespace petc
{
namespace
{

std::vector<FormulaSpec> default_catalog()
{
    using namespace formulas;
    return {
        penman_monteith_spec(),
        penman_monteith_general_spec(),
        priestley_taylor_spec(),
        priestley_taylor_advection_spec(),
        pt_jpl_spec(),
        pt_jpl_partition_spec(),
        pml_spec(),
        pml_v2_spec(),
        pm_co2_spec(),
        pm_co2_lai_spec(),
        cr_bouchet_spec(),
        cr_advection_aridity_spec(),
        cr_nonlinear_spec(),
        cr_granger_gray_spec(),
        hamon_spec(),
        hargreaves_spec(),
    };
}

} // namespace

/**
 * @brief Registers the default formula catalog.
 */
void register_default_formulas(FormulaRegistry& registry, const FormulaOptionsMap& options)
{
    std::vector<FormulaSpec> catalog = default_catalog();

    for (const auto& entry : options)
    {
        const bool known = std::any_of(catalog.begin(), catalog.end(),
                                       [&](const FormulaSpec& spec) { return spec.name == entry.first; });
        if (!known)
        {
            throw RegistrationError("Options given for unknown formula: " + entry.first);
        }
    }

    for (auto& spec : catalog)
    {
        const auto it = options.find(spec.name);
        if (it != options.end())
        {
            registry.register_formula(std::move(spec), it->second);
        }
        else
        {
            registry.register_formula(std::move(spec));
        }
    }
}

FormulaRegistry build_formula_registry(const FormulaOptionsMap& options)
{
    FormulaRegistry registry;
    register_default_formulas(registry, options);
    return registry;
}

const FormulaRegistry& default_formula_registry()
{
    static const FormulaRegistry registry = build_formula_registry();
    return registry;
}

/**
 * @brief Gets the available formulas.
 */
std::vector<std::string> get_available_formulas()
{
    return default_formula_registry().names();
}

} // namespace petc
