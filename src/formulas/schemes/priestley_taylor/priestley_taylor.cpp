/**
 * @file priestley_taylor.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the Priestley-Taylor formulas.
 * This file is part of the src/formulas subsystem.
 */

#include "priestley_taylor.hpp"

#include "formulas/base/meteorology.hpp"
#include "formulas/base/scheme_support.hpp"

namespace petc
{
namespace formulas
{
namespace
{

ComputationResult compute_priestley_taylor(const FormulaInputs& in, const FormulaParameters& params)
{
    const double alpha = params.get("alpha");
    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        const double available = in.at("net_radiation", i) - in.at("soil_heat_flux", i);
        const double equilibrium =
            meteorology::equilibrium_evaporation(in.at("temperature", i), in.at("pressure", i), available);
        result.total[i] = non_negative(alpha * equilibrium);
    }
    return result;
}

ComputationResult compute_priestley_taylor_advection(const FormulaInputs& in, const FormulaParameters& params)
{
    const double alpha = params.get("alpha");
    const double advection = params.get("advection_coefficient");
    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        const double available = in.at("net_radiation", i) - in.at("soil_heat_flux", i);
        const double equilibrium =
            meteorology::equilibrium_evaporation(in.at("temperature", i), in.at("pressure", i), available);
        result.total[i] = non_negative(alpha * equilibrium * (1.0 + advection * in.at("vpd", i)));
    }
    return result;
}

} // namespace

FormulaSpec priestley_taylor_spec()
{
    FormulaSpec spec;
    spec.name = "priestley_taylor";
    spec.family = FormulaFamily::RadiationBased;
    spec.description = "Priestley-Taylor equilibrium evaporation scaled by alpha";
    spec.required_inputs = {"temperature", "net_radiation"};
    spec.optional_inputs = surface_energy_optionals();
    spec.parameters = {
        {"alpha", physical_constants::priestley_taylor_alpha, "Priestley-Taylor coefficient"},
    };
    spec.function = compute_priestley_taylor;
    return spec;
}

FormulaSpec priestley_taylor_advection_spec()
{
    FormulaSpec spec;
    spec.name = "priestley_taylor_advection";
    spec.family = FormulaFamily::RadiationBased;
    spec.description = "Priestley-Taylor with a linear vapour pressure deficit advection factor";
    spec.required_inputs = {"temperature", "net_radiation", "vpd"};
    spec.optional_inputs = surface_energy_optionals();
    spec.parameters = {
        {"alpha", physical_constants::priestley_taylor_alpha, "Priestley-Taylor coefficient"},
        {"advection_coefficient", 0.1, "Advection factor slope per kPa of VPD"},
    };
    spec.function = compute_priestley_taylor_advection;
    return spec;
}

} // namespace formulas
} // namespace petc
