/**
 * @file pt_jpl.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the PT-JPL formulas.
 * This file is part of the src/formulas subsystem.
 */

#include "pt_jpl.hpp"

#include <cmath>

#include "formulas/base/meteorology.hpp"
#include "formulas/base/scheme_support.hpp"

namespace petc
{
namespace formulas
{
namespace
{

ComputationResult compute_pt_jpl(const FormulaInputs& in, const FormulaParameters& params)
{
    const double alpha = params.get("alpha");
    const double critical = params.get("critical_soil_moisture");
    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        const double available = in.at("net_radiation", i) - in.at("soil_heat_flux", i);
        const double potential =
            alpha * meteorology::equilibrium_evaporation(in.at("temperature", i), in.at("pressure", i), available);
        const double f_green = green_fraction_from_lai(in.at("lai", i));
        const double f_sm = soil_moisture_constraint(in.at("soil_moisture", i), critical);
        result.total[i] = non_negative(potential * f_green * f_sm);
    }
    return result;
}

ComputationResult compute_pt_jpl_partition(const FormulaInputs& in, const FormulaParameters& params)
{
    using namespace meteorology;
    const double alpha = params.get("alpha");
    const double critical = params.get("critical_soil_moisture");
    const double interception = params.get("interception_fraction");
    const double lambda = physical_constants::latent_heat_vaporization_mjkg;

    ComputationResult result = make_result(in);
    const std::size_t n = in.num_timesteps();
    const std::size_t transpiration = add_series(result.components, "transpiration", n);
    const std::size_t canopy = add_series(result.components, "canopy_evaporation", n);
    const std::size_t soil = add_series(result.components, "soil_evaporation", n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const double t = in.at("temperature", i);
        const double rn = in.at("net_radiation", i);
        const double delta = svp_slope(t);
        const double gamma = psychrometric_constant(in.at("pressure", i));
        const double energy_split = delta / (delta + gamma);

        const double f_green = green_fraction_from_lai(in.at("lai", i));
        const double f_sm = soil_moisture_constraint(in.at("soil_moisture", i), critical);
        const double rn_canopy = rn * f_green;
        const double rn_soil = rn * (1.0 - f_green);

        const double et_transpiration = alpha * energy_split * rn_canopy / lambda * f_sm;
        const double et_canopy = interception * rn_canopy / lambda;
        const double et_soil = energy_split * (rn_soil - in.at("soil_heat_flux", i)) / lambda * std::sqrt(f_sm);

        result.components[transpiration].values[i] = non_negative(et_transpiration);
        result.components[canopy].values[i] = non_negative(et_canopy);
        result.components[soil].values[i] = non_negative(et_soil);
        result.total[i] = non_negative(et_transpiration + et_canopy + et_soil);
    }
    return result;
}

} // namespace

double green_fraction_from_lai(double lai)
{
    return 1.0 - std::exp(-lai / 2.0);
}

double soil_moisture_constraint(double soil_moisture, double critical_soil_moisture)
{
    const double scaled = meteorology::checked_ratio(soil_moisture - critical_soil_moisture,
                                                     1.0 - critical_soil_moisture,
                                                     "soil moisture constraint");
    return meteorology::unit_clamp(scaled);
}

FormulaSpec pt_jpl_spec()
{
    FormulaSpec spec;
    spec.name = "pt_jpl";
    spec.family = FormulaFamily::VegetationAware;
    spec.description = "PT-JPL with green fraction and soil moisture constraints";
    spec.required_inputs = {"temperature", "net_radiation", "lai"};
    spec.optional_inputs = {{"soil_moisture", 0.5}};
    for (const auto& optional : surface_energy_optionals())
    {
        spec.optional_inputs.push_back(optional);
    }
    spec.parameters = {
        {"alpha", physical_constants::priestley_taylor_alpha, "Priestley-Taylor coefficient"},
        {"critical_soil_moisture", 0.3, "Soil moisture below which transpiration stops"},
    };
    spec.function = compute_pt_jpl;
    return spec;
}

FormulaSpec pt_jpl_partition_spec()
{
    FormulaSpec spec;
    spec.name = "pt_jpl_partition";
    spec.family = FormulaFamily::VegetationAware;
    spec.description = "PT-JPL split into transpiration, interception and soil evaporation";
    spec.required_inputs = {"temperature", "net_radiation", "lai", "soil_moisture"};
    spec.optional_inputs = surface_energy_optionals();
    spec.parameters = {
        {"alpha", physical_constants::priestley_taylor_alpha, "Priestley-Taylor coefficient"},
        {"critical_soil_moisture", 0.3, "Soil moisture below which transpiration stops"},
        {"interception_fraction", 0.1, "Fraction of canopy net radiation evaporated as interception"},
    };
    spec.function = compute_pt_jpl_partition;
    spec.supports_partition = true;
    spec.component_names = {"transpiration", "canopy_evaporation", "soil_evaporation"};
    return spec;
}

} // namespace formulas
} // namespace petc
