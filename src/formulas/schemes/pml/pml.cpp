/**
 * @file pml.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the PML formulas.
 * This file is part of the src/formulas subsystem.
 */

#include "pml.hpp"

#include <algorithm>
#include <cmath>

#include "formulas/base/meteorology.hpp"
#include "formulas/base/scheme_support.hpp"
#include "formulas/schemes/pt_jpl/pt_jpl.hpp"

namespace petc
{
namespace formulas
{
namespace
{

PmlParameters read_parameters(const FormulaParameters& params)
{
    PmlParameters out;
    out.max_canopy_conductance = params.get("max_canopy_conductance");
    out.vpd_scale = params.get("vpd_scale");
    out.optimal_temperature = params.get("optimal_temperature");
    return out;
}

PmlFluxes fluxes_at(const FormulaInputs& in, std::size_t i, const PmlParameters& params)
{
    return pml_fluxes(in.at("temperature", i),
                      in.at("relative_humidity", i),
                      in.at("wind_speed", i),
                      in.at("net_radiation", i),
                      in.at("lai", i),
                      in.at("pressure", i),
                      in.at("soil_heat_flux", i),
                      params);
}

ComputationResult compute_pml(const FormulaInputs& in, const FormulaParameters& params)
{
    const PmlParameters pml = read_parameters(params);
    ComputationResult result = make_result(in);
    const std::size_t n = in.num_timesteps();
    const std::size_t transpiration = add_series(result.components, "transpiration", n);
    const std::size_t evaporation = add_series(result.components, "evaporation", n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const PmlFluxes f = fluxes_at(in, i, pml);
        result.components[transpiration].values[i] = non_negative(f.transpiration);
        result.components[evaporation].values[i] = non_negative(f.evaporation);
        result.total[i] = non_negative(f.transpiration + f.evaporation);
    }
    return result;
}

ComputationResult compute_pml_v2(const FormulaInputs& in, const FormulaParameters& params)
{
    const PmlParameters pml = read_parameters(params);
    const double critical = params.get("critical_soil_moisture");
    ComputationResult result = make_result(in);
    const std::size_t n = in.num_timesteps();
    const std::size_t transpiration = add_series(result.components, "transpiration", n);
    const std::size_t evaporation = add_series(result.components, "evaporation", n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const PmlFluxes f = fluxes_at(in, i, pml);
        const double soil_moisture = in.at("soil_moisture", i);
        const double f_transpiration = soil_moisture_constraint(soil_moisture, critical);
        const double f_evaporation = std::sqrt(meteorology::unit_clamp(soil_moisture));

        const double et_transpiration = non_negative(f.transpiration) * f_transpiration;
        const double et_evaporation = non_negative(f.evaporation) * f_evaporation;
        result.components[transpiration].values[i] = et_transpiration;
        result.components[evaporation].values[i] = et_evaporation;
        result.total[i] = et_transpiration + et_evaporation;
    }
    return result;
}

std::vector<FormulaParameter> pml_parameter_declarations()
{
    const PmlParameters defaults;
    return {
        {"max_canopy_conductance", defaults.max_canopy_conductance, "Maximum canopy conductance [m s-1]"},
        {"vpd_scale", defaults.vpd_scale, "VPD e-folding scale of conductance [kPa]"},
        {"optimal_temperature", defaults.optimal_temperature, "Temperature of peak conductance [degC]"},
    };
}

} // namespace

PmlFluxes pml_fluxes(double temperature_c,
                     double relative_humidity_pct,
                     double wind_speed_ms,
                     double net_radiation,
                     double lai,
                     double pressure_kpa,
                     double soil_heat_flux,
                     const PmlParameters& params)
{
    using namespace meteorology;
    const double lambda = physical_constants::latent_heat_vaporization_mjkg;
    const double delta = svp_slope(temperature_c);
    const double gamma = psychrometric_constant(pressure_kpa);
    const double vpd = vapor_pressure_deficit(temperature_c, relative_humidity_pct);

    const double f_lai = 1.0 - std::exp(-0.5 * lai);
    const double dt = temperature_c - params.optimal_temperature;
    const double f_temperature = std::exp(-dt * dt / 200.0);
    const double f_vpd = std::exp(-checked_ratio(vpd, params.vpd_scale, "VPD conductance scale"));
    const double gc = params.max_canopy_conductance * f_lai * f_temperature * f_vpd;

    const double ra = checked_ratio(physical_constants::grass_aerodynamic_coefficient, wind_speed_ms,
                                    "aerodynamic resistance");
    const double rs = std::clamp(1.0 / (gc + 1e-6), 10.0, 1000.0);

    const double f_canopy = 1.0 - std::exp(-0.6 * lai);
    const double rn_canopy = net_radiation * f_canopy;
    const double rn_soil = net_radiation * (1.0 - f_canopy);

    PmlFluxes out;
    out.transpiration = (delta * rn_canopy + physical_constants::air_heat_capacity_term * vpd / ra) /
                        (lambda * (delta + gamma * (1.0 + rs / ra)));
    out.evaporation =
        physical_constants::priestley_taylor_alpha * (delta / (delta + gamma)) * (rn_soil - soil_heat_flux) / lambda;
    return out;
}

FormulaSpec pml_spec()
{
    FormulaSpec spec;
    spec.name = "pml";
    spec.family = FormulaFamily::VegetationAware;
    spec.description = "Penman-Monteith-Leuning canopy transpiration plus soil evaporation";
    spec.required_inputs = {"temperature", "relative_humidity", "wind_speed", "net_radiation", "lai"};
    spec.optional_inputs = surface_energy_optionals();
    spec.parameters = pml_parameter_declarations();
    spec.function = compute_pml;
    spec.supports_partition = true;
    spec.component_names = {"transpiration", "evaporation"};
    return spec;
}

FormulaSpec pml_v2_spec()
{
    FormulaSpec spec = pml_spec();
    spec.name = "pml_v2";
    spec.description = "PML with soil moisture stress on transpiration and evaporation";
    spec.required_inputs.push_back("soil_moisture");
    spec.parameters.push_back({"critical_soil_moisture", 0.3, "Soil moisture below which transpiration stops"});
    spec.function = compute_pml_v2;
    return spec;
}

} // namespace formulas
} // namespace petc
