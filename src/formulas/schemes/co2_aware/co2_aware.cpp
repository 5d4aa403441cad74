/**
 * @file co2_aware.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the CO2-aware Penman-Monteith formulas.
 * This file is part of the src/formulas subsystem.
 */

#include "co2_aware.hpp"

#include <algorithm>
#include <cmath>

#include "formulas/base/meteorology.hpp"
#include "formulas/base/scheme_support.hpp"

namespace petc
{
namespace formulas
{
namespace
{

struct AtmosphereState
{
    double delta = 0.0;
    double gamma = 0.0;
    double vpd = 0.0;
    double ra = 0.0;
};

AtmosphereState atmosphere_at(const FormulaInputs& in, std::size_t i)
{
    using namespace meteorology;
    const double t = in.at("temperature", i);
    AtmosphereState state;
    state.delta = svp_slope(t);
    state.gamma = psychrometric_constant(in.at("pressure", i));
    state.vpd = vapor_pressure_deficit(t, in.at("relative_humidity", i));
    state.ra = checked_ratio(physical_constants::grass_aerodynamic_coefficient, in.at("wind_speed", i),
                             "aerodynamic resistance");
    return state;
}

// Resistance form of Penman-Monteith [mm day-1], unclamped.
double resistance_penman_monteith(const AtmosphereState& s, double available_energy, double rs)
{
    const double numerator = s.delta * available_energy + physical_constants::air_heat_capacity_term * s.vpd / s.ra;
    const double denominator =
        physical_constants::latent_heat_vaporization_mjkg * (s.delta + s.gamma * (1.0 + rs / s.ra));
    return numerator / denominator;
}

ComputationResult compute_pm_co2(const FormulaInputs& in, const FormulaParameters& params)
{
    const double reference = params.get("co2_reference");
    const double rs_reference = params.get("reference_surface_resistance");
    const meteorology::Co2Response method =
        meteorology::co2_response_from_parameter(params.get("co2_response_method"));

    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        const AtmosphereState state = atmosphere_at(in, i);
        const double factor = meteorology::co2_response_factor(in.at("co2", i), reference, method);
        const double rs = meteorology::checked_ratio(rs_reference, factor, "CO2 surface resistance");
        const double available = in.at("net_radiation", i) - in.at("soil_heat_flux", i);
        result.total[i] = non_negative(resistance_penman_monteith(state, available, rs));
    }
    return result;
}

ComputationResult compute_pm_co2_lai(const FormulaInputs& in, const FormulaParameters& params)
{
    const double reference = params.get("co2_reference");
    const double gs_max = params.get("max_stomatal_conductance");

    ComputationResult result = make_result(in);
    const std::size_t n = in.num_timesteps();
    const std::size_t transpiration = add_series(result.components, "transpiration", n);
    const std::size_t evaporation = add_series(result.components, "evaporation", n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const AtmosphereState state = atmosphere_at(in, i);
        const double lai = in.at("lai", i);
        const double factor =
            meteorology::co2_response_factor(in.at("co2", i), reference, meteorology::Co2Response::Sqrt);
        const double gc = gs_max * lai * (1.0 - std::exp(-0.5 * lai)) * factor;
        const double rs = std::clamp(1.0 / (gc + 1e-6), 10.0, 1000.0);

        const double f_canopy = 1.0 - std::exp(-0.6 * lai);
        const double rn = in.at("net_radiation", i);
        const double rn_canopy = rn * f_canopy;
        const double rn_soil = rn * (1.0 - f_canopy);

        const double et_transpiration = resistance_penman_monteith(state, rn_canopy, rs);
        const double et_evaporation = physical_constants::priestley_taylor_alpha *
                                      (state.delta / (state.delta + state.gamma)) *
                                      (rn_soil - in.at("soil_heat_flux", i)) /
                                      physical_constants::latent_heat_vaporization_mjkg;

        result.components[transpiration].values[i] = non_negative(et_transpiration);
        result.components[evaporation].values[i] = non_negative(et_evaporation);
        result.total[i] = non_negative(et_transpiration + et_evaporation);
    }
    return result;
}

} // namespace

FormulaSpec pm_co2_spec()
{
    FormulaSpec spec;
    spec.name = "pm_co2";
    spec.family = FormulaFamily::Co2Aware;
    spec.description = "Penman-Monteith with CO2-scaled surface resistance";
    spec.required_inputs = {"temperature", "relative_humidity", "wind_speed", "net_radiation", "co2"};
    spec.optional_inputs = surface_energy_optionals();
    spec.parameters = {
        {"co2_reference", physical_constants::co2_reference_ppm, "Reference CO2 concentration [ppm]"},
        {"reference_surface_resistance", 70.0, "Surface resistance at the reference CO2 [s m-1]"},
        {"co2_response_method", 0.0, "Stomatal response: 0 sqrt, 1 linear, 2 log"},
    };
    spec.function = compute_pm_co2;
    return spec;
}

FormulaSpec pm_co2_lai_spec()
{
    FormulaSpec spec;
    spec.name = "pm_co2_lai";
    spec.family = FormulaFamily::Co2Aware;
    spec.description = "CO2 and LAI coupled canopy conductance with soil evaporation";
    spec.required_inputs = {"temperature", "relative_humidity", "wind_speed", "net_radiation", "co2", "lai"};
    spec.optional_inputs = surface_energy_optionals();
    spec.parameters = {
        {"co2_reference", physical_constants::co2_reference_ppm, "Reference CO2 concentration [ppm]"},
        {"max_stomatal_conductance", 0.01, "Leaf-level maximum stomatal conductance [m s-1]"},
    };
    spec.function = compute_pm_co2_lai;
    spec.supports_partition = true;
    spec.component_names = {"transpiration", "evaporation"};
    return spec;
}

} // namespace formulas
} // namespace petc
