/**
 * @file penman_monteith.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the Penman-Monteith combination formulas.
 * This file is part of the src/formulas subsystem.
 */

#include "penman_monteith.hpp"

#include <algorithm>

#include "formulas/base/meteorology.hpp"
#include "formulas/base/scheme_support.hpp"

namespace petc
{
namespace formulas
{
namespace
{

ComputationResult compute_penman_monteith(const FormulaInputs& in, const FormulaParameters& params)
{
    const double min_wind_speed = params.get("min_wind_speed");
    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        result.total[i] = penman_monteith_fao56(in.at("temperature", i),
                                                in.at("relative_humidity", i),
                                                in.at("wind_speed", i),
                                                in.at("net_radiation", i),
                                                in.at("pressure", i),
                                                in.at("soil_heat_flux", i),
                                                min_wind_speed);
    }
    return result;
}

ComputationResult compute_penman_monteith_general(const FormulaInputs& in, const FormulaParameters& params)
{
    using namespace meteorology;
    const double rs = params.get("surface_resistance");
    const double ra_coefficient = params.get("aerodynamic_coefficient");

    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        const double t = in.at("temperature", i);
        const double rh = in.at("relative_humidity", i);
        const double p = in.at("pressure", i);
        const double available = in.at("net_radiation", i) - in.at("soil_heat_flux", i);

        const double delta = svp_slope(t);
        const double gamma = psychrometric_constant(p);
        const double vpd = vapor_pressure_deficit(t, rh);
        const double ra = checked_ratio(ra_coefficient, in.at("wind_speed", i), "aerodynamic resistance");
        const double rho = air_density(t, p, rh);

        const double numerator =
            delta * available + rho * physical_constants::specific_heat_air_jkgk * vpd / ra / 1000.0;
        const double denominator =
            physical_constants::latent_heat_vaporization_mjkg * (delta + gamma * (1.0 + rs / ra));
        result.total[i] = non_negative(numerator / denominator);
    }
    return result;
}

} // namespace

double penman_monteith_fao56(double temperature_c,
                             double relative_humidity_pct,
                             double wind_speed_ms,
                             double net_radiation,
                             double pressure_kpa,
                             double soil_heat_flux,
                             double min_wind_speed)
{
    using namespace meteorology;
    const double delta = svp_slope(temperature_c);
    const double gamma = psychrometric_constant(pressure_kpa);
    const double vpd = vapor_pressure_deficit(temperature_c, relative_humidity_pct);
    const double wind_safe = std::max(wind_speed_ms, min_wind_speed);

    const double numerator = physical_constants::mj_to_mm_water * delta * (net_radiation - soil_heat_flux) +
                             gamma * (900.0 / (temperature_c + 273.0)) * wind_speed_ms * vpd;
    const double denominator = delta + gamma * (1.0 + 0.34 * wind_safe);
    return non_negative(numerator / denominator);
}

FormulaSpec penman_monteith_spec()
{
    FormulaSpec spec;
    spec.name = "penman_monteith";
    spec.family = FormulaFamily::Combination;
    spec.description = "FAO-56 Penman-Monteith grass reference evapotranspiration";
    spec.required_inputs = {"temperature", "relative_humidity", "wind_speed", "net_radiation"};
    spec.optional_inputs = surface_energy_optionals();
    spec.parameters = {
        {"min_wind_speed", 0.5, "Lower wind speed bound in the aerodynamic term [m s-1]"},
    };
    spec.function = compute_penman_monteith;
    return spec;
}

FormulaSpec penman_monteith_general_spec()
{
    FormulaSpec spec;
    spec.name = "penman_monteith_general";
    spec.family = FormulaFamily::Combination;
    spec.description = "General Penman-Monteith with explicit surface resistance";
    spec.required_inputs = {"temperature", "relative_humidity", "wind_speed", "net_radiation"};
    spec.optional_inputs = surface_energy_optionals();
    spec.parameters = {
        {"surface_resistance", 70.0, "Bulk surface resistance [s m-1]"},
        {"aerodynamic_coefficient", physical_constants::grass_aerodynamic_coefficient,
         "ra = coefficient / wind_speed [s m-1]"},
    };
    spec.function = compute_penman_monteith_general;
    return spec;
}

} // namespace formulas
} // namespace petc
