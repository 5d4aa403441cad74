/**
 * @file complementary.cpp
 * @brief Implementation for the formulas module.
 *
 * Provides the complementary relationship formulas.
 * This file is part of the src/formulas subsystem.
 */

#include "complementary.hpp"

#include <cmath>

#include "formulas/base/meteorology.hpp"
#include "formulas/base/scheme_support.hpp"

namespace petc
{
namespace formulas
{
namespace
{

struct WetSurfaceTerms
{
    double delta = 0.0;
    double gamma = 0.0;
    double vpd = 0.0;
    double equilibrium = 0.0;
};

WetSurfaceTerms wet_surface_at(const FormulaInputs& in, std::size_t i)
{
    using namespace meteorology;
    const double t = in.at("temperature", i);
    WetSurfaceTerms terms;
    terms.delta = svp_slope(t);
    terms.gamma = psychrometric_constant(in.at("pressure", i));
    terms.vpd = vapor_pressure_deficit(t, in.at("relative_humidity", i));
    terms.equilibrium = terms.delta / (terms.delta + terms.gamma) *
                        (in.at("net_radiation", i) - in.at("soil_heat_flux", i)) /
                        physical_constants::latent_heat_vaporization_mjkg;
    return terms;
}

ComputationResult compute_cr_bouchet(const FormulaInputs& in, const FormulaParameters& params)
{
    const double alpha = params.get("alpha");
    const double drying_coefficient = params.get("drying_power_coefficient");

    ComputationResult result = make_result(in);
    const std::size_t n = in.num_timesteps();
    const std::size_t wet = add_series(result.diagnostics, "wet_environment", n);
    const std::size_t apparent = add_series(result.diagnostics, "apparent_potential", n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const WetSurfaceTerms s = wet_surface_at(in, i);
        const double drying_power = s.gamma / (s.delta + s.gamma) * s.vpd * drying_coefficient;
        result.diagnostics[wet].values[i] = non_negative(s.equilibrium);
        result.diagnostics[apparent].values[i] = non_negative(s.equilibrium + drying_power);
        result.total[i] = non_negative(alpha * s.equilibrium);
    }
    return result;
}

ComputationResult compute_cr_advection_aridity(const FormulaInputs& in, const FormulaParameters&)
{
    ComputationResult result = make_result(in);
    const std::size_t n = in.num_timesteps();
    const std::size_t equilibrium = add_series(result.diagnostics, "equilibrium", n);
    const std::size_t aridity = add_series(result.diagnostics, "aridity_index", n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const WetSurfaceTerms s = wet_surface_at(in, i);
        const double ra = meteorology::checked_ratio(physical_constants::grass_aerodynamic_coefficient,
                                                     in.at("wind_speed", i), "aerodynamic resistance");
        const double aerodynamic = physical_constants::air_heat_capacity_term * s.vpd / ra /
                                   physical_constants::latent_heat_vaporization_mjkg;
        const double es = meteorology::saturation_vapor_pressure(in.at("temperature", i));

        result.diagnostics[equilibrium].values[i] = non_negative(s.equilibrium);
        result.diagnostics[aridity].values[i] = s.vpd / (es + 1e-6);
        result.total[i] = non_negative(s.equilibrium + s.gamma / (s.delta + s.gamma) * aerodynamic);
    }
    return result;
}

ComputationResult compute_cr_nonlinear(const FormulaInputs& in, const FormulaParameters& params)
{
    const double alpha = params.get("alpha");
    const double b = params.get("nonlinearity");
    const double inverse_b = meteorology::checked_ratio(1.0, b, "complementary nonlinearity");

    ComputationResult result = make_result(in);
    const std::size_t n = in.num_timesteps();
    const std::size_t wet = add_series(result.diagnostics, "wet_surface", n);
    const std::size_t actual = add_series(result.diagnostics, "actual", n);
    const std::size_t relative = add_series(result.diagnostics, "relative_evaporation", n);

    for (std::size_t i = 0; i < n; ++i)
    {
        const WetSurfaceTerms s = wet_surface_at(in, i);
        const double wet_surface = alpha * s.equilibrium;
        const double dryness = 1.0 - in.at("relative_humidity", i) / 100.0;
        const double relative_et = std::pow(1.0 - std::pow(dryness, b), inverse_b);
        const double actual_et = wet_surface * relative_et;

        result.diagnostics[wet].values[i] = non_negative(wet_surface);
        result.diagnostics[actual].values[i] = non_negative(actual_et);
        result.diagnostics[relative].values[i] = relative_et;
        result.total[i] = non_negative(2.0 * wet_surface - actual_et);
    }
    return result;
}

ComputationResult compute_cr_granger_gray(const FormulaInputs& in, const FormulaParameters& params)
{
    const double g_parameter = params.get("g_parameter");
    ComputationResult result = make_result(in);
    for (std::size_t i = 0; i < in.num_timesteps(); ++i)
    {
        const WetSurfaceTerms s = wet_surface_at(in, i);
        const double relative_et =
            s.vpd > 0.0 ? 1.0 / (1.0 + meteorology::checked_ratio(s.vpd, g_parameter, "Granger-Gray G")) : 1.0;
        result.total[i] = non_negative(relative_et * s.equilibrium);
    }
    return result;
}

FormulaSpec complementary_spec(const char* name, const char* description)
{
    FormulaSpec spec;
    spec.name = name;
    spec.family = FormulaFamily::ComplementaryRelationship;
    spec.description = description;
    spec.required_inputs = {"temperature", "relative_humidity", "net_radiation"};
    spec.optional_inputs = surface_energy_optionals();
    return spec;
}

} // namespace

FormulaSpec cr_bouchet_spec()
{
    FormulaSpec spec = complementary_spec("cr_bouchet", "Bouchet complementary relationship potential evaporation");
    spec.parameters = {
        {"alpha", physical_constants::priestley_taylor_alpha, "Potential to wet-environment ratio"},
        {"drying_power_coefficient", 6.43, "Drying power scaling of VPD"},
    };
    spec.function = compute_cr_bouchet;
    return spec;
}

FormulaSpec cr_advection_aridity_spec()
{
    FormulaSpec spec =
        complementary_spec("cr_advection_aridity", "Brutsaert-Stricker advection-aridity potential evaporation");
    spec.required_inputs = {"temperature", "relative_humidity", "wind_speed", "net_radiation"};
    spec.function = compute_cr_advection_aridity;
    return spec;
}

FormulaSpec cr_nonlinear_spec()
{
    FormulaSpec spec = complementary_spec("cr_nonlinear", "Nonlinear complementary relationship potential");
    spec.parameters = {
        {"alpha", physical_constants::priestley_taylor_alpha, "Wet surface Priestley-Taylor coefficient"},
        {"nonlinearity", 2.0, "Exponent of the relative evaporation curve"},
    };
    spec.function = compute_cr_nonlinear;
    return spec;
}

FormulaSpec cr_granger_gray_spec()
{
    FormulaSpec spec = complementary_spec("cr_granger_gray", "Granger-Gray relative evaporation");
    spec.parameters = {
        {"g_parameter", 0.07, "Relative evaporation VPD scale [kPa]"},
    };
    spec.function = compute_cr_granger_gray;
    return spec;
}

} // namespace formulas
} // namespace petc
