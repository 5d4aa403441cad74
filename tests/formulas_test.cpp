#include "execution_engine.hpp"
#include "formulas/base/meteorology.hpp"
#include "formulas/factory.hpp"
#include "formulas/schemes/penman_monteith/penman_monteith.hpp"
#include "formulas/schemes/pt_jpl/pt_jpl.hpp"
#include "formulas/schemes/temperature/temperature.hpp"
#include "physical_constants.hpp"
#include "runtime_log.hpp"
#include "test_fixtures.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[formulas] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[formulas] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

const double kNaN = std::numeric_limits<double>::quiet_NaN();

petc::ForcingDataset one_day(std::vector<petc::ForcingVariable> variables)
{
    return petc::ForcingDataset({"2020-07-01"}, std::move(variables));
}

double total_of(const std::string& formula, const petc::ForcingDataset& data)
{
    const petc::ExecutionEngine engine(petc::default_formula_registry());
    return engine.run_one(formula, data).total.front();
}

int test_meteorology()
{
    int failures = 0;
    using namespace petc::meteorology;

    // FAO-56 tabulated values at 20 degC and sea level.
    failures += expect_close(saturation_vapor_pressure(20.0), 2.338, "es(20)", 1.0e-3);
    failures += expect_close(svp_slope(20.0), 0.1447, "delta(20)", 1.0e-4);
    failures += expect_close(psychrometric_constant(101.3), 0.0674, "gamma(101.3)", 1.0e-4);
    failures += expect_close(vapor_pressure_deficit(20.0, 100.0), 0.0, "saturated air has no deficit");
    failures += expect_close(air_density(20.0, 101.3, 0.0), 101300.0 / (287.05 * 293.15), "dry air density", 1.0e-9);

    // FAO-56 example 8: 20 degS on 3 September.
    failures += expect_close(extraterrestrial_radiation(246.0, -20.0), 32.2, "Ra example 8", 0.1);
    failures += expect_true(extraterrestrial_radiation(172.0, 80.0) > 0.0, "polar day has radiation");
    failures += expect_close(extraterrestrial_radiation(355.0, 80.0), 0.0, "polar night has none", 1.0e-9);

    failures += expect_close(daylight_fraction(186.0, 0.0), 1.0, "equatorial day is close to 12 h", 0.05);
    failures += expect_close(daylight_fraction(172.0, 85.0), 2.0, "polar day is 24 h");
    failures += expect_close(daylight_fraction(355.0, 85.0), 0.0, "polar night is 0 h");

    failures += expect_close(co2_response_factor(380.0, 380.0, Co2Response::Sqrt), 1.0, "reference CO2 factor");
    failures += expect_close(co2_response_factor(760.0, 380.0, Co2Response::Sqrt), std::sqrt(0.5), "sqrt response");
    failures += expect_close(co2_response_factor(760.0, 380.0, Co2Response::Linear), 0.7, "linear response");
    failures += expect_close(co2_response_factor(3000.0, 380.0, Co2Response::Linear), 0.5, "linear floor");
    failures += expect_close(co2_response_factor(760.0, 380.0, Co2Response::Log), 1.0 - 0.15 * std::log(2.0),
                             "log response");
    failures += expect_true(co2_response_from_parameter(2.0) == Co2Response::Log, "selector 2 is log");

    bool domain = false;
    try
    {
        (void)co2_response_factor(0.0, 380.0, Co2Response::Sqrt);
    }
    catch (const std::domain_error&)
    {
        domain = true;
    }
    failures += expect_true(domain, "non-positive CO2 is a domain error");
    failures += expect_true(std::isnan(co2_response_factor(std::numeric_limits<double>::quiet_NaN(), 380.0,
                                                           Co2Response::Sqrt)),
                            "missing CO2 gives a missing factor");

    bool invalid = false;
    try
    {
        (void)co2_response_from_parameter(3.0);
    }
    catch (const std::invalid_argument&)
    {
        invalid = true;
    }
    failures += expect_true(invalid, "unknown response selector is rejected");

    bool zero = false;
    try
    {
        (void)checked_ratio(1.0, 0.0, "test");
    }
    catch (const std::domain_error& e)
    {
        zero = std::string(e.what()) == "division by zero in test";
    }
    failures += expect_true(zero, "guarded ratio names the failing term");
    return failures;
}

int test_combination_formulas()
{
    int failures = 0;
    using namespace petc::meteorology;

    const double pm = petc::formulas::penman_monteith_fao56(20.0, 60.0, 2.5, 15.0, 101.3, 0.0, 0.5);
    const double delta = svp_slope(20.0);
    const double gamma = psychrometric_constant(101.3);
    const double vpd = vapor_pressure_deficit(20.0, 60.0);
    const double expected = (0.408 * delta * 15.0 + gamma * (900.0 / 293.0) * 2.5 * vpd) /
                            (delta + gamma * (1.0 + 0.34 * 2.5));
    failures += expect_close(pm, expected, "FAO-56 Penman-Monteith");
    failures += expect_close(pm, 5.08, "FAO-56 Penman-Monteith magnitude", 0.02);

    const double calm = petc::formulas::penman_monteith_fao56(20.0, 60.0, 0.0, 15.0, 101.3, 0.0, 0.5);
    failures += expect_close(calm, 0.408 * delta * 15.0 / (delta + gamma * (1.0 + 0.34 * 0.5)),
                             "calm air keeps the radiation term and bounds the denominator");
    failures += expect_close(petc::formulas::penman_monteith_fao56(5.0, 95.0, 2.0, -8.0, 101.3, 0.0, 0.5), 0.0,
                             "negative energy clamps to zero");

    const petc::ForcingDataset base = one_day({
        {"temperature", {20.0}},
        {"relative_humidity", {60.0}},
        {"wind_speed", {2.5}},
        {"net_radiation", {15.0}},
    });
    failures += expect_close(total_of("penman_monteith", base), pm, "catalog penman_monteith matches the helper");

    const double general = total_of("penman_monteith_general", base);
    const double ra = 208.0 / 2.5;
    const double rho = air_density(20.0, 101.3, 60.0);
    failures += expect_close(general,
                             (delta * 15.0 + rho * 1013.0 * vpd / ra / 1000.0) /
                                 (2.45 * (delta + gamma * (1.0 + 70.0 / ra))),
                             "general Penman-Monteith with rs = 70");

    // Higher CO2 closes stomata and lowers the combination estimate.
    const double co2_low = total_of("pm_co2", base.with_variable("co2", {380.0}));
    const double co2_high = total_of("pm_co2", base.with_variable("co2", {760.0}));
    failures += expect_true(co2_high < co2_low, "pm_co2 decreases with CO2");

    const double rs_ref = 70.0;
    failures += expect_close(co2_low,
                             (delta * 15.0 + physical_constants::air_heat_capacity_term * vpd / ra) /
                                 (2.45 * (delta + gamma * (1.0 + rs_ref / ra))),
                             "pm_co2 at the reference concentration uses the reference resistance", 1.0e-9);
    return failures;
}

int test_radiation_and_vegetation_formulas()
{
    int failures = 0;
    using namespace petc::meteorology;

    const petc::ForcingDataset base = one_day({
        {"temperature", {25.0}},
        {"relative_humidity", {50.0}},
        {"wind_speed", {2.0}},
        {"net_radiation", {16.0}},
        {"soil_heat_flux", {1.0}},
        {"pressure", {95.0}},
    });
    const double eq = equilibrium_evaporation(25.0, 95.0, 15.0);

    failures += expect_close(total_of("priestley_taylor", base), 1.26 * eq, "Priestley-Taylor is alpha times eq");
    failures += expect_close(total_of("priestley_taylor_advection", base.with_variable("vpd", {2.0})),
                             1.26 * eq * 1.2, "advection factor 1 + 0.1 vpd");

    const petc::ForcingDataset vegetated = base.with_variable("lai", {4.0});
    const double f_green = 1.0 - std::exp(-2.0);
    failures += expect_close(petc::formulas::green_fraction_from_lai(4.0), f_green, "green fraction");
    failures += expect_close(total_of("pt_jpl", vegetated), 1.26 * eq * f_green * (0.2 / 0.7),
                             "pt_jpl uses the soil moisture default of 0.5", 1.0e-12);
    failures += expect_close(total_of("pt_jpl", vegetated.with_variable("soil_moisture", {0.2})), 0.0,
                             "dry soil stops PT-JPL");
    failures += expect_close(petc::formulas::soil_moisture_constraint(1.5, 0.3), 1.0, "constraint is clamped");

    const petc::ExecutionEngine engine(petc::default_formula_registry());
    const petc::ComputationResult partition =
        engine.run_one("pt_jpl_partition", vegetated.with_variable("soil_moisture", {0.65}));
    double component_sum = 0.0;
    for (const auto& component : partition.components)
    {
        failures += expect_true(component.values[0] >= 0.0, component.name + " is non-negative");
        component_sum += component.values[0];
    }
    failures += expect_close(partition.total[0], component_sum, "PT-JPL components sum to total", 1.0e-12);
    const double transpiration = partition.find_component("transpiration")->values[0];
    failures += expect_close(transpiration, 1.26 * svp_slope(25.0) / (svp_slope(25.0) + psychrometric_constant(95.0)) *
                                                16.0 * f_green / 2.45 * 0.5,
                             "PT-JPL transpiration", 1.0e-12);

    const petc::ComputationResult pml = engine.run_one("pml", vegetated);
    failures += expect_true(pml.components.size() == 2, "pml has transpiration and evaporation");
    failures += expect_close(pml.total[0], pml.components[0].values[0] + pml.components[1].values[0],
                             "pml components sum to total", 1.0e-12);

    const petc::ComputationResult wet = engine.run_one("pml_v2", vegetated.with_variable("soil_moisture", {1.0}));
    const petc::ComputationResult dry = engine.run_one("pml_v2", vegetated.with_variable("soil_moisture", {0.3}));
    failures += expect_close(wet.total[0], pml.total[0], "saturated soil leaves pml_v2 unstressed", 1.0e-12);
    failures += expect_close(dry.find_component("transpiration")->values[0], 0.0,
                             "pml_v2 transpiration stops at the critical soil moisture");
    failures += expect_close(dry.find_component("evaporation")->values[0],
                             pml.find_component("evaporation")->values[0] * std::sqrt(0.3),
                             "pml_v2 evaporation scales with sqrt of soil moisture", 1.0e-12);

    const petc::ComputationResult co2_lai =
        engine.run_one("pm_co2_lai", vegetated.with_variable("co2", {500.0}));
    failures += expect_close(co2_lai.total[0],
                             co2_lai.components[0].values[0] + co2_lai.components[1].values[0],
                             "pm_co2_lai components sum to total", 1.0e-12);
    return failures;
}

int test_complementary_formulas()
{
    int failures = 0;
    using namespace petc::meteorology;

    const petc::ForcingDataset base = one_day({
        {"temperature", {22.0}},
        {"relative_humidity", {40.0}},
        {"wind_speed", {3.0}},
        {"net_radiation", {14.0}},
    });
    const petc::ExecutionEngine engine(petc::default_formula_registry());
    const double delta = svp_slope(22.0);
    const double gamma = psychrometric_constant(101.3);
    const double vpd = vapor_pressure_deficit(22.0, 40.0);
    const double eq = equilibrium_evaporation(22.0, 101.3, 14.0);

    const petc::ComputationResult bouchet = engine.run_one("cr_bouchet", base);
    failures += expect_close(bouchet.total[0], 1.26 * eq, "Bouchet potential", 1.0e-12);
    failures += expect_true(bouchet.diagnostics.size() == 2 && bouchet.diagnostics[0].name == "wet_environment",
                            "Bouchet diagnostics");
    failures += expect_close(bouchet.diagnostics[1].values[0], eq + gamma / (delta + gamma) * vpd * 6.43,
                             "apparent potential adds drying power", 1.0e-12);
    failures += expect_true(!bouchet.has_components(), "diagnostics are not components");

    const petc::ComputationResult aa = engine.run_one("cr_advection_aridity", base);
    const double ra = 208.0 / 3.0;
    failures += expect_close(aa.total[0], eq + gamma / (delta + gamma) * (1.01 * 1013.0 * vpd / ra / 2.45),
                             "advection-aridity potential", 1.0e-9);
    failures += expect_close(aa.diagnostics[1].values[0], vpd / (saturation_vapor_pressure(22.0) + 1.0e-6),
                             "aridity index", 1.0e-12);

    const petc::ComputationResult nonlinear = engine.run_one("cr_nonlinear", base);
    const double relative = std::sqrt(1.0 - 0.6 * 0.6);
    failures += expect_close(nonlinear.diagnostics[2].values[0], relative, "relative evaporation", 1.0e-12);
    failures += expect_close(nonlinear.total[0], 1.26 * eq * (2.0 - relative), "complementary potential", 1.0e-12);
    const double saturated = total_of("cr_nonlinear", base.with_variable("relative_humidity", {100.0}));
    failures += expect_close(saturated, 1.26 * eq, "saturated air gives the wet surface rate", 1.0e-12);

    failures += expect_close(total_of("cr_granger_gray", base), eq / (1.0 + vpd / 0.07), "Granger-Gray", 1.0e-12);
    failures += expect_close(total_of("cr_granger_gray", base.with_variable("relative_humidity", {100.0})), eq,
                             "no deficit gives equilibrium evaporation", 1.0e-12);
    return failures;
}

int test_temperature_formulas()
{
    int failures = 0;
    using petc::formulas::hamon_pet;
    using petc::formulas::hargreaves_pet;

    failures += expect_close(hamon_pet(0.0, 40.0, 180.0), 0.0, "Hamon is zero at freezing");
    failures += expect_close(hamon_pet(-5.0, 40.0, 180.0), 0.0, "Hamon is zero below freezing");
    failures += expect_true(std::isnan(hamon_pet(kNaN, 40.0, 180.0)), "Hamon propagates missing temperature");
    const double summer = hamon_pet(25.0, 40.0, 180.0);
    failures += expect_true(summer > 2.0 && summer < 8.0, "Hamon summer PET is a few mm per day");
    failures += expect_true(hamon_pet(15.0, 40.0, 180.0) < summer, "Hamon grows with temperature");
    failures += expect_true(hamon_pet(25.0, 40.0, 355.0) < summer, "Hamon grows with day length");

    const double ra = petc::meteorology::extraterrestrial_radiation(180.0, 40.0);
    const double hg = hargreaves_pet(22.0, 30.0, 14.0, 40.0, 180.0, 0.0023);
    failures += expect_close(hg, 0.0023 * 0.408 * ra * 4.0 * 39.8, "Hargreaves", 1.0e-12);
    failures += expect_true(std::isnan(hargreaves_pet(22.0, 10.0, 14.0, 40.0, 180.0, 0.0023)),
                            "Hargreaves is NaN when tmax < tmin");

    const petc::ForcingDataset data = petc::ForcingDataset({"d1", "d2"},
                                                           {
                                                               {"temperature", {22.0, 22.0}},
                                                               {"temperature_max", {30.0, 10.0}},
                                                               {"temperature_min", {14.0, 14.0}},
                                                               {"latitude", {40.0, 40.0}},
                                                               {"doy", {180.0, 180.0}},
                                                           });
    const petc::ExecutionEngine engine(petc::default_formula_registry());
    const petc::ComputationResult result = engine.run_one("hargreaves", data);
    failures += expect_close(result.total[0], hg, "catalog Hargreaves", 1.0e-12);
    failures += expect_true(std::isnan(result.total[1]), "inverted temperature range stays NaN in the table");
    failures += expect_close(engine.run_one("hamon", data).total[0], hamon_pet(22.0, 40.0, 180.0), "catalog Hamon");

    const petc::FormulaRegistry scaled = petc::build_formula_registry({{"hamon", {{"coefficient", 1.2}}}});
    failures += expect_close(petc::ExecutionEngine(scaled).run_one("hamon", data).total[0],
                             1.2 * hamon_pet(22.0, 40.0, 180.0), "Hamon coefficient option", 1.0e-12);
    return failures;
}

} // namespace

int main()
{
    petc::set_log_profile(petc::LogProfile::quiet);

    int failures = 0;
    failures += test_meteorology();
    failures += test_combination_formulas();
    failures += test_radiation_and_vegetation_formulas();
    failures += test_complementary_formulas();
    failures += test_temperature_formulas();

    if (failures > 0)
    {
        std::cerr << "[formulas] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[formulas] all checks passed" << std::endl;
    return 0;
}
