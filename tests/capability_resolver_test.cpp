#include "capability_resolver.hpp"
#include "comparison_errors.hpp"
#include "formulas/factory.hpp"
#include "runtime_log.hpp"
#include "test_fixtures.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[capability-resolver] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

const petc::CapabilityDecision* find_decision(const std::vector<petc::CapabilityDecision>& decisions,
                                              const std::string& name)
{
    for (const auto& decision : decisions)
    {
        if (decision.spec->name == name)
        {
            return &decision;
        }
    }
    return nullptr;
}

int test_core_dataset_decisions()
{
    int failures = 0;
    const petc::FormulaRegistry& registry = petc::default_formula_registry();
    const petc::CapabilityResolver resolver{};
    const petc::ForcingDataset data = petc_test::core_dataset();

    const auto decisions = resolver.resolve(data, registry.all_specs());
    failures += expect_true(decisions.size() == registry.size(), "one decision per spec");
    for (std::size_t i = 0; i < decisions.size(); ++i)
    {
        failures += expect_true(decisions[i].spec == &registry.all_specs()[i], "decisions keep registration order");
    }

    const auto* pt_jpl = find_decision(decisions, "pt_jpl");
    failures += expect_true(pt_jpl && !pt_jpl->runnable && pt_jpl->reason() == "missing: lai",
                            "pt_jpl is skipped for missing lai");
    const auto* pm_co2 = find_decision(decisions, "pm_co2");
    failures += expect_true(pm_co2 && pm_co2->reason() == "missing: co2", "pm_co2 is skipped for missing co2");
    const auto* pm_co2_lai = find_decision(decisions, "pm_co2_lai");
    failures += expect_true(pm_co2_lai && pm_co2_lai->reason() == "missing: co2, lai",
                            "missing inputs are listed in declaration order");
    const auto* hargreaves = find_decision(decisions, "hargreaves");
    failures += expect_true(hargreaves && hargreaves->missing_inputs.size() == 4,
                            "hargreaves lacks tmax, tmin, latitude and doy");

    // Optional inputs never block a formula.
    const auto* pm = find_decision(decisions, "penman_monteith");
    failures += expect_true(pm && pm->runnable && pm->missing_inputs.empty(),
                            "penman_monteith runs without pressure or soil heat flux");

    const std::vector<std::string> expected = {
        "penman_monteith", "penman_monteith_general", "priestley_taylor", "cr_bouchet",
        "cr_advection_aridity", "cr_nonlinear", "cr_granger_gray",
    };
    std::vector<std::string> runnable;
    for (const auto* spec : resolver.runnable(data, registry.all_specs()))
    {
        runnable.push_back(spec->name);
    }
    failures += expect_true(runnable == expected, "runnable subset for the core dataset");
    return failures;
}

int test_input_assembly()
{
    int failures = 0;
    const petc::FormulaRegistry& registry = petc::default_formula_registry();
    const petc::CapabilityResolver resolver{};
    const petc::ForcingDataset data = petc_test::core_dataset();

    const petc::FormulaInputs inputs = resolver.assemble_inputs(data, *registry.find("penman_monteith"));
    failures += expect_true(inputs.num_timesteps() == 3, "inputs span the dataset axis");
    failures += expect_true(inputs.is_series("temperature"), "required inputs come from the dataset");
    failures += expect_true(inputs.contains("pressure") && !inputs.is_series("pressure"),
                            "absent optional inputs fall back to scalars");
    failures += expect_true(inputs.at("pressure", 2) == 101.3, "pressure default is broadcast");
    failures += expect_true(inputs.at("soil_heat_flux", 0) == 0.0, "soil heat flux default is zero");
    failures += expect_true(inputs.at("temperature", 1) == 22.0, "series values are read through");
    failures += expect_true(inputs.expanded("pressure").size() == 3, "scalar expands to the full axis");

    const petc::ForcingDataset with_pressure = data.with_variable("pressure", {95.0, 96.0, 97.0});
    const petc::FormulaInputs measured = resolver.assemble_inputs(with_pressure, *registry.find("penman_monteith"));
    failures += expect_true(measured.is_series("pressure") && measured.at("pressure", 1) == 96.0,
                            "present optional inputs are used as series");

    const petc::FormulaInputs jpl_inputs =
        resolver.assemble_inputs(data.with_variable("lai", {1.0, 2.0, 3.0}), *registry.find("pt_jpl"));
    failures += expect_true(jpl_inputs.at("soil_moisture", 0) == 0.5, "pt_jpl soil moisture default");

    bool threw = false;
    try
    {
        (void)resolver.assemble_inputs(data, *registry.find("pml"));
    }
    catch (const petc::CapabilityError& e)
    {
        threw = std::string(e.what()).find("missing: lai") != std::string::npos;
    }
    failures += expect_true(threw, "assembling a non-runnable spec raises CapabilityError");
    return failures;
}

} // namespace

int main()
{
    petc::set_log_profile(petc::LogProfile::quiet);

    int failures = 0;
    failures += test_core_dataset_decisions();
    failures += test_input_assembly();

    if (failures > 0)
    {
        std::cerr << "[capability-resolver] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[capability-resolver] all checks passed" << std::endl;
    return 0;
}
