/**
 * @file comparison.cpp
 * @brief Comparison pipeline orchestration.
 *
 * Validates forcing, runs the catalog, partitions components and
 * computes statistics. The CO2 sweep reuses the same engine over derived
 * datasets.
 */

#include "comparison.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "forcing_io.hpp"
#include "runtime_log.hpp"
#include "string_utils.hpp"

namespace petc
{

ComparisonReport run_comparison(const ForcingDataset& dataset,
                                const FormulaRegistry& registry,
                                const ComparisonConfig& config)
{
    ComparisonReport report;

    report.validation = validate_forcing(dataset, config.validation);
    if (!report.validation.missing_core.empty() && log_normal_enabled())
    {
        std::cout << "[FORCING] core variable(s) absent: "
                  << strutil::join(report.validation.missing_core, ", ") << std::endl;
    }
    if (report.validation.failed)
    {
        throw std::runtime_error("Strict forcing validation failed; no formula was run");
    }

    const ExecutionEngine engine(registry, config.execution);
    report.outcome = engine.run_all(dataset);

    const ComponentPartitioner partitioner(registry, config.partition_tolerance);
    report.components = partitioner.apply(report.outcome.results);

    const StatisticsEngine statistics;
    report.statistics = statistics.compute(report.outcome.results);
    return report;
}

std::vector<ScenarioResult> run_co2_sensitivity(const ForcingDataset& dataset,
                                                const FormulaRegistry& registry,
                                                const std::vector<double>& scenarios_ppm,
                                                const ComparisonConfig& config)
{
    const ExecutionEngine engine(registry, config.execution);
    std::vector<ScenarioResult> scenarios;
    scenarios.reserve(scenarios_ppm.size());

    for (const double co2 : scenarios_ppm)
    {
        const ForcingDataset scenario_data =
            dataset.with_variable("co2", std::vector<double>(dataset.num_timesteps(), co2));
        const RunOutcome outcome = engine.run_all(scenario_data);

        ScenarioResult scenario;
        scenario.co2_ppm = co2;
        for (const auto& entry : outcome.results.entries())
        {
            scenario.means.push_back({entry.formula, summarize_series(entry.formula, entry.total).mean});
        }
        scenario.failed = outcome.failed;

        if (log_normal_enabled())
        {
            std::cout << "[ENGINE] CO2 scenario " << co2 << " ppm: " << scenario.means.size()
                      << " formula(s)" << std::endl;
        }
        scenarios.push_back(std::move(scenario));
    }
    return scenarios;
}

std::vector<FormulaMean> co2_sensitivity_per_100ppm(const std::vector<ScenarioResult>& scenarios)
{
    std::vector<FormulaMean> out;
    if (scenarios.empty())
    {
        return out;
    }

    const ScenarioResult* low = &scenarios.front();
    const ScenarioResult* high = &scenarios.front();
    for (const auto& scenario : scenarios)
    {
        if (scenario.co2_ppm < low->co2_ppm) low = &scenario;
        if (scenario.co2_ppm > high->co2_ppm) high = &scenario;
    }
    const double range = high->co2_ppm - low->co2_ppm;
    if (range <= 0.0)
    {
        return out;
    }

    for (const auto& high_mean : high->means)
    {
        for (const auto& low_mean : low->means)
        {
            if (low_mean.formula == high_mean.formula)
            {
                out.push_back({high_mean.formula, (high_mean.mean_total - low_mean.mean_total) / range * 100.0});
                break;
            }
        }
    }
    return out;
}

void write_comparison_outputs(const ComparisonReport& report, const std::string& directory)
{
    const std::filesystem::path root(directory);
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec)
    {
        throw std::runtime_error("failed to create output directory '" + root.string() + "': " + ec.message());
    }

    write_results_csv(report.outcome.results, (root / "results.csv").string());
    write_components_csv(report.outcome.results, report.components, (root / "components.csv").string());
    write_statistics_json(report.statistics, report.outcome, (root / "statistics.json").string());

    if (log_normal_enabled())
    {
        std::cout << "[ENGINE] outputs written to " << root.string() << std::endl;
    }
}

} // namespace petc
