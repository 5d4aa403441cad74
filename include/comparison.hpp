#pragma once

#include <string>
#include <vector>

#include "component_partitioner.hpp"
#include "execution_engine.hpp"
#include "forcing_validation.hpp"
#include "runtime_config.hpp"
#include "statistics_engine.hpp"

/**
 * @file comparison.hpp
 * @brief End-to-end comparison pipeline.
 *
 * run_comparison() chains forcing validation, capability resolution,
 * execution, partitioning and statistics in that order.
 */

namespace petc
{

struct ComparisonReport
{
    ValidationReport validation;
    RunOutcome outcome;
    std::vector<FormulaComponents> components;
    StatisticsArtifacts statistics;
};

struct FormulaMean
{
    std::string formula;
    double mean_total = 0.0;
};

struct ScenarioResult
{
    double co2_ppm = 0.0;
    std::vector<FormulaMean> means;  // registration order
    std::vector<FormulaStatus> failed;
};

/**
 * @brief Runs the whole comparison over one dataset.
 * @throws std::runtime_error when strict forcing validation fails.
 */
ComparisonReport run_comparison(const ForcingDataset& dataset,
                                const FormulaRegistry& registry,
                                const ComparisonConfig& config);

/**
 * @brief Re-runs the catalog with a constant `co2` series per scenario.
 * @return One result per scenario, input order preserved.
 */
std::vector<ScenarioResult> run_co2_sensitivity(const ForcingDataset& dataset,
                                                const FormulaRegistry& registry,
                                                const std::vector<double>& scenarios_ppm,
                                                const ComparisonConfig& config);

/**
 * @brief Change in mean total per 100 ppm between the lowest and highest scenario.
 *
 * Only formulas present in both end scenarios are listed. Fewer than two
 * distinct CO2 levels yield an empty list.
 */
std::vector<FormulaMean> co2_sensitivity_per_100ppm(const std::vector<ScenarioResult>& scenarios);

/**
 * @brief Writes results, components and statistics files into a directory.
 * @throws std::runtime_error on I/O failure.
 */
void write_comparison_outputs(const ComparisonReport& report, const std::string& directory);

} // namespace petc
