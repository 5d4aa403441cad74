#pragma once

#include <string>
#include <vector>

#include "component_partitioner.hpp"
#include "execution_engine.hpp"
#include "forcing_dataset.hpp"
#include "statistics_engine.hpp"

/**
 * @file forcing_io.hpp
 * @brief CSV forcing input and comparison output writers.
 */

namespace petc
{

/**
 * @brief Loads a forcing dataset from a CSV file.
 *
 * The first column holds timestamps (`timestamp`, `date` or `time`); the
 * remaining columns are numeric and are renamed to canonical variable ids
 * through the contract aliases. Empty cells and nan/NA spellings load as
 * NaN.
 *
 * @throws std::runtime_error with path and line on malformed input.
 */
ForcingDataset load_forcing_csv(const std::string& path);

/**
 * @brief Parses CSV text already in memory.
 * @param source Label used in error messages.
 */
ForcingDataset parse_forcing_csv(const std::string& text, const std::string& source);

/**
 * @brief Writes timestamp-keyed total columns.
 */
void write_results_csv(const ResultsTable& table, const std::string& path);

/**
 * @brief Writes one row per timestep with `formula.component` columns.
 */
void write_components_csv(const ResultsTable& table,
                          const std::vector<FormulaComponents>& components,
                          const std::string& path);

/**
 * @brief Serializes statistics, statuses and warnings to JSON text.
 */
std::string statistics_to_json(const StatisticsArtifacts& statistics, const RunOutcome& outcome);

void write_statistics_json(const StatisticsArtifacts& statistics,
                           const RunOutcome& outcome,
                           const std::string& path);

} // namespace petc
