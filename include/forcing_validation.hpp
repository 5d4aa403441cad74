#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "forcing_contract.hpp"
#include "forcing_dataset.hpp"

/**
 * @file forcing_validation.hpp
 * @brief Quality reporting over forcing datasets.
 *
 * Counts non-finite and out-of-bounds samples per variable against the
 * forcing contracts. Validation never modifies the dataset; formulas own
 * their physical validity checks. Strict mode marks a report failed so the
 * caller can refuse to run.
 */

namespace petc
{

enum class GuardMode
{
    Off,
    Report,
    Strict,
};

struct ValidationPolicy
{
    GuardMode mode = GuardMode::Report;
    std::unordered_map<std::string, VariableBounds> bounds_overrides;
};

struct VariableStats
{
    std::size_t total_count = 0;
    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    std::size_t below_min_count = 0;
    std::size_t above_max_count = 0;
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
    bool has_finite = false;
};

struct VariableViolation
{
    std::string variable;
    std::string reason;
    std::size_t count = 0;
};

struct VariableValidationReport
{
    std::string variable;
    std::string units;
    bool known = false;
    VariableStats stats;
    std::vector<VariableViolation> violations;
};

struct ValidationReport
{
    std::string guard_mode;
    std::size_t num_timesteps = 0;
    bool failed = false;
    std::vector<VariableValidationReport> variables;
    std::vector<std::string> unknown_variables;
    std::vector<std::string> missing_core;
};

/**
 * @brief Parses guard mode from text.
 */
bool parse_guard_mode(const std::string& value, GuardMode& out_mode);

/**
 * @brief Converts guard mode to text.
 */
const char* to_string(GuardMode mode);

/**
 * @brief Resolves bounds for a contract including policy overrides.
 */
VariableBounds effective_bounds(const ForcingContract& contract, const ValidationPolicy& policy);

/**
 * @brief Computes statistics and violations for one series.
 */
VariableValidationReport validate_series(const std::string& name,
                                         const std::vector<double>& values,
                                         const ForcingContract* contract,
                                         const ValidationPolicy& policy);

/**
 * @brief Validates every variable of a dataset.
 */
ValidationReport validate_forcing(const ForcingDataset& dataset, const ValidationPolicy& policy);

/**
 * @brief Serializes a validation report to JSON.
 */
std::string validation_report_to_json(const ValidationReport& report);

} // namespace petc
