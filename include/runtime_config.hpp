#pragma once

#include <string>
#include <unordered_map>

#include "execution_engine.hpp"
#include "forcing_validation.hpp"
#include "formula_registry.hpp"
#include "runtime_log.hpp"

/**
 * @file runtime_config.hpp
 * @brief Comparison run configuration and parsing helpers.
 *
 * Configuration files are simple indented `key: value` documents flattened
 * to dotted keys. Invalid values print a warning and keep the default.
 * Per-formula option overrides are only collected here; unknown options
 * are rejected later, when the registry is built.
 */

namespace petc
{

struct ComparisonConfig
{
    LogProfile log_profile = LogProfile::normal;
    ExecutionOptions execution{};
    double partition_tolerance = 0.01;
    ValidationPolicy validation{};
    std::string output_directory = "comparison_output";
    FormulaOptionsMap formula_options;
};

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a non-negative integer value.
 * @return True on successful parse and non-negative result.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Emits the standard warning for an invalid configuration value.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected);

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Parsed key-value map with dotted section keys.
 * @throws std::runtime_error when the file cannot be opened.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Applies flattened keys onto a configuration.
 */
void apply_config_values(const std::unordered_map<std::string, std::string>& values,
                         ComparisonConfig& config);

/**
 * @brief Loads a comparison configuration from disk.
 *
 * The log profile starts from PETC_LOG_PROFILE when set; a `logging.profile`
 * key in the file takes precedence.
 * @param config_path Path to configuration file; empty keeps defaults.
 */
ComparisonConfig load_comparison_config(const std::string& config_path);

/**
 * @brief Prints the effective configuration at normal log level.
 */
void print_comparison_config(const ComparisonConfig& config);

} // namespace petc
