/**
 * @file runtime_config.cpp
 * @brief Comparison configuration loading.
 *
 * Reads flattened YAML-like keys into a ComparisonConfig. Invalid values
 * keep the previous value and print a warning; the run proceeds.
 */

#include "runtime_config.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include "forcing_contract.hpp"
#include "string_utils.hpp"

namespace petc
{
namespace
{

const char* const kFormulaPrefix = "formula.";
const char* const kBoundsPrefix = "validation.bounds.";

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Splits `formula.<name>.<option>` into its parts.
 */
bool parse_formula_option_key(const std::string& key, std::string& formula_out, std::string& option_out)
{
    const std::string prefix = kFormulaPrefix;
    if (key.rfind(prefix, 0) != 0)
    {
        return false;
    }

    const std::string tail = key.substr(prefix.size());
    const std::size_t dot = tail.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= tail.size())
    {
        return false;
    }

    formula_out = tail.substr(0, dot);
    option_out = tail.substr(dot + 1);
    return true;
}

/**
 * @brief Parses bounds override keys of form `validation.bounds.<variable>.(min|max)`.
 */
bool parse_bounds_key(const std::string& key, std::string& variable_out, bool& is_min_out)
{
    const std::string prefix = kBoundsPrefix;
    if (key.rfind(prefix, 0) != 0)
    {
        return false;
    }

    const std::string tail = key.substr(prefix.size());
    const std::size_t dot = tail.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= tail.size())
    {
        return false;
    }

    variable_out = tail.substr(0, dot);
    const std::string bound_key = tail.substr(dot + 1);
    if (bound_key == "min")
    {
        is_min_out = true;
        return true;
    }
    if (bound_key == "max")
    {
        is_min_out = false;
        return true;
    }

    return false;
}

} // namespace

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a non-negative integer value.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed < 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    std::cerr << "Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping previous/default value." << std::endl;
}

/**
 * @brief Parses a YAML file.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::unordered_map<std::string, std::string> config;
    std::ifstream file(filename);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open config file: " + filename);
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;

        const size_t indent_level = indent / 2;

        line = strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            std::string section_name = line.substr(0, line.size() - 1);

            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }
            section_stack.push_back(section_name);
            continue;
        }

        size_t colon_pos = line.find(':');

        if (colon_pos != std::string::npos)
        {
            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            const std::string key = strutil::trim_copy(line.substr(0, colon_pos));
            const std::string value = strip_wrapping_quotes(strutil::trim_copy(line.substr(colon_pos + 1)));

            std::string full_key;
            for (const auto& section : section_stack)
            {
                if (!full_key.empty()) full_key += ".";
                full_key += section;
            }
            if (!full_key.empty()) full_key += ".";
            full_key += key;
            config[full_key] = value;
        }
    }

    return config;
}

void apply_config_values(const std::unordered_map<std::string, std::string>& values, ComparisonConfig& config)
{
    const auto lookup = [&values](const std::string& key) -> const std::string*
    {
        const auto it = values.find(key);
        return it == values.end() ? nullptr : &it->second;
    };

    if (const std::string* value = lookup("logging.profile"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(*value, &valid);
        if (valid)
        {
            config.log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid logging.profile '" << *value
                      << "'. Valid values: quiet, normal, debug. Using normal." << std::endl;
            config.log_profile = LogProfile::normal;
        }
    }

    if (const std::string* value = lookup("engine.parallel"))
    {
        config.execution.parallel = strutil::parse_bool(*value);
    }
    if (const std::string* value = lookup("engine.threads"))
    {
        int parsed = 0;
        if (try_parse_non_negative_int_value(*value, parsed))
        {
            config.execution.num_threads = parsed;
        }
        else
        {
            warn_invalid_config_value("engine.threads", *value, "a non-negative integer");
        }
    }

    if (const std::string* value = lookup("partition.tolerance"))
    {
        double parsed = 0.0;
        if (try_parse_double_value(*value, parsed) && parsed >= 0.0)
        {
            config.partition_tolerance = parsed;
        }
        else
        {
            warn_invalid_config_value("partition.tolerance", *value, "a non-negative number");
        }
    }

    if (const std::string* value = lookup("validation.mode"))
    {
        GuardMode mode = config.validation.mode;
        if (parse_guard_mode(*value, mode))
        {
            config.validation.mode = mode;
        }
        else
        {
            std::cerr << "Warning: Invalid validation.mode '" << *value
                      << "'. Valid values: off, report, strict." << std::endl;
        }
    }

    if (const std::string* value = lookup("output.directory"))
    {
        if (!value->empty())
        {
            config.output_directory = *value;
        }
        else
        {
            warn_invalid_config_value("output.directory", *value, "a non-empty path");
        }
    }

    for (const auto& [key, value] : values)
    {
        std::string variable;
        bool is_min = false;
        if (parse_bounds_key(key, variable, is_min))
        {
            const ForcingContract* contract = find_forcing_contract(variable);
            if (contract == nullptr)
            {
                std::cerr << "Warning: Ignoring bounds override for unknown forcing variable '"
                          << variable << "'." << std::endl;
                continue;
            }
            double parsed = 0.0;
            if (!try_parse_double_value(value, parsed))
            {
                warn_invalid_config_value(key, value, "a finite number");
                continue;
            }
            auto it = config.validation.bounds_overrides.find(contract->id);
            if (it == config.validation.bounds_overrides.end())
            {
                it = config.validation.bounds_overrides.emplace(contract->id, contract->bounds).first;
            }
            if (is_min)
            {
                it->second.has_min = true;
                it->second.min_value = parsed;
            }
            else
            {
                it->second.has_max = true;
                it->second.max_value = parsed;
            }
            continue;
        }

        std::string formula;
        std::string option;
        if (parse_formula_option_key(key, formula, option))
        {
            double parsed = 0.0;
            if (try_parse_double_value(value, parsed))
            {
                config.formula_options[formula][option] = parsed;
            }
            else
            {
                warn_invalid_config_value(key, value, "a finite number");
            }
        }
    }
}

/**
 * @brief Loads the configuration from a YAML file.
 */
ComparisonConfig load_comparison_config(const std::string& config_path)
{
    // PETC_LOG_PROFILE sets the starting profile; logging.profile in the file overrides it.
    apply_log_profile_from_environment();
    ComparisonConfig config;
    config.log_profile = global_log_profile;
    if (config_path.empty())
    {
        return config;
    }

    const auto values = parse_yaml_simple(config_path);
    apply_config_values(values, config);
    set_log_profile(config.log_profile);

    if (log_normal_enabled())
    {
        std::cout << "[CONFIG] Loaded " << config_path << " with " << values.size() << " keys" << std::endl;
    }
    print_comparison_config(config);
    return config;
}

void print_comparison_config(const ComparisonConfig& config)
{
    if (!log_normal_enabled())
    {
        return;
    }

    std::cout << "[CONFIG] Comparison configuration:" << std::endl;
    std::cout << "  Logging profile: " << log_profile_name(config.log_profile) << std::endl;
    std::cout << "  Parallel execution: " << (config.execution.parallel ? "on" : "off");
    if (config.execution.parallel)
    {
        std::cout << " (threads: ";
        if (config.execution.num_threads > 0)
        {
            std::cout << config.execution.num_threads;
        }
        else
        {
            std::cout << "default";
        }
        std::cout << ")";
    }
    std::cout << std::endl;
    std::cout << "  Partition tolerance: " << config.partition_tolerance << std::endl;
    std::cout << "  Validation mode: " << to_string(config.validation.mode) << std::endl;
    std::cout << "  Output directory: " << config.output_directory << std::endl;
    for (const auto& [formula, options] : config.formula_options)
    {
        for (const auto& [option, value] : options)
        {
            std::cout << "  Formula option: " << formula << "." << option << " = " << value << std::endl;
        }
    }
}

} // namespace petc
