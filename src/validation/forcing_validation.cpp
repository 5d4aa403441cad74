/**
 * @file forcing_validation.cpp
 * @brief Forcing quality reports for the validation module.
 *
 * Computes per-variable finite statistics, counts non-finite and
 * out-of-bounds samples and serializes the report to JSON.
 * This file is part of the src/validation subsystem.
 */

#include "forcing_validation.hpp"
#include "runtime_log.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace petc {namespace {

/**
 * @brief Returns true when at least one bound limit is active.
 */
bool has_bounds(const VariableBounds& bounds) {
    return bounds.has_min || bounds.has_max;
}

/**
 * @brief Writes a JSON array of strings.
 */
void write_string_array(std::ostringstream& oss, const std::vector<std::string>& values) {
    oss << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << "\"" << strutil::json_escape(values[i]) << "\"";
    }
    oss << "]";
}

}

/**
 * @brief Parses guard mode text into enum representation.
 */
bool parse_guard_mode(const std::string& value, GuardMode& out_mode) {
    const std::string v = strutil::lower_copy(value);
    if (v == "off") {
        out_mode = GuardMode::Off;
        return true;
    }
    if (v == "report" || v == "warn") {
        out_mode = GuardMode::Report;
        return true;
    }
    if (v == "strict") {
        out_mode = GuardMode::Strict;
        return true;
    }
    return false;
}

/**
 * @brief Converts guard mode enum to stable string id.
 */
const char* to_string(GuardMode mode) {
    switch (mode) {
        case GuardMode::Off:
            return "off";
        case GuardMode::Report:
            return "report";
        case GuardMode::Strict:
            return "strict";
        default:
            return "off";
    }
}

/**
 * @brief Resolves effective bounds after applying policy overrides.
 */
VariableBounds effective_bounds(const ForcingContract& contract, const ValidationPolicy& policy) {
    const std::string key = strutil::lower_copy(contract.id);

    auto it = policy.bounds_overrides.find(key);
    if (it != policy.bounds_overrides.end()) {
        return it->second;
    }

    it = policy.bounds_overrides.find(contract.id);
    if (it != policy.bounds_overrides.end()) {
        return it->second;
    }

    return contract.bounds;
}

/**
 * @brief Computes statistics and violations for one forcing series.
 */
VariableValidationReport validate_series(const std::string& name,
                                         const std::vector<double>& values,
                                         const ForcingContract* contract,
                                         const ValidationPolicy& policy) {
    VariableValidationReport out;
    out.variable = name;
    out.known = contract != nullptr;
    if (contract != nullptr) {
        out.units = contract->units;
    }

    VariableStats& stats = out.stats;
    stats.total_count = values.size();

    const VariableBounds bounds = contract ? effective_bounds(*contract, policy) : VariableBounds{};
    const bool bounds_enabled = has_bounds(bounds);

    double finite_sum = 0.0;
    double finite_min = std::numeric_limits<double>::infinity();
    double finite_max = -std::numeric_limits<double>::infinity();

    for (const double value : values) {
        if (!std::isfinite(value)) {
            if (std::isnan(value)) {
                ++stats.nan_count;
            } else {
                ++stats.inf_count;
            }
            continue;
        }

        ++stats.finite_count;
        finite_sum += value;
        finite_min = std::min(finite_min, value);
        finite_max = std::max(finite_max, value);

        if (bounds_enabled) {
            if (bounds.has_min && value < bounds.min_value) {
                ++stats.below_min_count;
            }
            if (bounds.has_max && value > bounds.max_value) {
                ++stats.above_max_count;
            }
        }
    }

    stats.has_finite = stats.finite_count > 0;
    if (stats.has_finite) {
        stats.min_value = finite_min;
        stats.max_value = finite_max;
        stats.mean_value = finite_sum / static_cast<double>(stats.finite_count);
    }

    const std::size_t nonfinite_count = stats.nan_count + stats.inf_count;
    if (nonfinite_count > 0) {
        out.violations.push_back({name, "non_finite", nonfinite_count});
    }

    const std::size_t bounds_count = stats.below_min_count + stats.above_max_count;
    if (bounds_enabled && bounds_count > 0) {
        out.violations.push_back({name, "out_of_bounds", bounds_count});
    }

    return out;
}

/**
 * @brief Validates every variable of a dataset without modifying it.
 */
ValidationReport validate_forcing(const ForcingDataset& dataset, const ValidationPolicy& policy) {
    ValidationReport report;
    report.guard_mode = to_string(policy.mode);
    report.num_timesteps = dataset.num_timesteps();

    for (const auto& core : core_forcing_variables()) {
        if (!dataset.has_variable(core)) {
            report.missing_core.push_back(core);
        }
    }

    if (policy.mode == GuardMode::Off) {
        return report;
    }

    std::size_t violation_count = 0;
    for (const auto& name : dataset.variable_names()) {
        const ForcingContract* contract = find_forcing_contract(name);
        if (contract == nullptr) {
            report.unknown_variables.push_back(name);
        }
        VariableValidationReport entry = validate_series(name, dataset.series(name), contract, policy);
        violation_count += entry.violations.size();
        report.variables.push_back(std::move(entry));
    }

    if (policy.mode == GuardMode::Strict && violation_count > 0) {
        report.failed = true;
    }

    if (violation_count > 0) {
        for (const auto& entry : report.variables) {
            for (const auto& violation : entry.violations) {
                std::cerr << "[FORCING] Warning: " << violation.variable << " has "
                          << violation.count << " " << violation.reason << " sample(s)" << std::endl;
            }
        }
    }
    if (log_debug_enabled()) {
        std::cout << "[FORCING] validated " << report.variables.size() << " variable(s) over "
                  << report.num_timesteps << " timestep(s), mode=" << report.guard_mode << std::endl;
    }

    return report;
}

/**
 * @brief Serializes a validation report to formatted JSON.
 */
std::string validation_report_to_json(const ValidationReport& report) {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"guard_mode\": \"" << strutil::json_escape(report.guard_mode) << "\",\n";
    oss << "  \"num_timesteps\": " << report.num_timesteps << ",\n";
    oss << "  \"failed\": " << (report.failed ? "true" : "false") << ",\n";

    oss << "  \"missing_core\": ";
    write_string_array(oss, report.missing_core);
    oss << ",\n";

    oss << "  \"unknown_variables\": ";
    write_string_array(oss, report.unknown_variables);
    oss << ",\n";

    oss << "  \"variables\": [\n";
    for (std::size_t i = 0; i < report.variables.size(); ++i) {
        const auto& entry = report.variables[i];
        const auto& stats = entry.stats;
        oss << "    {\n";
        oss << "      \"variable\": \"" << strutil::json_escape(entry.variable) << "\",\n";
        oss << "      \"units\": \"" << strutil::json_escape(entry.units) << "\",\n";
        oss << "      \"known\": " << (entry.known ? "true" : "false") << ",\n";
        oss << "      \"stats\": {\n";
        oss << "        \"total_count\": " << stats.total_count << ",\n";
        oss << "        \"finite_count\": " << stats.finite_count << ",\n";
        oss << "        \"nan_count\": " << stats.nan_count << ",\n";
        oss << "        \"inf_count\": " << stats.inf_count << ",\n";
        oss << "        \"below_min_count\": " << stats.below_min_count << ",\n";
        oss << "        \"above_max_count\": " << stats.above_max_count << ",\n";
        oss << "        \"has_finite\": " << (stats.has_finite ? "true" : "false") << ",\n";
        oss << std::fixed << std::setprecision(6);
        oss << "        \"min\": " << stats.min_value << ",\n";
        oss << "        \"max\": " << stats.max_value << ",\n";
        oss << "        \"mean\": " << stats.mean_value << "\n";
        oss << "      },\n";
        oss << "      \"violations\": [";
        for (std::size_t j = 0; j < entry.violations.size(); ++j) {
            if (j > 0) {
                oss << ", ";
            }
            const auto& violation = entry.violations[j];
            oss << "{\"reason\":\"" << strutil::json_escape(violation.reason)
                << "\",\"count\":" << violation.count << "}";
        }
        oss << "]\n";
        oss << "    }";
        if (i + 1 < report.variables.size()) {
            oss << ",";
        }
        oss << "\n";
    }
    oss << "  ]\n";
    oss << "}\n";
    return oss.str();
}

}
