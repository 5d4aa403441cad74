#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

/**
 * @file forcing_dataset.hpp
 * @brief Immutable, time-indexed table of named forcing variables.
 *
 * A dataset is an ordered timestamp axis plus one numeric series per
 * variable, every series exactly as long as the axis. It is validated once
 * at construction and never modified afterwards, so formulas can read it
 * concurrently without locking. Missing observations are stored as NaN.
 */

namespace petc
{

struct ForcingVariable
{
    std::string name;
    std::vector<double> values;
};

class ForcingDataset
{
public:
    ForcingDataset() = default;

    /**
     * @brief Builds a dataset and checks its structural invariants.
     * @param timestamps Ordered time labels, one per row.
     * @param variables Named series in column order.
     * @throws std::invalid_argument on length mismatch, duplicate or malformed names.
     */
    ForcingDataset(std::vector<std::string> timestamps, std::vector<ForcingVariable> variables);

    std::size_t num_timesteps() const { return timestamps_.size(); }
    std::size_t num_variables() const { return variables_.size(); }
    bool empty() const { return timestamps_.empty(); }

    const std::vector<std::string>& timestamps() const { return timestamps_; }

    /**
     * @brief Returns variable names in column order.
     */
    std::vector<std::string> variable_names() const;

    bool has_variable(const std::string& name) const;

    /**
     * @brief Returns the series for a variable.
     * @throws std::out_of_range when the variable is absent.
     */
    const std::vector<double>& series(const std::string& name) const;

    /**
     * @brief Returns a pointer to the series, or null when absent.
     */
    const std::vector<double>* find_series(const std::string& name) const;

    /**
     * @brief Returns a new dataset with one variable added or replaced.
     */
    ForcingDataset with_variable(const std::string& name, std::vector<double> values) const;

    /**
     * @brief Returns a new dataset without the named variable.
     */
    ForcingDataset without_variable(const std::string& name) const;

private:
    std::vector<std::string> timestamps_;
    std::vector<ForcingVariable> variables_;
};

/**
 * @brief Checks the identifier rule used for variable names.
 * @return True for non-empty names made of letters, digits and underscores.
 */
bool is_valid_variable_name(const std::string& name);

} // namespace petc
