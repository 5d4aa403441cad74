/**
 * @file forcing_dataset.cpp
 * @brief Forcing dataset construction and lookup.
 *
 * Validates the dataset shape once at construction. Derived datasets are
 * built through the same constructor so every instance holds the same
 * invariants.
 */

#include "forcing_dataset.hpp"

#include <cctype>
#include <stdexcept>
#include <unordered_set>

namespace petc
{

bool is_valid_variable_name(const std::string& name)
{
    if (name.empty())
    {
        return false;
    }
    for (const char c : name)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_')
        {
            return false;
        }
    }
    return true;
}

ForcingDataset::ForcingDataset(std::vector<std::string> timestamps, std::vector<ForcingVariable> variables)
    : timestamps_(std::move(timestamps)), variables_(std::move(variables))
{
    std::unordered_set<std::string> seen;
    for (const auto& variable : variables_)
    {
        if (!is_valid_variable_name(variable.name))
        {
            throw std::invalid_argument("Invalid forcing variable name: '" + variable.name + "'");
        }
        if (!seen.insert(variable.name).second)
        {
            throw std::invalid_argument("Duplicate forcing variable: " + variable.name);
        }
        if (variable.values.size() != timestamps_.size())
        {
            throw std::invalid_argument("Forcing variable '" + variable.name + "' has " +
                                        std::to_string(variable.values.size()) + " values, expected " +
                                        std::to_string(timestamps_.size()));
        }
    }
}

std::vector<std::string> ForcingDataset::variable_names() const
{
    std::vector<std::string> names;
    names.reserve(variables_.size());
    for (const auto& variable : variables_)
    {
        names.push_back(variable.name);
    }
    return names;
}

bool ForcingDataset::has_variable(const std::string& name) const
{
    return find_series(name) != nullptr;
}

const std::vector<double>& ForcingDataset::series(const std::string& name) const
{
    const std::vector<double>* values = find_series(name);
    if (values == nullptr)
    {
        throw std::out_of_range("Forcing variable not present: " + name);
    }
    return *values;
}

const std::vector<double>* ForcingDataset::find_series(const std::string& name) const
{
    for (const auto& variable : variables_)
    {
        if (variable.name == name)
        {
            return &variable.values;
        }
    }
    return nullptr;
}

ForcingDataset ForcingDataset::with_variable(const std::string& name, std::vector<double> values) const
{
    std::vector<ForcingVariable> variables = variables_;
    bool replaced = false;
    for (auto& variable : variables)
    {
        if (variable.name == name)
        {
            variable.values = std::move(values);
            replaced = true;
            break;
        }
    }
    if (!replaced)
    {
        variables.push_back({name, std::move(values)});
    }
    return ForcingDataset(timestamps_, std::move(variables));
}

ForcingDataset ForcingDataset::without_variable(const std::string& name) const
{
    std::vector<ForcingVariable> variables;
    variables.reserve(variables_.size());
    for (const auto& variable : variables_)
    {
        if (variable.name != name)
        {
            variables.push_back(variable);
        }
    }
    return ForcingDataset(timestamps_, std::move(variables));
}

} // namespace petc
