/**
 * @file results_table.cpp
 * @brief Results table bookkeeping.
 */

#include "results_table.hpp"

#include <stdexcept>

namespace petc
{

void ResultsTable::add(ComputationResult result)
{
    if (contains(result.formula))
    {
        throw std::invalid_argument("Duplicate result for formula: " + result.formula);
    }
    if (result.total.size() != timestamps_.size())
    {
        throw std::invalid_argument("Result '" + result.formula + "' has " + std::to_string(result.total.size()) +
                                    " values, expected " + std::to_string(timestamps_.size()));
    }
    entries_.push_back(std::move(result));
}

const ComputationResult* ResultsTable::find(const std::string& formula) const
{
    for (const auto& entry : entries_)
    {
        if (entry.formula == formula)
        {
            return &entry;
        }
    }
    return nullptr;
}

ComputationResult* ResultsTable::find(const std::string& formula)
{
    for (auto& entry : entries_)
    {
        if (entry.formula == formula)
        {
            return &entry;
        }
    }
    return nullptr;
}

std::vector<std::string> ResultsTable::formula_names() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_)
    {
        names.push_back(entry.formula);
    }
    return names;
}

} // namespace petc
