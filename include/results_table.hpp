#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "formula_base.hpp"

/**
 * @file results_table.hpp
 * @brief Per-run table of formula results on a shared timestamp axis.
 *
 * Entries appear in formula registration order. A formula that was skipped
 * or failed is simply absent; there are no placeholder columns.
 */

namespace petc
{

class ResultsTable
{
public:
    ResultsTable() = default;
    explicit ResultsTable(std::vector<std::string> timestamps) : timestamps_(std::move(timestamps)) {}

    const std::vector<std::string>& timestamps() const { return timestamps_; }
    std::size_t num_timesteps() const { return timestamps_.size(); }

    /**
     * @brief Appends a result.
     * @throws std::invalid_argument on duplicate name or series length mismatch.
     */
    void add(ComputationResult result);

    const std::vector<ComputationResult>& entries() const { return entries_; }
    std::vector<ComputationResult>& entries() { return entries_; }

    const ComputationResult* find(const std::string& formula) const;
    ComputationResult* find(const std::string& formula);
    bool contains(const std::string& formula) const { return find(formula) != nullptr; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<std::string> formula_names() const;

private:
    std::vector<std::string> timestamps_;
    std::vector<ComputationResult> entries_;
};

} // namespace petc
