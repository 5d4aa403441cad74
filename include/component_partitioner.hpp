#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "formula_registry.hpp"
#include "results_table.hpp"

/**
 * @file component_partitioner.hpp
 * @brief Sub-flux breakdowns and the component-sum consistency check.
 *
 * Partitioning is opportunistic: formulas without partition support, or
 * results without component series, yield an empty mapping. The sum check
 * only reports; a mismatch becomes a warning on the result entry.
 */

namespace petc
{

inline constexpr double kDefaultPartitionTolerance = 0.01;

struct PartitionCheck
{
    std::size_t checked_count = 0;
    std::size_t mismatch_count = 0;
    double max_relative_error = 0.0;

    bool consistent() const { return mismatch_count == 0; }
};

struct FormulaComponents
{
    std::string formula;
    std::vector<NamedSeries> components;
};

class ComponentPartitioner
{
public:
    explicit ComponentPartitioner(const FormulaRegistry& registry,
                                  double relative_tolerance = kDefaultPartitionTolerance);
    ComponentPartitioner(FormulaRegistry&&, double = kDefaultPartitionTolerance) = delete;

    /**
     * @brief Returns the component series of a partitioned result, else empty.
     */
    std::vector<NamedSeries> partition(const ComputationResult& result) const;

    /**
     * @brief Compares total against the sum of components per timestep.
     *
     * Timesteps with any non-finite value are not checked. A zero total
     * is compared with an absolute tolerance instead of a relative one.
     */
    PartitionCheck check_consistency(const ComputationResult& result) const;

    /**
     * @brief Attaches mismatch warnings and collects component breakdowns.
     * @return Components of every partitioned entry, in table order.
     */
    std::vector<FormulaComponents> apply(ResultsTable& table) const;

    double tolerance() const { return tolerance_; }

private:
    const FormulaRegistry& registry_;
    double tolerance_;
};

/**
 * @brief Formats the warning text attached on a mismatch.
 */
std::string partition_mismatch_warning(const PartitionCheck& check, double tolerance);

} // namespace petc
