/**
 * @file component_partitioner.cpp
 * @brief Component extraction and component-sum consistency checks.
 */

#include "component_partitioner.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "runtime_log.hpp"

namespace petc
{

ComponentPartitioner::ComponentPartitioner(const FormulaRegistry& registry, double relative_tolerance)
    : registry_(registry), tolerance_(relative_tolerance)
{
}

std::vector<NamedSeries> ComponentPartitioner::partition(const ComputationResult& result) const
{
    const FormulaSpec* spec = registry_.find(result.formula);
    if (spec == nullptr || !spec->supports_partition || !result.has_components())
    {
        return {};
    }
    return result.components;
}

PartitionCheck ComponentPartitioner::check_consistency(const ComputationResult& result) const
{
    PartitionCheck check;
    const FormulaSpec* spec = registry_.find(result.formula);
    if (spec == nullptr || !spec->supports_partition || !result.has_components())
    {
        return check;
    }

    for (std::size_t t = 0; t < result.total.size(); ++t)
    {
        const double total = result.total[t];
        if (!std::isfinite(total))
        {
            continue;
        }

        double component_sum = 0.0;
        bool finite = true;
        for (const auto& component : result.components)
        {
            const double value = component.values[t];
            if (!std::isfinite(value))
            {
                finite = false;
                break;
            }
            component_sum += value;
        }
        if (!finite)
        {
            continue;
        }

        ++check.checked_count;
        const double difference = std::abs(total - component_sum);
        // A zero total has no relative scale; compare the absolute difference.
        const double error = total == 0.0 ? difference : difference / std::abs(total);
        if (error > check.max_relative_error)
        {
            check.max_relative_error = error;
        }
        if (error > tolerance_)
        {
            ++check.mismatch_count;
        }
    }

    return check;
}

std::vector<FormulaComponents> ComponentPartitioner::apply(ResultsTable& table) const
{
    std::vector<FormulaComponents> breakdowns;
    std::size_t mismatched = 0;

    for (auto& entry : table.entries())
    {
        std::vector<NamedSeries> components = partition(entry);
        if (components.empty())
        {
            continue;
        }

        const PartitionCheck check = check_consistency(entry);
        if (!check.consistent())
        {
            const std::string warning = partition_mismatch_warning(check, tolerance_);
            std::cerr << "[PARTITION] Warning: " << entry.formula << ": " << warning << std::endl;
            entry.warnings.push_back(warning);
            ++mismatched;
        }
        breakdowns.push_back({entry.formula, std::move(components)});
    }

    if (log_normal_enabled())
    {
        std::cout << "[PARTITION] " << breakdowns.size() << " partitioned formula(s), "
                  << mismatched << " with component-sum mismatch" << std::endl;
    }
    return breakdowns;
}

std::string partition_mismatch_warning(const PartitionCheck& check, double tolerance)
{
    std::ostringstream oss;
    oss << "PartitionMismatch: components differ from total at " << check.mismatch_count << " of "
        << check.checked_count << " timestep(s) (max relative error " << std::setprecision(4)
        << check.max_relative_error << ", tolerance " << tolerance << ")";
    return oss.str();
}

} // namespace petc
