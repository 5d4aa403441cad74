/**
 * @file execution_engine.cpp
 * @brief Batch and single-formula execution.
 *
 * The batch path resolves capabilities first, then evaluates runnable
 * formulas into per-formula slots, optionally in an OpenMP parallel loop.
 * Slots are merged in registration order after the loop completes.
 */

#include "execution_engine.hpp"

#include <exception>
#include <iostream>
#include <optional>

#include "comparison_errors.hpp"
#include "runtime_log.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace petc
{
namespace
{

struct ExecutionSlot
{
    std::optional<ComputationResult> result;
    std::string error;
};

/**
 * @brief Rejects results whose series do not match the timestamp axis.
 */
void check_result_shape(const FormulaSpec& spec, const ComputationResult& result, std::size_t num_timesteps)
{
    const auto mismatch = [&](const std::string& what, std::size_t size)
    {
        return ExecutionFailure(spec.name, what + " has " + std::to_string(size) + " values, expected " +
                                               std::to_string(num_timesteps));
    };

    if (result.total.size() != num_timesteps)
    {
        throw mismatch("total", result.total.size());
    }
    for (const auto& component : result.components)
    {
        if (component.values.size() != num_timesteps)
        {
            throw mismatch("component '" + component.name + "'", component.values.size());
        }
    }
    for (const auto& diagnostic : result.diagnostics)
    {
        if (diagnostic.values.size() != num_timesteps)
        {
            throw mismatch("diagnostic '" + diagnostic.name + "'", diagnostic.values.size());
        }
    }
}

} // namespace

std::vector<FormulaStatus> RunOutcome::statuses() const
{
    std::vector<FormulaStatus> out;
    out.reserve(skipped.size() + failed.size());
    out.insert(out.end(), skipped.begin(), skipped.end());
    out.insert(out.end(), failed.begin(), failed.end());
    return out;
}

const char* to_string(StatusKind kind)
{
    switch (kind)
    {
        case StatusKind::Skipped:
            return "skipped";
        case StatusKind::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

ExecutionEngine::ExecutionEngine(const FormulaRegistry& registry, ExecutionOptions options)
    : registry_(registry), options_(options)
{
}

ComputationResult ExecutionEngine::invoke(const FormulaSpec& spec, const ForcingDataset& dataset) const
{
    const FormulaInputs inputs = resolver_.assemble_inputs(dataset, spec);
    ComputationResult result = spec.function(inputs, spec.resolved_parameters());
    result.formula = spec.name;
    check_result_shape(spec, result, dataset.num_timesteps());
    return result;
}

RunOutcome ExecutionEngine::run_all(const ForcingDataset& dataset) const
{
    RunOutcome outcome{ResultsTable(dataset.timestamps()), {}, {}};

    const std::vector<CapabilityDecision> decisions = resolver_.resolve(dataset, registry_.all_specs());
    std::vector<const FormulaSpec*> runnable;
    for (const auto& decision : decisions)
    {
        if (decision.runnable)
        {
            runnable.push_back(decision.spec);
        }
    }

    std::vector<ExecutionSlot> slots(runnable.size());
    const long long count = static_cast<long long>(runnable.size());

#ifdef _OPENMP
    const int threads = options_.num_threads > 0 ? options_.num_threads : omp_get_max_threads();
#else
    const int threads = 1;
#endif

    #pragma omp parallel for schedule(dynamic, 1) num_threads(threads) if(options_.parallel && count > 1)
    for (long long i = 0; i < count; ++i)
    {
        ExecutionSlot& slot = slots[static_cast<std::size_t>(i)];
        try
        {
            slot.result = invoke(*runnable[static_cast<std::size_t>(i)], dataset);
        }
        catch (const ExecutionFailure& e)
        {
            slot.error = e.detail();
        }
        catch (const std::exception& e)
        {
            slot.error = e.what();
        }
        catch (...)
        {
            slot.error = "non-standard exception";
        }
    }

    // Merge in registration order; skips and failures keep that order too.
    std::size_t slot_index = 0;
    for (const auto& decision : decisions)
    {
        const FormulaSpec& spec = *decision.spec;
        if (!decision.runnable)
        {
            outcome.skipped.push_back({spec.name, StatusKind::Skipped, decision.reason()});
            continue;
        }

        ExecutionSlot& slot = slots[slot_index++];
        if (slot.result.has_value())
        {
            outcome.results.add(std::move(*slot.result));
        }
        else
        {
            std::cerr << "[ENGINE] Warning: " << spec.name << " failed: " << slot.error << std::endl;
            outcome.failed.push_back({spec.name, StatusKind::Failed, slot.error});
        }
    }

    if (log_normal_enabled())
    {
        std::cout << "[ENGINE] " << outcome.results.size() << " formula(s) computed, "
                  << outcome.skipped.size() << " skipped, " << outcome.failed.size() << " failed"
                  << (options_.parallel ? " (parallel, " + std::to_string(threads) + " thread(s))" : "")
                  << std::endl;
    }
    if (log_debug_enabled())
    {
        for (const auto& status : outcome.skipped)
        {
            std::cout << "[ENGINE] skipped " << status.formula << ": " << status.reason << std::endl;
        }
    }

    return outcome;
}

ComputationResult ExecutionEngine::run_one(const std::string& name, const ForcingDataset& dataset) const
{
    const FormulaSpec* spec = registry_.find(name);
    if (spec == nullptr)
    {
        throw UnknownFormulaError(name);
    }

    const CapabilityDecision decision = resolver_.decide(dataset, *spec);
    if (!decision.runnable)
    {
        throw CapabilityError(name, decision.reason());
    }

    try
    {
        return invoke(*spec, dataset);
    }
    catch (const ExecutionFailure&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw ExecutionFailure(name, e.what());
    }
}

} // namespace petc
