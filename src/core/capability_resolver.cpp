/**
 * @file capability_resolver.cpp
 * @brief Capability decisions and argument assembly.
 */

#include "capability_resolver.hpp"

#include <iostream>

#include "comparison_errors.hpp"
#include "runtime_log.hpp"
#include "string_utils.hpp"

namespace petc
{

std::string CapabilityDecision::reason() const
{
    if (runnable)
    {
        return std::string();
    }
    return "missing: " + strutil::join(missing_inputs, ", ");
}

CapabilityDecision CapabilityResolver::decide(const ForcingDataset& dataset, const FormulaSpec& spec) const
{
    CapabilityDecision decision;
    decision.spec = &spec;
    for (const auto& input : spec.required_inputs)
    {
        if (!dataset.has_variable(input))
        {
            decision.missing_inputs.push_back(input);
        }
    }
    decision.runnable = decision.missing_inputs.empty();
    return decision;
}

std::vector<CapabilityDecision> CapabilityResolver::resolve(const ForcingDataset& dataset,
                                                            const std::vector<FormulaSpec>& specs) const
{
    std::vector<CapabilityDecision> decisions;
    decisions.reserve(specs.size());
    for (const auto& spec : specs)
    {
        decisions.push_back(decide(dataset, spec));
        if (log_debug_enabled() && !decisions.back().runnable)
        {
            std::cout << "[CAPABILITY] " << spec.name << " not runnable, "
                      << decisions.back().reason() << std::endl;
        }
    }
    return decisions;
}

std::vector<const FormulaSpec*> CapabilityResolver::runnable(const ForcingDataset& dataset,
                                                             const std::vector<FormulaSpec>& specs) const
{
    std::vector<const FormulaSpec*> out;
    for (const auto& spec : specs)
    {
        if (decide(dataset, spec).runnable)
        {
            out.push_back(&spec);
        }
    }
    return out;
}

FormulaInputs CapabilityResolver::assemble_inputs(const ForcingDataset& dataset, const FormulaSpec& spec) const
{
    const CapabilityDecision decision = decide(dataset, spec);
    if (!decision.runnable)
    {
        throw CapabilityError(spec.name, decision.reason());
    }

    FormulaInputs inputs(dataset.num_timesteps());
    for (const auto& input : spec.required_inputs)
    {
        inputs.bind_series(input, dataset.find_series(input));
    }
    for (const auto& optional : spec.optional_inputs)
    {
        const std::vector<double>* series = dataset.find_series(optional.name);
        if (series != nullptr)
        {
            inputs.bind_series(optional.name, series);
        }
        else
        {
            inputs.bind_scalar(optional.name, optional.default_value);
        }
    }
    return inputs;
}

} // namespace petc
