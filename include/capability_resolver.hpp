#pragma once

#include <string>
#include <vector>

#include "forcing_dataset.hpp"
#include "formula_base.hpp"

/**
 * @file capability_resolver.hpp
 * @brief Decides which formulas can run against a dataset.
 *
 * Resolution is a pure set-membership test: a formula is runnable when
 * every required input is a dataset variable. Nothing is executed and no
 * required input is ever defaulted. Optional inputs fall back to their
 * declared defaults when assembling the argument set.
 */

namespace petc
{

struct CapabilityDecision
{
    const FormulaSpec* spec = nullptr;
    bool runnable = false;
    std::vector<std::string> missing_inputs;  // declaration order

    /**
     * @brief Returns the skip reason, e.g. "missing: lai, co2".
     */
    std::string reason() const;
};

class CapabilityResolver
{
public:
    /**
     * @brief Returns the runnable subset, order preserved.
     */
    std::vector<const FormulaSpec*> runnable(const ForcingDataset& dataset,
                                             const std::vector<FormulaSpec>& specs) const;

    /**
     * @brief Returns one decision per spec, order preserved.
     */
    std::vector<CapabilityDecision> resolve(const ForcingDataset& dataset,
                                            const std::vector<FormulaSpec>& specs) const;

    /**
     * @brief Decides a single spec.
     */
    CapabilityDecision decide(const ForcingDataset& dataset, const FormulaSpec& spec) const;

    /**
     * @brief Builds the complete argument set for a runnable spec.
     * @throws CapabilityError when a required input is absent.
     */
    FormulaInputs assemble_inputs(const ForcingDataset& dataset, const FormulaSpec& spec) const;
};

} // namespace petc
