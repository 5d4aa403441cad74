#pragma once

#include <string>
#include <vector>

#include "capability_resolver.hpp"
#include "forcing_dataset.hpp"
#include "formula_registry.hpp"
#include "results_table.hpp"

/**
 * @file execution_engine.hpp
 * @brief Batch and single-formula execution over a forcing dataset.
 *
 * run_all() never aborts because of one formula: capability gaps become
 * `skipped` statuses and exceptions become `failed` statuses. run_one()
 * is the direct path and lets every problem propagate.
 *
 * Formulas may be evaluated with OpenMP when ExecutionOptions::parallel is
 * set. Every formula writes into its own pre-sized slot and the slots are
 * merged in registration order, so both modes produce identical tables.
 */

namespace petc
{

enum class StatusKind
{
    Skipped,
    Failed,
};

struct FormulaStatus
{
    std::string formula;
    StatusKind kind = StatusKind::Skipped;
    std::string reason;
};

struct RunOutcome
{
    ResultsTable results;
    std::vector<FormulaStatus> skipped;
    std::vector<FormulaStatus> failed;

    /**
     * @brief Returns skipped statuses followed by failed ones.
     */
    std::vector<FormulaStatus> statuses() const;
};

struct ExecutionOptions
{
    bool parallel = false;
    int num_threads = 0;  // 0 keeps the OpenMP default
};

class ExecutionEngine
{
public:
    explicit ExecutionEngine(const FormulaRegistry& registry, ExecutionOptions options = ExecutionOptions{});
    // The engine keeps a reference; temporaries would dangle.
    ExecutionEngine(FormulaRegistry&&, ExecutionOptions = ExecutionOptions{}) = delete;

    /**
     * @brief Runs every runnable formula, isolating failures.
     */
    RunOutcome run_all(const ForcingDataset& dataset) const;

    /**
     * @brief Runs one formula and propagates any problem.
     * @throws UnknownFormulaError, CapabilityError, ExecutionFailure
     */
    ComputationResult run_one(const std::string& name, const ForcingDataset& dataset) const;

    const ExecutionOptions& options() const { return options_; }

private:
    ComputationResult invoke(const FormulaSpec& spec, const ForcingDataset& dataset) const;

    const FormulaRegistry& registry_;
    ExecutionOptions options_;
    CapabilityResolver resolver_;
};

const char* to_string(StatusKind kind);

} // namespace petc
