#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file formula_base.hpp
 * @brief Base structures shared by the registry, resolver and engine.
 *
 * A formula is described by a FormulaSpec: its name, algorithm family,
 * required and optional inputs, recognized configuration parameters, a
 * typed callable and its partition capability. The callable receives a
 * complete FormulaInputs view over the forcing data plus the resolved
 * parameter values, and returns a ComputationResult.
 */

namespace petc
{

enum class FormulaFamily
{
    TemperatureBased,
    RadiationBased,
    Combination,
    Co2Aware,
    VegetationAware,
    ComplementaryRelationship,
};

struct NamedSeries
{
    std::string name;
    std::vector<double> values;
};

// Per-formula output; components sum to total when partitioning applies.
struct ComputationResult
{
    std::string formula;
    std::vector<double> total;
    std::vector<NamedSeries> components;
    std::vector<NamedSeries> diagnostics;
    std::vector<std::string> warnings;

    bool has_components() const { return !components.empty(); }
    const NamedSeries* find_component(const std::string& name) const;
};

struct OptionalInput
{
    std::string name;
    double default_value = 0.0;
};

struct FormulaParameter
{
    std::string name;
    double value = 0.0;
    std::string description;
};

/**
 * @brief Resolved configuration values for one formula.
 */
class FormulaParameters
{
public:
    FormulaParameters() = default;
    explicit FormulaParameters(std::vector<FormulaParameter> values) : values_(std::move(values)) {}

    /**
     * @brief Returns the value of a declared parameter.
     * @throws std::out_of_range when the parameter was never declared.
     */
    double get(const std::string& name) const;

    bool contains(const std::string& name) const;
    const std::vector<FormulaParameter>& values() const { return values_; }

private:
    std::vector<FormulaParameter> values_;
};

/**
 * @brief Complete, read-only argument set for one formula invocation.
 *
 * Each input is either a series borrowed from the forcing dataset or a
 * scalar default broadcast over every timestep. The view never copies
 * dataset series and never outlives the dataset it was assembled from.
 */
class FormulaInputs
{
public:
    explicit FormulaInputs(std::size_t num_timesteps) : num_timesteps_(num_timesteps) {}

    void bind_series(const std::string& name, const std::vector<double>* series);
    void bind_scalar(const std::string& name, double value);

    std::size_t num_timesteps() const { return num_timesteps_; }
    bool contains(const std::string& name) const;

    /**
     * @brief Returns true when the input came from a dataset series.
     */
    bool is_series(const std::string& name) const;

    /**
     * @brief Returns the value of an input at a timestep.
     * @throws std::out_of_range when the input is not bound.
     */
    double at(const std::string& name, std::size_t index) const;

    /**
     * @brief Returns the input expanded to a full series.
     */
    std::vector<double> expanded(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    struct Binding
    {
        std::string name;
        const std::vector<double>* series = nullptr;
        double scalar = 0.0;
    };

    const Binding& lookup(const std::string& name) const;

    std::size_t num_timesteps_ = 0;
    std::vector<Binding> bindings_;
};

using FormulaFunction = std::function<ComputationResult(const FormulaInputs&, const FormulaParameters&)>;

struct FormulaSpec
{
    std::string name;
    FormulaFamily family = FormulaFamily::Combination;
    std::string description;
    std::vector<std::string> required_inputs;
    std::vector<OptionalInput> optional_inputs;
    std::vector<FormulaParameter> parameters;
    FormulaFunction function;
    bool supports_partition = false;
    std::vector<std::string> component_names;

    /**
     * @brief Returns the declared optional input, or null.
     */
    const OptionalInput* find_optional(const std::string& input) const;

    /**
     * @brief Returns the resolved parameter values.
     */
    FormulaParameters resolved_parameters() const { return FormulaParameters(parameters); }
};

/**
 * @brief Converts a family to its stable text id.
 */
const char* to_string(FormulaFamily family);

/**
 * @brief Parses a family text id.
 * @return True on success.
 */
bool parse_formula_family(const std::string& value, FormulaFamily& out);

} // namespace petc
