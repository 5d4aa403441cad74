/**
 * @file formula_base.cpp
 * @brief Shared formula descriptor helpers.
 */

#include "formula_base.hpp"

#include <stdexcept>

#include "string_utils.hpp"

namespace petc
{

const NamedSeries* ComputationResult::find_component(const std::string& name) const
{
    for (const auto& component : components)
    {
        if (component.name == name)
        {
            return &component;
        }
    }
    return nullptr;
}

double FormulaParameters::get(const std::string& name) const
{
    for (const auto& parameter : values_)
    {
        if (parameter.name == name)
        {
            return parameter.value;
        }
    }
    throw std::out_of_range("Undeclared formula parameter: " + name);
}

bool FormulaParameters::contains(const std::string& name) const
{
    for (const auto& parameter : values_)
    {
        if (parameter.name == name)
        {
            return true;
        }
    }
    return false;
}

void FormulaInputs::bind_series(const std::string& name, const std::vector<double>* series)
{
    if (series == nullptr || series->size() != num_timesteps_)
    {
        throw std::invalid_argument("Input series '" + name + "' does not match the timestep count");
    }
    bindings_.push_back({name, series, 0.0});
}

void FormulaInputs::bind_scalar(const std::string& name, double value)
{
    bindings_.push_back({name, nullptr, value});
}

bool FormulaInputs::contains(const std::string& name) const
{
    for (const auto& binding : bindings_)
    {
        if (binding.name == name)
        {
            return true;
        }
    }
    return false;
}

bool FormulaInputs::is_series(const std::string& name) const
{
    return lookup(name).series != nullptr;
}

double FormulaInputs::at(const std::string& name, std::size_t index) const
{
    const Binding& binding = lookup(name);
    if (binding.series != nullptr)
    {
        return (*binding.series)[index];
    }
    return binding.scalar;
}

std::vector<double> FormulaInputs::expanded(const std::string& name) const
{
    const Binding& binding = lookup(name);
    if (binding.series != nullptr)
    {
        return *binding.series;
    }
    return std::vector<double>(num_timesteps_, binding.scalar);
}

std::vector<std::string> FormulaInputs::names() const
{
    std::vector<std::string> out;
    out.reserve(bindings_.size());
    for (const auto& binding : bindings_)
    {
        out.push_back(binding.name);
    }
    return out;
}

const FormulaInputs::Binding& FormulaInputs::lookup(const std::string& name) const
{
    for (const auto& binding : bindings_)
    {
        if (binding.name == name)
        {
            return binding;
        }
    }
    throw std::out_of_range("Formula input not bound: " + name);
}

const OptionalInput* FormulaSpec::find_optional(const std::string& input) const
{
    for (const auto& optional : optional_inputs)
    {
        if (optional.name == input)
        {
            return &optional;
        }
    }
    return nullptr;
}

const char* to_string(FormulaFamily family)
{
    switch (family)
    {
        case FormulaFamily::TemperatureBased:
            return "temperature_based";
        case FormulaFamily::RadiationBased:
            return "radiation_based";
        case FormulaFamily::Combination:
            return "combination";
        case FormulaFamily::Co2Aware:
            return "co2_aware";
        case FormulaFamily::VegetationAware:
            return "vegetation_aware";
        case FormulaFamily::ComplementaryRelationship:
            return "complementary_relationship";
        default:
            return "unknown";
    }
}

bool parse_formula_family(const std::string& value, FormulaFamily& out)
{
    const std::string normalized = strutil::lower_copy(value);
    if (normalized == "temperature_based" || normalized == "temperature")
    {
        out = FormulaFamily::TemperatureBased;
        return true;
    }
    if (normalized == "radiation_based" || normalized == "radiation")
    {
        out = FormulaFamily::RadiationBased;
        return true;
    }
    if (normalized == "combination")
    {
        out = FormulaFamily::Combination;
        return true;
    }
    if (normalized == "co2_aware" || normalized == "co2")
    {
        out = FormulaFamily::Co2Aware;
        return true;
    }
    if (normalized == "vegetation_aware" || normalized == "vegetation")
    {
        out = FormulaFamily::VegetationAware;
        return true;
    }
    if (normalized == "complementary_relationship" || normalized == "complementary" || normalized == "cr")
    {
        out = FormulaFamily::ComplementaryRelationship;
        return true;
    }
    return false;
}

} // namespace petc
