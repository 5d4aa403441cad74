/**
 * @file formula_registry.cpp
 * @brief Formula registration and descriptor validation.
 */

#include "formula_registry.hpp"

#include <iostream>
#include <unordered_set>

#include "comparison_errors.hpp"
#include "runtime_log.hpp"

namespace petc
{

void validate_formula_spec(const FormulaSpec& spec)
{
    if (spec.name.empty())
    {
        throw RegistrationError("Formula name must not be empty");
    }
    if (!spec.function)
    {
        throw RegistrationError("Formula '" + spec.name + "' has no callable");
    }

    std::unordered_set<std::string> required;
    for (const auto& input : spec.required_inputs)
    {
        if (!required.insert(input).second)
        {
            throw RegistrationError("Formula '" + spec.name + "' lists required input '" + input + "' twice");
        }
    }

    std::unordered_set<std::string> optional;
    for (const auto& input : spec.optional_inputs)
    {
        if (!optional.insert(input.name).second)
        {
            throw RegistrationError("Formula '" + spec.name + "' lists optional input '" + input.name + "' twice");
        }
        if (required.count(input.name) != 0)
        {
            throw RegistrationError("Formula '" + spec.name + "' declares '" + input.name +
                                    "' as both required and optional");
        }
    }

    std::unordered_set<std::string> parameters;
    for (const auto& parameter : spec.parameters)
    {
        if (!parameters.insert(parameter.name).second)
        {
            throw RegistrationError("Formula '" + spec.name + "' declares parameter '" + parameter.name + "' twice");
        }
    }

    if (spec.supports_partition && spec.component_names.empty())
    {
        throw RegistrationError("Formula '" + spec.name + "' supports partitioning but declares no components");
    }
}

void apply_formula_options(FormulaSpec& spec, const FormulaOptions& options)
{
    for (const auto& [option, value] : options)
    {
        bool applied = false;
        for (auto& parameter : spec.parameters)
        {
            if (parameter.name == option)
            {
                parameter.value = value;
                applied = true;
                break;
            }
        }
        if (!applied)
        {
            throw UnknownOptionError(spec.name, option);
        }
    }
}

void FormulaRegistry::register_formula(FormulaSpec spec)
{
    validate_formula_spec(spec);
    if (contains(spec.name))
    {
        throw DuplicateNameError(spec.name);
    }
    if (log_debug_enabled())
    {
        std::cout << "[REGISTRY] registered " << spec.name << " (" << to_string(spec.family) << ")" << std::endl;
    }
    specs_.push_back(std::move(spec));
}

void FormulaRegistry::register_formula(FormulaSpec spec, const FormulaOptions& options)
{
    apply_formula_options(spec, options);
    register_formula(std::move(spec));
}

std::vector<const FormulaSpec*> FormulaRegistry::specs_by_family(FormulaFamily family) const
{
    std::vector<const FormulaSpec*> out;
    for (const auto& spec : specs_)
    {
        if (spec.family == family)
        {
            out.push_back(&spec);
        }
    }
    return out;
}

const FormulaSpec* FormulaRegistry::find(const std::string& name) const
{
    for (const auto& spec : specs_)
    {
        if (spec.name == name)
        {
            return &spec;
        }
    }
    return nullptr;
}

std::vector<std::string> FormulaRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(specs_.size());
    for (const auto& spec : specs_)
    {
        out.push_back(spec.name);
    }
    return out;
}

} // namespace petc
