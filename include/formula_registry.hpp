#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "formula_base.hpp"

/**
 * @file formula_registry.hpp
 * @brief Catalog of formula descriptors in registration order.
 *
 * Registration order is the presentation order of every downstream table.
 * All validation happens in register_formula(); a registry that was built
 * without throwing only holds well-formed specs.
 */

namespace petc
{

// option name -> value, for a single formula
using FormulaOptions = std::map<std::string, double>;
// formula name -> options
using FormulaOptionsMap = std::map<std::string, FormulaOptions>;

class FormulaRegistry
{
public:
    /**
     * @brief Adds a formula descriptor.
     * @throws DuplicateNameError when the name is already registered.
     * @throws RegistrationError when the descriptor is malformed.
     */
    void register_formula(FormulaSpec spec);

    /**
     * @brief Adds a descriptor after overriding declared parameters.
     * @throws UnknownOptionError when an option is not declared by the formula.
     */
    void register_formula(FormulaSpec spec, const FormulaOptions& options);

    const std::vector<FormulaSpec>& all_specs() const { return specs_; }
    std::vector<const FormulaSpec*> specs_by_family(FormulaFamily family) const;

    const FormulaSpec* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    std::size_t size() const { return specs_.size(); }
    std::vector<std::string> names() const;

private:
    std::vector<FormulaSpec> specs_;
};

/**
 * @brief Checks a descriptor's structural invariants.
 * @throws RegistrationError describing the first problem found.
 */
void validate_formula_spec(const FormulaSpec& spec);

/**
 * @brief Overrides declared parameters of a descriptor.
 * @throws UnknownOptionError for undeclared options.
 */
void apply_formula_options(FormulaSpec& spec, const FormulaOptions& options);

} // namespace petc
