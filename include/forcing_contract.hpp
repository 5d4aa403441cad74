#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * @file forcing_contract.hpp
 * @brief Vocabulary of recognized forcing variables.
 *
 * Captures variable identity, units, accepted aliases and physical bounds.
 * The CSV loader uses the aliases to canonicalize column names, and the
 * forcing validator uses the bounds for quality reporting.
 */

namespace petc
{

struct VariableBounds
{
    bool has_min = false;
    bool has_max = false;
    double min_value = 0.0;
    double max_value = 0.0;
};

enum class ForcingRole
{
    Core,
    Auxiliary,
};

struct ForcingContract
{
    std::string id;
    std::string units;
    std::string description;
    VariableBounds bounds{};
    std::vector<std::string> aliases;
    ForcingRole role = ForcingRole::Auxiliary;
};

/**
 * @brief Returns the complete forcing contract table.
 * @return Immutable list of contracts in a stable order.
 */
const std::vector<ForcingContract>& forcing_contracts();

/**
 * @brief Finds a contract by canonical id or alias (case-insensitive).
 * @param id_or_alias Contract id or alias.
 * @return Pointer to matched contract, or null if not found.
 */
const ForcingContract* find_forcing_contract(std::string_view id_or_alias);

/**
 * @brief Maps a column name to its canonical variable id.
 * @return Canonical id for known names, the input unchanged otherwise.
 */
std::string canonical_forcing_name(std::string_view name);

/**
 * @brief Returns the core variable set most formulas draw from.
 */
std::vector<std::string> core_forcing_variables();

const char* to_string(ForcingRole value);

} // namespace petc
