#pragma once

/**
 * @file scheme_support.hpp
 * @brief Declarations for the formulas module.
 *
 * Small helpers shared by formula scheme definitions.
 * This file is part of the src/formulas subsystem.
 */

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "formula_base.hpp"
#include "physical_constants.hpp"

namespace petc
{
namespace formulas
{

/**
 * @brief Optional surface energy inputs shared by most formulas.
 */
inline std::vector<OptionalInput> surface_energy_optionals()
{
    return {
        {"pressure", physical_constants::standard_pressure_kpa},
        {"soil_heat_flux", 0.0},
    };
}

/**
 * @brief Creates a result with a zeroed total of the input length.
 */
inline ComputationResult make_result(const FormulaInputs& inputs)
{
    ComputationResult result;
    result.total.assign(inputs.num_timesteps(), 0.0);
    return result;
}

/**
 * @brief Appends a zeroed named series to a component or diagnostic list.
 * @return Index of the new series.
 */
inline std::size_t add_series(std::vector<NamedSeries>& list, const std::string& name, std::size_t length)
{
    list.push_back({name, std::vector<double>(length, 0.0)});
    return list.size() - 1;
}

inline double non_negative(double value)
{
    return std::max(value, 0.0);
}

} // namespace formulas
} // namespace petc
