/**
 * @file forcing_contract.cpp
 * @brief Forcing variable inventory for the validation module.
 *
 * Holds the canonical variable table with units, aliases and physical
 * bounds used by CSV loading and forcing quality reports.
 * This file is part of the src/validation subsystem.
 */

#include "forcing_contract.hpp"
#include "string_utils.hpp"

namespace petc {
namespace {

/**
 * @brief Builds an inclusive min/max bounds descriptor.
 */
VariableBounds bounds(double min_value, double max_value) {
    VariableBounds out;
    out.has_min = true;
    out.has_max = true;
    out.min_value = min_value;
    out.max_value = max_value;
    return out;
}

const std::vector<ForcingContract> kContracts = {
    {"temperature", "degC", "Mean air temperature", bounds(-60.0, 60.0),
     {"T_mean", "tmean", "t_air", "tair"}, ForcingRole::Core},
    {"temperature_max", "degC", "Daily maximum air temperature", bounds(-60.0, 70.0),
     {"T_max", "tmax"}},
    {"temperature_min", "degC", "Daily minimum air temperature", bounds(-70.0, 60.0),
     {"T_min", "tmin"}},
    {"relative_humidity", "%", "Relative humidity", bounds(0.0, 100.0),
     {"RH", "rh_mean"}, ForcingRole::Core},
    {"wind_speed", "m/s", "Wind speed at 2 m", bounds(0.0, 60.0),
     {"u2", "wind", "ws"}, ForcingRole::Core},
    {"net_radiation", "MJ/m^2/day", "Net radiation", bounds(-10.0, 40.0),
     {"Rn", "rnet"}, ForcingRole::Core},
    {"soil_heat_flux", "MJ/m^2/day", "Soil heat flux", bounds(-10.0, 10.0),
     {"G", "ground_heat_flux"}},
    {"pressure", "kPa", "Surface air pressure", bounds(30.0, 110.0),
     {"P", "air_pressure", "surface_pressure"}},
    {"vpd", "kPa", "Vapour pressure deficit", bounds(0.0, 10.0),
     {"VPD", "vapour_pressure_deficit", "vapor_pressure_deficit"}},
    {"lai", "m^2/m^2", "Leaf area index", bounds(0.0, 15.0),
     {"LAI", "leaf_area_index"}},
    {"co2", "ppm", "Atmospheric CO2 concentration", bounds(150.0, 2000.0),
     {"CO2", "co2_ppm"}},
    {"soil_moisture", "1", "Relative soil moisture", bounds(0.0, 1.0),
     {"SM", "theta_soil"}},
    {"doy", "day", "Day of year", bounds(1.0, 366.0),
     {"day_of_year", "DOY"}},
    {"latitude", "deg", "Site latitude", bounds(-90.0, 90.0),
     {"lat"}},
};

}

/**
 * @brief Returns the canonical forcing contract inventory.
 */
const std::vector<ForcingContract>& forcing_contracts() {
    return kContracts;
}

/**
 * @brief Finds a forcing contract by canonical id or known alias.
 */
const ForcingContract* find_forcing_contract(std::string_view id_or_alias) {
    const std::string requested = strutil::lower_copy(id_or_alias);

    for (const auto& contract : kContracts) {
        if (strutil::lower_copy(contract.id) == requested) {
            return &contract;
        }

        for (const auto& alias : contract.aliases) {
            if (strutil::lower_copy(alias) == requested) {
                return &contract;
            }
        }
    }

    return nullptr;
}

/**
 * @brief Maps known names and aliases to the canonical id.
 */
std::string canonical_forcing_name(std::string_view name) {
    const ForcingContract* contract = find_forcing_contract(name);
    if (contract == nullptr) {
        return std::string(name);
    }
    return contract->id;
}

/**
 * @brief Lists contracts marked as core forcing.
 */
std::vector<std::string> core_forcing_variables() {
    std::vector<std::string> out;
    for (const auto& contract : kContracts) {
        if (contract.role == ForcingRole::Core) {
            out.push_back(contract.id);
        }
    }
    return out;
}

/**
 * @brief Converts forcing role enum to stable string id.
 */
const char* to_string(ForcingRole value) {
    switch (value) {
        case ForcingRole::Core:
            return "core";
        case ForcingRole::Auxiliary:
            return "auxiliary";
        default:
            return "unknown";
    }
}

}
