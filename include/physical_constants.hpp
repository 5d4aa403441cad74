#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared physical constants used across the formula catalog.
 *
 * Centralizes thermodynamic and radiative constants so that every
 * evapotranspiration formula evaluates against the same reference values.
 * Units follow the FAO-56 daily convention (kPa, MJ m-2 day-1, mm day-1).
 */

namespace physical_constants
{
inline constexpr double stefan_boltzmann_wm2k4 = 5.67e-8;
inline constexpr double specific_heat_air_jkgk = 1013.0;
inline constexpr double latent_heat_vaporization_mjkg = 2.45;
inline constexpr double von_karman_constant = 0.41;
inline constexpr double gravity_ms2 = 9.81;
inline constexpr double freezing_temperature_k = 273.15;
inline constexpr double pi = 3.14159265358979323846;

inline constexpr double standard_pressure_kpa = 101.3;
inline constexpr double psychrometric_coefficient = 0.665e-3;  // kPa-1 scaling of P
inline constexpr double solar_constant_mjm2min = 0.0820;
inline constexpr double mj_to_mm_water = 0.408;                // 1 / 2.45

inline constexpr double priestley_taylor_alpha = 1.26;
inline constexpr double co2_reference_ppm = 380.0;
inline constexpr double grass_aerodynamic_coefficient = 208.0; // ra = 208 / u2 [s m-1]
inline constexpr double air_heat_capacity_term = 1.01 * 1013.0; // rho_a * cp term of the resistance formulas
} // namespace physical_constants
