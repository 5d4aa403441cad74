#pragma once

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include "forcing_dataset.hpp"

/**
 * @file test_fixtures.hpp
 * @brief Forcing datasets shared by the test executables.
 */

namespace petc_test
{

inline std::vector<std::string> daily_timestamps(std::size_t n)
{
    std::vector<std::string> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        const std::size_t day = i % 28 + 1;
        const std::size_t month = i / 28 % 12 + 1;
        out.push_back("2020-" + std::string(month < 10 ? "0" : "") + std::to_string(month) + "-" +
                      std::string(day < 10 ? "0" : "") + std::to_string(day));
    }
    return out;
}

/**
 * @brief The three-day core forcing set of the capability scenarios.
 */
inline petc::ForcingDataset core_dataset()
{
    return petc::ForcingDataset({"2020-07-01", "2020-07-02", "2020-07-03"},
                                {
                                    {"temperature", {20.0, 22.0, 25.0}},
                                    {"relative_humidity", {60.0, 65.0, 70.0}},
                                    {"wind_speed", {2.5, 3.0, 2.0}},
                                    {"net_radiation", {15.0, 18.0, 20.0}},
                                });
}

/**
 * @brief Smooth seasonal forcing with every catalog variable present.
 */
inline petc::ForcingDataset full_dataset(std::size_t n = 60)
{
    const double two_pi = 6.283185307179586;
    std::vector<double> t, tmax, tmin, rh, u, rn, g, p, vpd, lai, co2, sm, doy, lat;
    for (std::size_t i = 0; i < n; ++i)
    {
        const double phase = two_pi * static_cast<double>(i) / static_cast<double>(n);
        const double mean_t = 18.0 + 8.0 * std::sin(phase);
        t.push_back(mean_t);
        tmax.push_back(mean_t + 6.0 + std::cos(phase));
        tmin.push_back(mean_t - 5.0);
        rh.push_back(60.0 + 15.0 * std::cos(phase));
        u.push_back(2.0 + 0.8 * std::sin(2.0 * phase));
        rn.push_back(12.0 + 6.0 * std::sin(phase));
        g.push_back(0.2 * std::sin(phase));
        p.push_back(100.5);
        vpd.push_back(1.0 + 0.6 * std::sin(phase));
        lai.push_back(2.5 + 1.5 * std::sin(phase));
        co2.push_back(400.0 + 10.0 * std::cos(phase));
        sm.push_back(0.35 + 0.15 * std::cos(phase));
        doy.push_back(static_cast<double>(120 + i));
        lat.push_back(40.0);
    }
    return petc::ForcingDataset(daily_timestamps(n),
                                {
                                    {"temperature", t},
                                    {"temperature_max", tmax},
                                    {"temperature_min", tmin},
                                    {"relative_humidity", rh},
                                    {"wind_speed", u},
                                    {"net_radiation", rn},
                                    {"soil_heat_flux", g},
                                    {"pressure", p},
                                    {"vpd", vpd},
                                    {"lai", lai},
                                    {"co2", co2},
                                    {"soil_moisture", sm},
                                    {"doy", doy},
                                    {"latitude", lat},
                                });
}

} // namespace petc_test
