/**
 * @file runtime_log.cpp
 * @brief Logging profile state and parsing.
 */

#include "runtime_log.hpp"

#include <cstdlib>
#include <iostream>

#include "string_utils.hpp"

namespace petc
{

LogProfile global_log_profile = LogProfile::normal;

void set_log_profile(LogProfile profile)
{
    global_log_profile = profile;
}

void reset_log_profile()
{
    global_log_profile = LogProfile::normal;
}

/**
 * @brief Returns string label for runtime logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

bool apply_log_profile_from_environment()
{
    const char* raw = std::getenv("PETC_LOG_PROFILE");
    if (raw == nullptr || *raw == '\0')
    {
        return false;
    }

    bool valid = false;
    const LogProfile parsed = parse_log_profile(raw, &valid);
    if (!valid)
    {
        std::cerr << "Warning: Invalid PETC_LOG_PROFILE '" << raw
                  << "'. Valid values: quiet, normal, debug." << std::endl;
        return false;
    }
    set_log_profile(parsed);
    return true;
}

} // namespace petc
