#pragma once

#include <string>

/**
 * @file runtime_log.hpp
 * @brief Process-wide logging profile shared by every subsystem.
 *
 * Subsystems print bracket-tagged progress lines to stdout when the
 * profile allows it and write warnings to stderr. The profile is explicit
 * process state: it starts at `normal`, is changed through
 * set_log_profile() (usually from the loaded configuration) and can be
 * restored with reset_log_profile().
 */

namespace petc
{

enum class LogProfile : int
{
    quiet = 0,
    normal = 1,
    debug = 2
};

extern LogProfile global_log_profile;

/**
 * @brief Returns whether current logging level includes the target level.
 * @param level Minimum desired logging level.
 * @return True when logging at the requested level is enabled.
 */
inline bool log_at_least(LogProfile level)
{
    return static_cast<int>(global_log_profile) >= static_cast<int>(level);
}

/**
 * @brief Returns whether normal logging output is enabled.
 */
inline bool log_normal_enabled()
{
    return log_at_least(LogProfile::normal);
}

/**
 * @brief Returns whether debug logging output is enabled.
 */
inline bool log_debug_enabled()
{
    return log_at_least(LogProfile::debug);
}

/**
 * @brief Sets the process-wide logging profile.
 */
void set_log_profile(LogProfile profile);

/**
 * @brief Restores the default `normal` profile.
 */
void reset_log_profile();

/**
 * @brief Returns a string label for a log profile.
 */
const char* log_profile_name(LogProfile profile);

/**
 * @brief Parses a log profile string.
 * @param value Input profile string.
 * @param valid Optional parse-success output flag.
 * @return Parsed log profile, `normal` when unrecognized.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid = nullptr);

/**
 * @brief Applies the PETC_LOG_PROFILE environment override when set.
 * @return True when the variable was present and valid.
 */
bool apply_log_profile_from_environment();

} // namespace petc
