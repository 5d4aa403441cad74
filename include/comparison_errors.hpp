#pragma once

#include <stdexcept>
#include <string>

/**
 * @file comparison_errors.hpp
 * @brief Exception types raised by the comparison engine.
 *
 * Setup-time problems (bad registrations, unknown options) are fatal and
 * derive from RegistrationError. Data-dependent problems are recorded per
 * formula during batch runs and only surface as exceptions on the
 * single-formula path.
 */

namespace petc
{

class RegistrationError : public std::runtime_error
{
public:
    explicit RegistrationError(const std::string& message)
        : std::runtime_error(message) {}
};

class DuplicateNameError : public RegistrationError
{
public:
    explicit DuplicateNameError(const std::string& formula_name)
        : RegistrationError("Formula already registered: " + formula_name) {}
};

class UnknownOptionError : public RegistrationError
{
public:
    UnknownOptionError(const std::string& formula_name, const std::string& option)
        : RegistrationError("Unknown option '" + option + "' for formula '" + formula_name + "'") {}
};

class UnknownFormulaError : public std::runtime_error
{
public:
    explicit UnknownFormulaError(const std::string& formula_name)
        : std::runtime_error("Unknown formula: " + formula_name) {}
};

/**
 * @brief Raised on the single-formula path when required inputs are absent.
 */
class CapabilityError : public std::runtime_error
{
public:
    CapabilityError(const std::string& formula_name, const std::string& reason)
        : std::runtime_error("Formula '" + formula_name + "' is not runnable (" + reason + ")") {}
};

/**
 * @brief Raised on the single-formula path when the callable fails.
 */
class ExecutionFailure : public std::runtime_error
{
public:
    ExecutionFailure(const std::string& formula_name, const std::string& message)
        : std::runtime_error("Formula '" + formula_name + "' failed: " + message),
          formula_(formula_name),
          detail_(message) {}

    const std::string& formula() const { return formula_; }
    const std::string& detail() const { return detail_; }

private:
    std::string formula_;
    std::string detail_;
};

} // namespace petc
