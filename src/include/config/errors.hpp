#pragma once
/**
 * @file errors.hpp
 * @brief Exceptions raised by the configuration engine.
 *
 * Missing fields are collected as plain strings in a Validation and surface
 * once, wrapped in CompletePlanFailed. Filesystem and network failures are
 * reported as std::system_error / std::filesystem::filesystem_error.
 */

#include "utils/validation.hpp"

#include <stdexcept>
#include <string>

namespace pgtemp::config
{

/**
 * @class CompletePlanFailed
 * @brief The merged plan could not be completed.
 *
 * Carries every missing-field error together with a rendering of the plan as
 * it stood, so the caller can see which layer left what unset.
 */
class CompletePlanFailed : public std::runtime_error
{
  public:
    CompletePlanFailed(std::string rendered_plan, utils::ErrorList errors);

    [[nodiscard]] const utils::ErrorList &errors() const noexcept { return m_errors; }
    [[nodiscard]] const std::string &rendered_plan() const noexcept { return m_rendered_plan; }

  private:
    std::string m_rendered_plan;
    utils::ErrorList m_errors;
};

/// A configuration file or an environment override could not be understood.
class ConfigFileError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace pgtemp::config
