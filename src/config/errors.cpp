#include "config/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace pgtemp::config
{

namespace
{
std::string describe(const std::string &rendered_plan, const utils::ErrorList &errors)
{
    return fmt::format("CompletePlanFailed: {} error(s):\n  {}\nplan:\n{}", errors.size(),
                       fmt::join(errors, "\n  "), rendered_plan);
}
} // namespace

CompletePlanFailed::CompletePlanFailed(std::string rendered_plan, utils::ErrorList errors)
    : std::runtime_error(describe(rendered_plan, errors)), m_rendered_plan(std::move(rendered_plan)),
      m_errors(std::move(errors))
{
}

} // namespace pgtemp::config
