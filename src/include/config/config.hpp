#pragma once
/**
 * @file config.hpp
 * @brief The top-level partial configuration handed to setup_config().
 */

#include "config/connection_options.hpp"
#include "config/directory.hpp"
#include "config/plan.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace pgtemp::config
{

/// A port choice: a fixed number, or nullopt to pick a free port.
using PortChoice = std::optional<int>;

struct Config
{
    Plan plan;
    DirectoryType socket_directory;
    DirectoryType data_directory;
    /// Unset: pick a free port unless a later layer decides otherwise.
    std::optional<PortChoice> port;
    /// Parent of the temporary directories. Defaults to /tmp.
    std::optional<std::filesystem::path> temporary_directory;
};

[[nodiscard]] Config combine(const Config &a, const Config &b);

/// A host beginning with '/' is a permanent socket directory; anything else is Temporary.
[[nodiscard]] DirectoryType host_to_socket_class(std::string_view host);

/**
 * @brief Derives a plan layer that makes @p opts connectable.
 *
 * user sets initdb `--username=`; password sets PGPASSWORD for initdb; a
 * dbname other than "postgres" or "template1" adds a createdb step creating it
 * (with the same user and password). The options themselves become the
 * postgres connection options.
 */
[[nodiscard]] Plan options_to_plan(const ConnectionOptions &opts);

/// options_to_plan() plus the port and socket directory the options imply.
[[nodiscard]] Config options_to_config(const ConnectionOptions &opts);

} // namespace pgtemp::config
