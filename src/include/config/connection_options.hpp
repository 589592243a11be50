#pragma once
/**
 * @file connection_options.hpp
 * @brief Partial client connection options (the libpq keyword subset pgtemp sets).
 */

#include "config/partial.hpp"

#include <optional>
#include <string>

namespace pgtemp::config
{

struct ConnectionOptions
{
    std::optional<std::string> host; ///< Host name, IP, or a UNIX socket directory.
    std::optional<int> port;
    std::optional<std::string> dbname;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<int> connect_timeout; ///< Seconds.
    std::optional<std::string> application_name;
    std::optional<std::string> sslmode;

    bool operator==(const ConnectionOptions &) const = default;
};

[[nodiscard]] ConnectionOptions combine(const ConnectionOptions &a, const ConnectionOptions &b);

/**
 * @brief Renders the set options as a libpq keyword/value string, e.g.
 *        `host=/tmp/s port=5432 dbname=postgres`.
 *
 * Keys appear in declaration order; unset options are omitted. Values are
 * quoted where libpq requires it.
 */
[[nodiscard]] std::string to_connection_string(const ConnectionOptions &opts);

} // namespace pgtemp::config
