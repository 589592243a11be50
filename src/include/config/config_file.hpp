#pragma once
/**
 * @file config_file.hpp
 * @brief JSON configuration files and environment overrides as Config layers.
 *
 * A file is just another partial layer: every key is optional and an absent
 * key leaves the field unset, so files compose with programmatic layers via
 * combine(). Example:
 *
 * @code{.json}
 * {
 *   "port": "free",
 *   "temporary_directory": "/var/tmp",
 *   "socket_directory": "temporary",
 *   "data_directory": "~/pgdata",
 *   "plan": {
 *     "logger": "silent",
 *     "initdb": { "args": { "--username=": "alice" }, "stdout": "null" },
 *     "createdb": { "positional": ["testdb"] },
 *     "postgres": {
 *       "inherit_environment": true,
 *       "environment": { "TZ": "UTC" },
 *       "args": { "-c": "fsync=off" },
 *       "connection": { "user": "alice", "dbname": "testdb" }
 *     },
 *     "config_file": ["shared_buffers = 16MB"],
 *     "connection_timeout_ms": 30000,
 *     "initdb_cache": { "copy_on_write": true, "directory": "~/.pgtemp-cache" }
 *   }
 * }
 * @endcode
 *
 * Streams are "inherit" (the caller's own stream) or "null" (the null device,
 * which then has to be supplied).
 */

#include "config/config.hpp"
#include "config/errors.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace pgtemp::config
{

/**
 * @brief Parses one Config layer.
 * @param null_device Required only if a stream is "null".
 * @throws ConfigFileError on any type or value error, naming the offending key.
 */
[[nodiscard]] Config config_from_json(const nlohmann::json &j, const NullDevice *null_device = nullptr);

/**
 * @brief Reads and parses a JSON config file.
 * @throws ConfigFileError if the file cannot be read or parsed.
 */
[[nodiscard]] Config load_config_file(const std::filesystem::path &path,
                                      const NullDevice *null_device = nullptr);

/**
 * @brief The layer defined by PGTEMP_* variables in @p envs.
 *
 * PGTEMP_PORT (number or "free"), PGTEMP_TEMP_DIR, PGTEMP_DATA_DIR
 * (permanent), PGTEMP_SOCKET_DIR (permanent). Unset or empty variables leave
 * their field unset.
 *
 * @throws ConfigFileError if PGTEMP_PORT is malformed.
 */
[[nodiscard]] Config environment_overrides(const EnvList &envs);

} // namespace pgtemp::config
