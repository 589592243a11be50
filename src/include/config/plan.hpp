#pragma once
/**
 * @file plan.hpp
 * @brief The execution plan for initdb, createdb and postgres.
 *
 * A Plan is partial and layered like every other config value. The
 * orchestrator builds a default layer with `generate_plan()` from the
 * resources it acquired, combines the caller's plan on top, and completes the
 * result into a CompletePlan. The process supervisor consumes that.
 */

#include "config/connection_options.hpp"
#include "config/partial.hpp"
#include "config/process_config.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pgtemp::config
{

/// Receives one line of diagnostic text from the supervisor.
using PlanLogger = std::function<void(std::string_view)>;

/// Forwards each line to the process logger at INFO.
[[nodiscard]] PlanLogger default_plan_logger();
/// Discards everything.
[[nodiscard]] PlanLogger silent_plan_logger();

/// Connection timeout of the generated plan: one minute.
inline constexpr std::chrono::microseconds kDefaultConnectionTimeout{60'000'000};

/// Where and how initdb results are cached between runs.
struct InitDbCache
{
    bool copy_on_write = false;
    std::filesystem::path cache_directory;

    bool operator==(const InitDbCache &) const = default;
};

// ============================================================================
// PostgresPlan
// ============================================================================

struct PostgresPlan
{
    ProcessConfig postgres_config;
    ConnectionOptions connection_options;

    bool operator==(const PostgresPlan &) const = default;
};

[[nodiscard]] PostgresPlan combine(const PostgresPlan &a, const PostgresPlan &b);

struct CompletePostgresPlan
{
    CompleteProcessConfig process_config;
    ConnectionOptions connection_options;

    bool operator==(const CompletePostgresPlan &) const = default;
};

/// Errors are tagged "postgres_config: ".
[[nodiscard]] Validation<CompletePostgresPlan> complete_postgres_plan(const EnvList &envs,
                                                                      const PostgresPlan &plan);

// ============================================================================
// Plan
// ============================================================================

struct Plan
{
    std::optional<PlanLogger> logger;
    /// Absent: initdb is not run. Combined nestedly when both layers set it,
    /// rather than the later layer replacing the earlier one, so a partial
    /// layer such as options_to_plan()'s `--username=` keeps the generated
    /// `--pgdata=` and stream bindings.
    std::optional<ProcessConfig> init_db_config;
    /// Absent: createdb is not run. Combined nestedly when both layers set it.
    std::optional<ProcessConfig> create_db_config;
    PostgresPlan postgres_plan;
    /// postgresql.conf lines; layers append.
    std::vector<std::string> postgres_config_file;
    std::optional<std::string> data_directory;
    std::optional<std::chrono::microseconds> connection_timeout;
    /// Outer optional: unset. Inner nullopt: set to "no cache".
    std::optional<std::optional<InitDbCache>> init_db_cache;
};

[[nodiscard]] Plan combine(const Plan &a, const Plan &b);

[[nodiscard]] bool has_init_db(const Plan &plan);
[[nodiscard]] bool has_create_db(const Plan &plan);

struct CompletePlan
{
    PlanLogger logger;
    std::optional<CompleteProcessConfig> init_db_config;
    std::optional<CompleteProcessConfig> create_db_config;
    CompletePostgresPlan postgres_plan;
    std::string config; ///< postgresql.conf contents, every line newline-terminated.
    std::filesystem::path data_directory;
    std::chrono::microseconds connection_timeout{0};
    std::optional<InitDbCache> init_db_cache;
};

/**
 * @brief Validates a merged plan.
 *
 * Every missing field is reported, each prefixed with its path, e.g.
 * "postgres_plan: postgres_config: Missing std_in option" or
 * "init_db_config: Missing inherit option". initdb and createdb configs are
 * completed only when present.
 */
[[nodiscard]] Validation<CompletePlan> complete_plan(const EnvList &envs, const Plan &plan);

/// The server config fragment binding loopback addresses and @p socket_dir.
[[nodiscard]] std::vector<std::string> socket_directory_to_config(const std::string &socket_dir);

/**
 * @brief Builds the default plan layer for resolved resources.
 *
 * postgres gets `-p<port> -D<data_dir>` and connection options pointing at
 * the socket directory; initdb (when @p make_init_db) gets
 * `--pgdata=<data_dir>`; createdb (when @p make_create_db) gets
 * `-h<socket_dir> -p<port>`. All present sub-configs inherit the environment
 * and the caller's stdio.
 */
[[nodiscard]] Plan generate_plan(bool make_init_db, bool make_create_db, int port,
                                 const std::string &socket_dir, const std::string &data_dir);

} // namespace pgtemp::config
