#pragma once
/**
 * @file resources.hpp
 * @brief Acquiring and releasing everything a plan needs.
 *
 * `setup_config()` resolves the port, creates the socket and data
 * directories, and completes the plan. If any step fails, everything acquired
 * so far is released again, newest first, before the error propagates.
 * `cleanup_config()` releases a successful result.
 *
 * State machine of one attempt:
 *   Start -> PortResolved -> SocketDirAcquired -> DataDirAcquired -> PlanCompleted
 * with a RolledBack exit from every state.
 */

#include "config/config.hpp"
#include "config/directory.hpp"
#include "config/errors.hpp"
#include "config/plan.hpp"

#include <filesystem>
#include <functional>
#include <optional>

namespace pgtemp::config
{

enum class SetupStage
{
    Start,
    PortResolved,
    SocketDirAcquired,
    DataDirAcquired,
    PlanCompleted,
    RolledBack,
};

[[nodiscard]] const char *to_string(SetupStage stage) noexcept;

/**
 * @struct Collaborators
 * @brief The OS services setup_config() depends on.
 *
 * default_collaborators() wires the real ones; tests replace individual
 * members to fake environments, ports or failing directory creation.
 */
struct Collaborators
{
    std::function<EnvList()> environment;
    std::function<int()> free_port;
    TempDirectoryFactory create_temp_directory;
    HomeDirectoryLookup home_directory;
};

[[nodiscard]] Collaborators default_collaborators();

struct Resources
{
    CompletePlan plan;
    CompleteDirectoryType socket_directory;
    CompleteDirectoryType data_directory;
    std::filesystem::path temporary_directory;
};

/**
 * @brief Acquires the resources described by @p config.
 *
 * @throws CompletePlanFailed if the merged plan is missing fields.
 * @throws std::system_error / std::filesystem::filesystem_error if the port
 *         or a directory cannot be acquired.
 * Either way no temporary directory created by this call survives.
 */
[[nodiscard]] Resources setup_config(const Config &config,
                                     const Collaborators &collaborators = default_collaborators());

/**
 * @brief Releases both directories.
 *
 * Both releases are always attempted. Safe to call more than once. If a
 * release fails for a reason other than the directory being gone, the first
 * such error is rethrown after both have been attempted.
 */
void cleanup_config(const Resources &resources);

/// Keeps the data directory on cleanup.
[[nodiscard]] Resources make_resources_data_dir_permanent(Resources resources);

/**
 * @class ResourcesGuard
 * @brief Owns a Resources and calls cleanup_config() when destroyed.
 *
 * Errors during destruction are logged, not thrown. Call cleanup() directly to
 * observe them, or release() to hand ownership back to the caller.
 */
class ResourcesGuard
{
  public:
    explicit ResourcesGuard(Resources resources);
    ~ResourcesGuard();

    ResourcesGuard(const ResourcesGuard &) = delete;
    ResourcesGuard &operator=(const ResourcesGuard &) = delete;
    ResourcesGuard(ResourcesGuard &&other) noexcept;
    ResourcesGuard &operator=(ResourcesGuard &&) = delete;

    [[nodiscard]] bool owns() const noexcept { return m_resources.has_value(); }

    /// @throws std::logic_error if the guard no longer owns anything.
    [[nodiscard]] const Resources &get() const;

    /// Releases ownership without cleaning up.
    /// @throws std::logic_error if the guard no longer owns anything.
    [[nodiscard]] Resources release();

    /// Cleans up now; a no-op if nothing is owned. Propagates cleanup errors.
    void cleanup();

  private:
    std::optional<Resources> m_resources;
};

} // namespace pgtemp::config
