#pragma once
/**
 * @file process_config.hpp
 * @brief Partial and complete descriptions of one child-process invocation.
 *
 * A ProcessConfig is what callers layer together (environment, argv, the
 * three standard streams). `complete_process_config()` turns the merged
 * result into a CompleteProcessConfig that the process supervisor can exec
 * directly, or reports every field that is still missing.
 */

#include "config/partial.hpp"
#include "pgt_platform.hpp"
#include "utils/validation.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pgtemp::config
{

using platform::EnvEntry;
using platform::EnvList;
using utils::ErrorList;
using utils::Validation;

// ============================================================================
// Stream bindings
// ============================================================================

/**
 * @struct StreamHandle
 * @brief A file descriptor a child's stdin/stdout/stderr is bound to.
 *
 * Non-owning: the descriptor belongs to whoever opened it (the calling
 * process for the standard streams, a NullDevice for the null device).
 */
struct StreamHandle
{
    int fd = -1;
    std::string name; ///< For diagnostics only, e.g. "stdout" or "/dev/null".

    bool operator==(const StreamHandle &) const = default;
};

StreamHandle stdin_handle();
StreamHandle stdout_handle();
StreamHandle stderr_handle();

/**
 * @class NullDevice
 * @brief Owns one descriptor open on /dev/null for silencing child processes.
 *
 * Open one at startup and pass it to silent_process_config(); it must outlive
 * every process bound to it.
 */
class NullDevice
{
  public:
    /// @throws std::system_error if /dev/null cannot be opened.
    NullDevice();
    ~NullDevice();

    NullDevice(const NullDevice &) = delete;
    NullDevice &operator=(const NullDevice &) = delete;
    NullDevice(NullDevice &&other) noexcept;
    NullDevice &operator=(NullDevice &&other) noexcept;

    [[nodiscard]] StreamHandle handle() const;

  private:
    int m_fd = -1;
};

// ============================================================================
// EnvironmentVariables
// ============================================================================

/**
 * @struct EnvironmentVariables
 * @brief Whether to inherit the caller's environment, plus specific entries.
 *
 * `inherit` must be set by some layer before completion.
 */
struct EnvironmentVariables
{
    std::optional<bool> inherit;
    std::map<std::string, std::string> specific;

    bool operator==(const EnvironmentVariables &) const = default;
};

[[nodiscard]] EnvironmentVariables combine(const EnvironmentVariables &a,
                                           const EnvironmentVariables &b);

/**
 * @brief Resolves the final environment list.
 *
 * With inherit=true the result is @p envs followed by the specific entries in
 * ascending name order; with inherit=false only the specific entries. A name
 * present in both @p envs and `specific` appears twice: which one the child
 * sees is up to the exec layer.
 */
[[nodiscard]] Validation<EnvList> complete_environment_variables(const EnvList &envs,
                                                                 const EnvironmentVariables &vars);

// ============================================================================
// CommandLineArgs
// ============================================================================

/**
 * @struct CommandLineArgs
 * @brief Keyed and positional arguments.
 *
 * `key_based` entries render as key concatenated with value, so the key
 * carries its own separator: `{"-p", "5432"}` renders "-p5432",
 * `{"--pgdata=", "/d"}` renders "--pgdata=/d", `{"--switch", nullopt}` renders
 * "--switch". They come first, in ascending key order.
 *
 * `index_based` entries follow, but only the unbroken run 0, 1, 2, ...; the
 * first gap ends the run and later positions are dropped.
 */
struct CommandLineArgs
{
    std::map<std::string, std::optional<std::string>> key_based;
    std::map<int, std::string> index_based;

    bool operator==(const CommandLineArgs &) const = default;
};

[[nodiscard]] CommandLineArgs combine(const CommandLineArgs &a, const CommandLineArgs &b);

[[nodiscard]] std::vector<std::string> complete_command_line_args(const CommandLineArgs &args);

// ============================================================================
// ProcessConfig
// ============================================================================

struct ProcessConfig
{
    EnvironmentVariables environment_variables;
    CommandLineArgs command_line;
    std::optional<StreamHandle> std_in;
    std::optional<StreamHandle> std_out;
    std::optional<StreamHandle> std_err;

    bool operator==(const ProcessConfig &) const = default;
};

[[nodiscard]] ProcessConfig combine(const ProcessConfig &a, const ProcessConfig &b);

struct CompleteProcessConfig
{
    EnvList environment_variables;
    std::vector<std::string> command_line;
    StreamHandle std_in;
    StreamHandle std_out;
    StreamHandle std_err;

    bool operator==(const CompleteProcessConfig &) const = default;
};

/// Inherit the environment and bind the caller's own stdin/stdout/stderr.
[[nodiscard]] ProcessConfig standard_process_config();

/// Inherit the environment and bind all three streams to @p null_device.
[[nodiscard]] ProcessConfig silent_process_config(const NullDevice &null_device);

/**
 * @brief Completes a ProcessConfig against an environment snapshot.
 *
 * Every missing field is reported: an unset `inherit` and each unset stream
 * produce independent errors.
 */
[[nodiscard]] Validation<CompleteProcessConfig> complete_process_config(const EnvList &envs,
                                                                        const ProcessConfig &cfg);

} // namespace pgtemp::config
