#pragma once
/**
 * @file pgt_platform.hpp
 * @brief Layer 0: Platform detection and OS utility declarations.
 *
 * Every file that needs platform macros (PGTEMP_PLATFORM_LINUX, PGTEMP_IS_POSIX, ...)
 * or the OS primitives the configuration engine consumes (environment snapshot,
 * home directory, free TCP port) should include this. It is self-contained.
 *
 * Only POSIX targets are supported: temporary directories, signal masking and
 * UNIX socket directories have no portable Windows counterpart here.
 */
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#if defined(__APPLE__) && defined(__MACH__)
#define PGTEMP_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define PGTEMP_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define PGTEMP_PLATFORM_LINUX 1
#else
#define PGTEMP_PLATFORM_UNKNOWN 1
#endif

#if defined(PGTEMP_PLATFORM_APPLE) || defined(PGTEMP_PLATFORM_FREEBSD) ||                          \
    defined(PGTEMP_PLATFORM_LINUX)
#define PGTEMP_IS_POSIX 1
#else
#error "pgtemp requires a POSIX platform (Linux, macOS or FreeBSD)."
#endif

// --- Require C++20 or later --------------------------------------------------
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif

namespace pgtemp::platform
{

/// One environment entry, in the order the OS reports it.
using EnvEntry = std::pair<std::string, std::string>;
/// An ordered environment snapshot. Duplicate names are preserved as-is.
using EnvList = std::vector<EnvEntry>;

/**
 * @brief Gets a platform-native thread ID, used in log lines.
 */
uint64_t get_native_thread_id() noexcept;

/**
 * @brief Snapshots the calling process's environment.
 * @details Reads `environ` once and copies every `NAME=value` entry. Entries
 *          without an '=' are skipped.
 */
EnvList environment_snapshot();

/**
 * @brief Returns the current user's home directory.
 * @details `$HOME` when set and non-empty, otherwise the password database entry
 *          for the real user id.
 * @throws std::system_error if neither source yields a directory.
 */
std::filesystem::path home_directory();

/**
 * @brief Asks the OS for a TCP port that is free right now.
 * @details Binds a loopback socket to port 0 and reads back the assigned port.
 *          The socket is closed before returning, so the port is only
 *          "probably free"; callers should use it promptly.
 * @throws std::system_error on socket/bind/getsockname failure.
 */
int get_free_port();

/**
 * @brief The directory temporary directories are created under by default.
 * @details Always `/tmp`: UNIX socket paths are length limited and the
 *          per-user `$TMPDIR` on some systems is long enough to overflow it.
 */
std::filesystem::path default_temporary_root();

} // namespace pgtemp::platform
