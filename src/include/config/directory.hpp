#pragma once
/**
 * @file directory.hpp
 * @brief Temporary-vs-permanent directory requests and their lifecycle.
 *
 * A DirectoryType says what the caller wants: a fresh directory that pgtemp
 * creates and later deletes (Temporary), or an existing one it must never
 * touch (Permanent). `setup_directory_type()` resolves it to a
 * CompleteDirectoryType holding a concrete path; `cleanup_directory_type()`
 * releases it again.
 */

#include "pgt_platform.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace pgtemp::config
{

class DirectoryType
{
  public:
    enum class Kind
    {
        Temporary,
        Permanent,
    };

    /// The identity element.
    DirectoryType() = default;

    [[nodiscard]] static DirectoryType temporary() { return DirectoryType(); }
    /// @p path may start with "~" to mean the current user's home directory.
    [[nodiscard]] static DirectoryType permanent(std::string path)
    {
        return DirectoryType(Kind::Permanent, std::move(path));
    }

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool is_permanent() const noexcept { return m_kind == Kind::Permanent; }
    /// Empty for Temporary.
    [[nodiscard]] const std::string &path() const noexcept { return m_path; }

    bool operator==(const DirectoryType &) const = default;

  private:
    DirectoryType(Kind kind, std::string path) : m_kind(kind), m_path(std::move(path)) {}

    Kind m_kind = Kind::Temporary;
    std::string m_path;
};

/// Permanent beats Temporary in either position; of two Permanents the right one wins.
[[nodiscard]] DirectoryType combine(const DirectoryType &a, const DirectoryType &b);

class CompleteDirectoryType
{
  public:
    enum class Kind
    {
        Temporary, ///< Created by pgtemp; deleted on cleanup.
        Permanent, ///< Owned by the caller; never deleted.
    };

    [[nodiscard]] static CompleteDirectoryType temporary(std::filesystem::path path)
    {
        return CompleteDirectoryType(Kind::Temporary, std::move(path));
    }
    [[nodiscard]] static CompleteDirectoryType permanent(std::filesystem::path path)
    {
        return CompleteDirectoryType(Kind::Permanent, std::move(path));
    }

    [[nodiscard]] Kind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool is_temporary() const noexcept { return m_kind == Kind::Temporary; }
    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

    bool operator==(const CompleteDirectoryType &) const = default;

  private:
    CompleteDirectoryType(Kind kind, std::filesystem::path path)
        : m_kind(kind), m_path(std::move(path))
    {
    }

    Kind m_kind;
    std::filesystem::path m_path;
};

/// Re-tags a directory as Permanent so cleanup leaves it in place.
[[nodiscard]] CompleteDirectoryType make_permanent(const CompleteDirectoryType &dir);

/// Creates a uniquely named directory under a parent, named from a prefix.
using TempDirectoryFactory =
    std::function<std::filesystem::path(const std::filesystem::path &parent, std::string_view prefix)>;
/// Returns the current user's home directory or throws.
using HomeDirectoryLookup = std::function<std::filesystem::path()>;

/**
 * @brief Creates `<parent>/<prefix>XXXXXX` with mkdtemp(3), mode 0700.
 * @throws std::system_error on failure (missing parent, EACCES, ENOSPC, ...).
 */
[[nodiscard]] std::filesystem::path create_temp_directory(const std::filesystem::path &parent,
                                                          std::string_view prefix);

/**
 * @brief Expands a leading "~" against @p home.
 *
 * "~" becomes the home directory itself and "~/x" (or "~x") becomes
 * `<home>/x`. Paths that do not start with "~" are returned verbatim and
 * @p home is not called.
 */
[[nodiscard]] std::filesystem::path expand_home(const std::string &raw, const HomeDirectoryLookup &home);

/**
 * @brief Resolves a DirectoryType to a concrete path.
 *
 * Temporary: creates a new directory under @p temp_root via @p make_temp.
 * Permanent: expands "~" via @p home; the directory is neither created nor
 * checked.
 */
[[nodiscard]] CompleteDirectoryType
setup_directory_type(const std::filesystem::path &temp_root, std::string_view prefix,
                     const DirectoryType &requested,
                     const TempDirectoryFactory &make_temp = create_temp_directory,
                     const HomeDirectoryLookup &home = platform::home_directory);

/**
 * @brief Releases a directory: no-op for Permanent, crash-safe delete for Temporary.
 *
 * The directory is first renamed to `<dir>_removing` and only then deleted
 * recursively, with blockable signals masked for the calling thread across
 * both steps. An interruption therefore leaves either the original directory
 * or an orphaned `_removing` sibling, never a half-deleted original. A
 * `_removing` sibling left by an earlier interrupted release is removed first.
 *
 * Idempotent: a directory that no longer exists counts as released.
 *
 * @throws std::filesystem::filesystem_error for any other failure.
 */
void cleanup_directory_type(const CompleteDirectoryType &dir);

} // namespace pgtemp::config
