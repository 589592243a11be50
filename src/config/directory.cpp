/**
 * @file directory.cpp
 * @brief Directory creation, home expansion and crash-safe removal.
 */
#include "config/directory.hpp"

#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <vector>

#include <pthread.h>
#include <signal.h>

namespace fs = std::filesystem;

namespace pgtemp::config
{

namespace
{
constexpr std::string_view kRemovingSuffix = "_removing";

bool is_missing(const std::error_code &ec) noexcept
{
    return ec == std::errc::no_such_file_or_directory;
}
} // namespace

DirectoryType combine(const DirectoryType &a, const DirectoryType &b)
{
    return b.is_permanent() ? b : a;
}

CompleteDirectoryType make_permanent(const CompleteDirectoryType &dir)
{
    return CompleteDirectoryType::permanent(dir.path());
}

fs::path create_temp_directory(const fs::path &parent, std::string_view prefix)
{
    std::string pattern = (parent / prefix).string();
    pattern += "XXXXXX";
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr)
    {
        throw std::system_error(errno, std::generic_category(), "mkdtemp " + pattern);
    }
    return fs::path(buf.data());
}

fs::path expand_home(const std::string &raw, const HomeDirectoryLookup &home)
{
    if (raw.empty() || raw.front() != '~')
    {
        return fs::path(raw);
    }
    std::string_view rest(raw);
    rest.remove_prefix(1);
    while (!rest.empty() && rest.front() == '/')
    {
        rest.remove_prefix(1);
    }
    fs::path base = home();
    return rest.empty() ? base : base / rest;
}

CompleteDirectoryType setup_directory_type(const fs::path &temp_root, std::string_view prefix,
                                           const DirectoryType &requested,
                                           const TempDirectoryFactory &make_temp,
                                           const HomeDirectoryLookup &home)
{
    if (requested.is_permanent())
    {
        auto dir = CompleteDirectoryType::permanent(expand_home(requested.path(), home));
        PGTEMP_LOG_DEBUG("using permanent directory {}", dir.path().string());
        return dir;
    }
    auto dir = CompleteDirectoryType::temporary(make_temp(temp_root, prefix));
    PGTEMP_LOG_DEBUG("created temporary directory {}", dir.path().string());
    return dir;
}

void cleanup_directory_type(const CompleteDirectoryType &dir)
{
    if (!dir.is_temporary())
    {
        return;
    }

    const fs::path &main_dir = dir.path();
    fs::path removing = main_dir;
    removing += kRemovingSuffix;

    sigset_t all;
    sigset_t saved;
    ::sigfillset(&all);
    if (const int rc = ::pthread_sigmask(SIG_BLOCK, &all, &saved); rc != 0)
    {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }
    auto restore_mask = basics::make_scope_guard(
        [&saved]() noexcept { ::pthread_sigmask(SIG_SETMASK, &saved, nullptr); });

    std::error_code ec;
    fs::rename(main_dir, removing, ec);
    if (ec && !is_missing(ec))
    {
        std::error_code exists_ec;
        if (fs::exists(removing, exists_ec))
        {
            PGTEMP_LOG_WARN("removing stale {} left by an interrupted cleanup", removing.string());
            fs::remove_all(removing);
            ec.clear();
            fs::rename(main_dir, removing, ec);
        }
    }
    if (is_missing(ec))
    {
        PGTEMP_LOG_DEBUG("directory {} already gone", main_dir.string());
        return;
    }
    if (ec)
    {
        throw fs::filesystem_error("cleanup_directory_type: rename", main_dir, removing, ec);
    }

    fs::remove_all(removing, ec);
    if (ec && !is_missing(ec))
    {
        throw fs::filesystem_error("cleanup_directory_type: remove_all", removing, ec);
    }
    PGTEMP_LOG_DEBUG("removed temporary directory {}", main_dir.string());
}

} // namespace pgtemp::config
