/**
 * @file platform.cpp
 * @brief POSIX implementations of the OS primitives the configuration engine consumes.
 *
 * Thread identification for log lines, the environment snapshot, the
 * home-directory lookup used to expand "~" in permanent directories, and the
 * free-port probe used when no port is configured.
 */
#include "pgt_platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <pthread.h>
#include <pwd.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#if defined(PGTEMP_PLATFORM_LINUX)
#include <sys/syscall.h>
#endif

extern char **environ; // NOLINT(readability-redundant-declaration)

namespace pgtemp::platform
{

uint64_t get_native_thread_id() noexcept
{
#if defined(PGTEMP_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(PGTEMP_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

EnvList environment_snapshot()
{
    EnvList envs;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry)
    {
        const std::string_view kv(*entry);
        const auto eq = kv.find('=');
        if (eq == std::string_view::npos)
        {
            continue;
        }
        envs.emplace_back(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    return envs;
}

std::filesystem::path home_directory()
{
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0')
    {
        return std::filesystem::path(home);
    }

    long bufsize = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufsize <= 0)
    {
        bufsize = 16384;
    }
    std::vector<char> buf(static_cast<size_t>(bufsize));
    struct passwd pwd{};
    struct passwd *result = nullptr;
    const int rc = ::getpwuid_r(::getuid(), &pwd, buf.data(), buf.size(), &result);
    if (rc != 0)
    {
        throw std::system_error(rc, std::generic_category(), "getpwuid_r");
    }
    if (result == nullptr || result->pw_dir == nullptr || *result->pw_dir == '\0')
    {
        throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                                "home directory lookup: no passwd entry for current user");
    }
    return std::filesystem::path(result->pw_dir);
}

int get_free_port()
{
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd == -1)
    {
        throw std::system_error(errno, std::generic_category(), "socket");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    int err = 0;
    const char *what = nullptr;
    int port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0)
    {
        err = errno;
        what = "bind";
    }
    else
    {
        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0)
        {
            err = errno;
            what = "getsockname";
        }
        else
        {
            port = ntohs(addr.sin_port);
        }
    }
    ::close(fd);

    if (what != nullptr)
    {
        throw std::system_error(err, std::generic_category(), what);
    }
    return port;
}

std::filesystem::path default_temporary_root()
{
    return std::filesystem::path("/tmp");
}

} // namespace pgtemp::platform
