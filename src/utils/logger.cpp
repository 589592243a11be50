/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the synchronous logger.
 ******************************************************************************/

#include "utils/logger.hpp"

#include "pgt_platform.hpp"
#include "utils/format_tools.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <new>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

using namespace pgtemp::format_tools;

namespace pgtemp::utils
{

namespace
{
constexpr int kLogFileMode = 0644;

const char *level_to_string(Logger::Level lvl) noexcept
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE:
        return "TRACE";
    case Logger::Level::L_DEBUG:
        return "DEBUG";
    case Logger::Level::L_INFO:
        return "INFO";
    case Logger::Level::L_WARNING:
        return "WARN";
    case Logger::Level::L_ERROR:
        return "ERROR";
    case Logger::Level::L_SYSTEM:
        return "SYSTEM";
    }
    return "UNK";
}

/// Writes the whole buffer, retrying on EINTR and short writes.
/// @return 0 on success, otherwise the errno of the failing write.
int write_all(int fd, const std::string &data) noexcept
{
    size_t off = 0;
    while (off < data.size())
    {
        const ssize_t w = ::write(fd, data.data() + off, data.size() - off);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            return errno;
        }
        off += static_cast<size_t>(w);
    }
    return 0;
}
} // anonymous namespace

struct Logger::Impl
{
    std::mutex mtx;
    std::atomic<int> level{static_cast<int>(Logger::Level::L_INFO)};
    int file_fd = -1; ///< -1 means the console sink (stderr).
    std::string file_path;
    std::function<void(const std::string &)> write_error_cb;

    ~Impl()
    {
        if (file_fd != -1)
        {
            ::close(file_fd);
        }
    }
};

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger inst;
    return inst;
}

void Logger::set_console()
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    if (pImpl->file_fd != -1)
    {
        ::close(pImpl->file_fd);
        pImpl->file_fd = -1;
        pImpl->file_path.clear();
    }
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    const int fd = ::open(utf8_path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC,
                          static_cast<mode_t>(kLogFileMode));
    if (fd == -1)
    {
        const int err = errno;
        PGTEMP_LOG_ERROR("Logger: cannot open log file '{}': {}", utf8_path, std::strerror(err));
        return false;
    }

    std::lock_guard<std::mutex> g(pImpl->mtx);
    if (pImpl->file_fd != -1)
    {
        ::close(pImpl->file_fd);
    }
    pImpl->file_fd = fd;
    pImpl->file_path = utf8_path;
    return true;
}

void Logger::flush()
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    if (pImpl->file_fd != -1)
    {
        ::fsync(pImpl->file_fd);
    }
}

void Logger::set_level(Level lvl)
{
    pImpl->level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return static_cast<Level>(pImpl->level.load(std::memory_order_relaxed));
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> g(pImpl->mtx);
    pImpl->write_error_cb = std::move(cb);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= pImpl->level.load(std::memory_order_relaxed);
}

void Logger::log_line(Level lvl, std::string_view body) noexcept
{
    if (!should_log(lvl))
        return;
    try
    {
        write_line(lvl, std::string(body));
    }
    catch (const std::bad_alloc &)
    {
        // Nothing sensible can be reported without memory.
    }
}

void Logger::write_line(Level lvl, std::string &&body) noexcept
{
    std::function<void(const std::string &)> cb;
    std::string failure;
    try
    {
        std::string line = fmt::format("[{}] [{:<6}] [tid={}] {}\n",
                                       formatted_time(std::chrono::system_clock::now()),
                                       level_to_string(lvl), platform::get_native_thread_id(),
                                       body);

        std::lock_guard<std::mutex> g(pImpl->mtx);
        const int fd = pImpl->file_fd != -1 ? pImpl->file_fd : STDERR_FILENO;
        const int err = write_all(fd, line);
        if (err != 0 && pImpl->write_error_cb)
        {
            cb = pImpl->write_error_cb;
            failure = fmt::format("Logger: write to '{}' failed: {}",
                                  pImpl->file_fd != -1 ? pImpl->file_path : "stderr",
                                  std::strerror(err));
        }
    }
    catch (const std::exception &ex)
    {
        std::fprintf(stderr, "[LOGGER] failed to format log line: %s\n", ex.what());
        return;
    }

    if (cb)
    {
        try
        {
            cb(failure);
        }
        catch (const std::exception &ex)
        {
            std::fprintf(stderr, "[LOGGER] write error callback threw: %s\n", ex.what());
        }
    }
}

Logger::Level parse_level(std::string_view name)
{
    if (name == "trace")
        return Logger::Level::L_TRACE;
    if (name == "debug")
        return Logger::Level::L_DEBUG;
    if (name == "info")
        return Logger::Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Logger::Level::L_WARNING;
    if (name == "error")
        return Logger::Level::L_ERROR;
    if (name == "system")
        return Logger::Level::L_SYSTEM;
    throw std::invalid_argument("unknown log level '" + std::string(name) + "'");
}

} // namespace pgtemp::utils
