/*******************************************************************************
 * @file logger.hpp
 * @brief Thread-safe, synchronous logging utility.
 *
 * A process-wide Logger writes one formatted line per call to the active sink
 * (stderr by default, or an append-only file). Each line is assembled into a
 * single buffer and written with one call, so lines from concurrent threads
 * never interleave.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * PGTEMP_LOG_INFO("socket directory {} ready", path.string());
 *
 * Logger &logger = Logger::instance();
 * logger.set_logfile("/tmp/pgtemp.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/

#pragma once

#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef PGTEMP_LOGGER_FMT_BUFFER_RESERVE
#define PGTEMP_LOGGER_FMT_BUFFER_RESERVE (512u)
#endif

namespace pgtemp::utils
{

class Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    /// Switch logging to stderr.
    void set_console();

    /**
     * @brief Switch logging to a file, opened for append.
     * @return false if the file cannot be opened; the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path);

    /// Waits until everything written so far has reached the OS.
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback invoked when writing a line fails.
     * @param cb Receives a description of the failure. Called with the logger's
     *           internal lock released.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    /// Writes an already formatted body.
    void log_line(Level lvl, std::string_view body) noexcept;

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    void write_line(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

/// Parses "trace", "debug", "info", "warn"/"warning", "error", "system".
/// @throws std::invalid_argument on anything else.
Logger::Level parse_level(std::string_view name);

// --- Compile-Time Log Level ---
#ifndef PGTEMP_LOG_COMPILE_LEVEL
#define PGTEMP_LOG_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= PGTEMP_LOG_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(PGTEMP_LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            write_line(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            write_line(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace pgtemp::utils

#define PGTEMP_LOG_TRACE(fmt, ...)                                                                 \
    ::pgtemp::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define PGTEMP_LOG_DEBUG(fmt, ...)                                                                 \
    ::pgtemp::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define PGTEMP_LOG_INFO(fmt, ...)                                                                  \
    ::pgtemp::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define PGTEMP_LOG_WARN(fmt, ...)                                                                  \
    ::pgtemp::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define PGTEMP_LOG_ERROR(fmt, ...)                                                                 \
    ::pgtemp::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define PGTEMP_LOG_SYSTEM(fmt, ...)                                                                \
    ::pgtemp::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
