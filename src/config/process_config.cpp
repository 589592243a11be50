/**
 * @file process_config.cpp
 * @brief Merge and completion of child-process configuration.
 */
#include "config/process_config.hpp"

#include <cerrno>
#include <system_error>
#include <tuple>

#include <fcntl.h>
#include <unistd.h>

namespace pgtemp::config
{

StreamHandle stdin_handle()
{
    return StreamHandle{STDIN_FILENO, "stdin"};
}

StreamHandle stdout_handle()
{
    return StreamHandle{STDOUT_FILENO, "stdout"};
}

StreamHandle stderr_handle()
{
    return StreamHandle{STDERR_FILENO, "stderr"};
}

// ============================================================================
// NullDevice
// ============================================================================

NullDevice::NullDevice() : m_fd(::open("/dev/null", O_RDWR | O_CLOEXEC))
{
    if (m_fd == -1)
    {
        throw std::system_error(errno, std::generic_category(), "open /dev/null");
    }
}

NullDevice::~NullDevice()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
    }
}

NullDevice::NullDevice(NullDevice &&other) noexcept : m_fd(other.m_fd)
{
    other.m_fd = -1;
}

NullDevice &NullDevice::operator=(NullDevice &&other) noexcept
{
    if (this != &other)
    {
        if (m_fd != -1)
        {
            ::close(m_fd);
        }
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

StreamHandle NullDevice::handle() const
{
    return StreamHandle{m_fd, "/dev/null"};
}

// ============================================================================
// Environment and argv
// ============================================================================

EnvironmentVariables combine(const EnvironmentVariables &a, const EnvironmentVariables &b)
{
    return EnvironmentVariables{combine_last(a.inherit, b.inherit),
                                combine_map(a.specific, b.specific)};
}

Validation<EnvList> complete_environment_variables(const EnvList &envs,
                                                   const EnvironmentVariables &vars)
{
    auto inherit = utils::require("inherit", vars.inherit);
    if (inherit.is_error())
    {
        return Validation<EnvList>::failure(inherit.errors());
    }

    EnvList out;
    if (inherit.content())
    {
        out = envs;
    }
    out.reserve(out.size() + vars.specific.size());
    for (const auto &[name, value] : vars.specific)
    {
        out.emplace_back(name, value);
    }
    return Validation<EnvList>::ok(std::move(out));
}

CommandLineArgs combine(const CommandLineArgs &a, const CommandLineArgs &b)
{
    return CommandLineArgs{combine_map(a.key_based, b.key_based),
                           combine_map(a.index_based, b.index_based)};
}

std::vector<std::string> complete_command_line_args(const CommandLineArgs &args)
{
    std::vector<std::string> out;
    out.reserve(args.key_based.size() + args.index_based.size());
    for (const auto &[key, value] : args.key_based)
    {
        out.push_back(value.has_value() ? key + *value : key);
    }

    int expected = 0;
    for (const auto &[position, value] : args.index_based)
    {
        if (position != expected)
        {
            break;
        }
        out.push_back(value);
        ++expected;
    }
    return out;
}

// ============================================================================
// ProcessConfig
// ============================================================================

ProcessConfig combine(const ProcessConfig &a, const ProcessConfig &b)
{
    ProcessConfig out;
    out.environment_variables = combine(a.environment_variables, b.environment_variables);
    out.command_line = combine(a.command_line, b.command_line);
    out.std_in = combine_last(a.std_in, b.std_in);
    out.std_out = combine_last(a.std_out, b.std_out);
    out.std_err = combine_last(a.std_err, b.std_err);
    return out;
}

ProcessConfig standard_process_config()
{
    ProcessConfig cfg;
    cfg.environment_variables.inherit = true;
    cfg.std_in = stdin_handle();
    cfg.std_out = stdout_handle();
    cfg.std_err = stderr_handle();
    return cfg;
}

ProcessConfig silent_process_config(const NullDevice &null_device)
{
    ProcessConfig cfg;
    cfg.environment_variables.inherit = true;
    cfg.std_in = null_device.handle();
    cfg.std_out = null_device.handle();
    cfg.std_err = null_device.handle();
    return cfg;
}

Validation<CompleteProcessConfig> complete_process_config(const EnvList &envs,
                                                          const ProcessConfig &cfg)
{
    auto parts = utils::accumulate(complete_environment_variables(envs, cfg.environment_variables),
                                   utils::require("std_in", cfg.std_in),
                                   utils::require("std_out", cfg.std_out),
                                   utils::require("std_err", cfg.std_err));
    if (parts.is_error())
    {
        return Validation<CompleteProcessConfig>::failure(parts.errors());
    }

    auto [env, in, out, err] = std::move(parts).content();
    CompleteProcessConfig complete;
    complete.environment_variables = std::move(env);
    complete.command_line = complete_command_line_args(cfg.command_line);
    complete.std_in = std::move(in);
    complete.std_out = std::move(out);
    complete.std_err = std::move(err);
    return Validation<CompleteProcessConfig>::ok(std::move(complete));
}

} // namespace pgtemp::config
