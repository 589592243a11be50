/**
 * @file config_file.cpp
 * @brief JSON config layers and PGTEMP_* environment overrides.
 */
#include "config/config_file.hpp"

#include "utils/logger.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>
#include <string_view>

namespace pgtemp::config
{

using nlohmann::json;

namespace
{

[[noreturn]] void fail(const std::string &where, std::string_view what)
{
    throw ConfigFileError(fmt::format("Config file: '{}': {}", where, what));
}

std::string child(const std::string &where, std::string_view key)
{
    return where.empty() ? std::string(key) : fmt::format("{}.{}", where, key);
}

const json *find(const json &j, std::string_view key)
{
    const auto it = j.find(std::string(key));
    return it == j.end() ? nullptr : &*it;
}

std::string as_string(const json &j, const std::string &where)
{
    if (!j.is_string())
    {
        fail(where, "must be a string");
    }
    return j.get<std::string>();
}

bool as_bool(const json &j, const std::string &where)
{
    if (!j.is_boolean())
    {
        fail(where, "must be true or false");
    }
    return j.get<bool>();
}

int as_int(const json &j, const std::string &where)
{
    if (!j.is_number_integer())
    {
        fail(where, "must be an integer");
    }
    if (j.is_number_unsigned() &&
        j.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    {
        fail(where, "out of range");
    }
    const auto value = j.get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
    {
        fail(where, "out of range");
    }
    return static_cast<int>(value);
}

const json &as_object(const json &j, const std::string &where)
{
    if (!j.is_object())
    {
        fail(where, "must be an object");
    }
    return j;
}

int parse_port(std::string_view text, const std::string &where)
{
    int port = 0;
    const auto *end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, port);
    if (ec != std::errc{} || ptr != end)
    {
        fail(where, fmt::format("'{}' is not a port number or \"free\"", text));
    }
    return port;
}

PortChoice checked_port(int port, const std::string &where)
{
    if (port < 1 || port > 65535)
    {
        fail(where, fmt::format("port {} out of range 1-65535", port));
    }
    return PortChoice(port);
}

StreamHandle parse_stream(const json &j, const std::string &where, const NullDevice *null_device)
{
    const std::string name = as_string(j, where);
    if (name == "inherit")
    {
        if (where.ends_with("stdin"))
            return stdin_handle();
        if (where.ends_with("stdout"))
            return stdout_handle();
        return stderr_handle();
    }
    if (name == "null")
    {
        if (null_device == nullptr)
        {
            fail(where, "\"null\" requires a null device");
        }
        return null_device->handle();
    }
    fail(where, fmt::format("invalid stream '{}' (must be 'inherit' or 'null')", name));
}

DirectoryType parse_directory(const json &j, const std::string &where)
{
    const std::string value = as_string(j, where);
    if (value == "temporary")
    {
        return DirectoryType::temporary();
    }
    if (value.empty())
    {
        fail(where, "must be \"temporary\" or a path");
    }
    return DirectoryType::permanent(value);
}

ProcessConfig parse_process(const json &j, const std::string &where, const NullDevice *null_device)
{
    as_object(j, where);
    ProcessConfig cfg;

    if (const json *v = find(j, "inherit_environment"))
    {
        cfg.environment_variables.inherit = as_bool(*v, child(where, "inherit_environment"));
    }
    if (const json *v = find(j, "environment"))
    {
        const std::string env_where = child(where, "environment");
        for (const auto &[name, value] : as_object(*v, env_where).items())
        {
            cfg.environment_variables.specific[name] = as_string(value, child(env_where, name));
        }
    }
    if (const json *v = find(j, "args"))
    {
        const std::string args_where = child(where, "args");
        for (const auto &[key, value] : as_object(*v, args_where).items())
        {
            if (value.is_null())
            {
                cfg.command_line.key_based[key] = std::nullopt;
            }
            else
            {
                cfg.command_line.key_based[key] = as_string(value, child(args_where, key));
            }
        }
    }
    if (const json *v = find(j, "positional"))
    {
        const std::string pos_where = child(where, "positional");
        if (!v->is_array())
        {
            fail(pos_where, "must be an array of strings");
        }
        for (size_t i = 0; i < v->size(); ++i)
        {
            cfg.command_line.index_based[static_cast<int>(i)] =
                as_string((*v)[i], fmt::format("{}[{}]", pos_where, i));
        }
    }
    for (std::string_view stream : {"stdin", "stdout", "stderr"})
    {
        const json *v = find(j, stream);
        if (v == nullptr)
        {
            continue;
        }
        StreamHandle handle = parse_stream(*v, child(where, stream), null_device);
        if (stream == "stdin")
            cfg.std_in = std::move(handle);
        else if (stream == "stdout")
            cfg.std_out = std::move(handle);
        else
            cfg.std_err = std::move(handle);
    }
    return cfg;
}

ConnectionOptions parse_connection(const json &j, const std::string &where)
{
    as_object(j, where);
    ConnectionOptions opts;
    auto str = [&](std::string_view key, std::optional<std::string> &out) {
        if (const json *v = find(j, key))
            out = as_string(*v, child(where, key));
    };
    auto num = [&](std::string_view key, std::optional<int> &out) {
        if (const json *v = find(j, key))
            out = as_int(*v, child(where, key));
    };
    str("host", opts.host);
    num("port", opts.port);
    str("dbname", opts.dbname);
    str("user", opts.user);
    str("password", opts.password);
    num("connect_timeout", opts.connect_timeout);
    str("application_name", opts.application_name);
    str("sslmode", opts.sslmode);
    return opts;
}

Plan parse_plan(const json &j, const std::string &where, const NullDevice *null_device)
{
    as_object(j, where);
    Plan plan;

    if (const json *v = find(j, "logger"))
    {
        const std::string logger_where = child(where, "logger");
        const std::string kind = as_string(*v, logger_where);
        if (kind == "default")
            plan.logger = default_plan_logger();
        else if (kind == "silent")
            plan.logger = silent_plan_logger();
        else
            fail(logger_where, fmt::format("invalid logger '{}' (must be 'default' or 'silent')", kind));
    }
    if (const json *v = find(j, "initdb"))
    {
        plan.init_db_config = parse_process(*v, child(where, "initdb"), null_device);
    }
    if (const json *v = find(j, "createdb"))
    {
        plan.create_db_config = parse_process(*v, child(where, "createdb"), null_device);
    }
    if (const json *v = find(j, "postgres"))
    {
        const std::string pg_where = child(where, "postgres");
        plan.postgres_plan.postgres_config = parse_process(*v, pg_where, null_device);
        if (const json *c = find(*v, "connection"))
        {
            plan.postgres_plan.connection_options = parse_connection(*c, child(pg_where, "connection"));
        }
    }
    if (const json *v = find(j, "config_file"))
    {
        const std::string cf_where = child(where, "config_file");
        if (!v->is_array())
        {
            fail(cf_where, "must be an array of strings");
        }
        for (size_t i = 0; i < v->size(); ++i)
        {
            plan.postgres_config_file.push_back(as_string((*v)[i], fmt::format("{}[{}]", cf_where, i)));
        }
    }
    if (const json *v = find(j, "data_directory"))
    {
        plan.data_directory = as_string(*v, child(where, "data_directory"));
    }
    if (const json *v = find(j, "connection_timeout_ms"))
    {
        const std::string t_where = child(where, "connection_timeout_ms");
        const int ms = as_int(*v, t_where);
        if (ms <= 0)
        {
            fail(t_where, "must be positive");
        }
        plan.connection_timeout = std::chrono::milliseconds(ms);
    }
    if (const json *v = find(j, "initdb_cache"))
    {
        const std::string c_where = child(where, "initdb_cache");
        if (v->is_null())
        {
            plan.init_db_cache.emplace(std::nullopt);
        }
        else
        {
            as_object(*v, c_where);
            InitDbCache cache;
            if (const json *cow = find(*v, "copy_on_write"))
                cache.copy_on_write = as_bool(*cow, child(c_where, "copy_on_write"));
            const json *dir = find(*v, "directory");
            if (dir == nullptr)
            {
                fail(child(c_where, "directory"), "is required");
            }
            cache.cache_directory = as_string(*dir, child(c_where, "directory"));
            plan.init_db_cache.emplace(std::move(cache));
        }
    }
    return plan;
}

} // namespace

Config config_from_json(const json &j, const NullDevice *null_device)
{
    as_object(j, "<root>");
    Config cfg;

    if (const json *v = find(j, "plan"))
    {
        cfg.plan = parse_plan(*v, "plan", null_device);
    }
    if (const json *v = find(j, "socket_directory"))
    {
        cfg.socket_directory = parse_directory(*v, "socket_directory");
    }
    if (const json *v = find(j, "data_directory"))
    {
        cfg.data_directory = parse_directory(*v, "data_directory");
    }
    if (const json *v = find(j, "port"))
    {
        if (v->is_string() && v->get<std::string>() == "free")
            cfg.port.emplace(std::nullopt);
        else
            cfg.port.emplace(checked_port(as_int(*v, "port"), "port"));
    }
    if (const json *v = find(j, "temporary_directory"))
    {
        cfg.temporary_directory = as_string(*v, "temporary_directory");
    }
    return cfg;
}

Config load_config_file(const std::filesystem::path &path, const NullDevice *null_device)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw ConfigFileError(fmt::format("Config file: cannot open '{}'", path.string()));
    }

    json j;
    try
    {
        j = json::parse(in);
    }
    catch (const json::parse_error &ex)
    {
        throw ConfigFileError(fmt::format("Config file: '{}': {}", path.string(), ex.what()));
    }
    PGTEMP_LOG_DEBUG("loaded config file {}", path.string());
    return config_from_json(j, null_device);
}

Config environment_overrides(const EnvList &envs)
{
    Config cfg;
    for (const auto &[name, value] : envs)
    {
        if (value.empty())
        {
            continue;
        }
        if (name == "PGTEMP_PORT")
        {
            if (value == "free")
                cfg.port.emplace(std::nullopt);
            else
                cfg.port.emplace(checked_port(parse_port(value, name), name));
        }
        else if (name == "PGTEMP_TEMP_DIR")
        {
            cfg.temporary_directory = value;
        }
        else if (name == "PGTEMP_DATA_DIR")
        {
            cfg.data_directory = DirectoryType::permanent(value);
        }
        else if (name == "PGTEMP_SOCKET_DIR")
        {
            cfg.socket_directory = DirectoryType::permanent(value);
        }
    }
    return cfg;
}

} // namespace pgtemp::config
