/**
 * @file render.cpp
 * @brief nlohmann::json rendering of configuration values.
 */
#include "config/render.hpp"

#include <fmt/format.h>

#include <map>
#include <string>
#include <string_view>

namespace pgtemp::config
{

using nlohmann::json;

namespace
{
constexpr int kIndent = 2;

template <typename T>
json optional_to_json(const std::optional<T> &value)
{
    return value.has_value() ? json(*value) : json(nullptr);
}

constexpr std::string_view kMasked = "********";

bool is_secret(std::string_view name)
{
    return name == "PGPASSWORD";
}

json env_list_to_json(const EnvList &envs)
{
    json out = json::array();
    for (const auto &[name, value] : envs)
    {
        out.push_back(fmt::format("{}={}", name, is_secret(name) ? kMasked : std::string_view(value)));
    }
    return out;
}

json env_map_to_json(const std::map<std::string, std::string> &specific)
{
    json out = json::object();
    for (const auto &[name, value] : specific)
    {
        out[name] = is_secret(name) ? std::string(kMasked) : value;
    }
    return out;
}

json port_to_json(const std::optional<PortChoice> &port)
{
    if (!port.has_value())
    {
        return nullptr;
    }
    return port->has_value() ? json(**port) : json("free");
}
} // namespace

void to_json(json &j, const StreamHandle &handle)
{
    j = fmt::format("[HANDLE fd={}]", handle.fd);
}

void to_json(json &j, const EnvironmentVariables &vars)
{
    j = json{{"inherit", optional_to_json(vars.inherit)}, {"specific", env_map_to_json(vars.specific)}};
}

void to_json(json &j, const CommandLineArgs &args)
{
    json keyed = json::object();
    for (const auto &[key, value] : args.key_based)
    {
        keyed[key] = optional_to_json(value);
    }
    json indexed = json::object();
    for (const auto &[position, value] : args.index_based)
    {
        indexed[std::to_string(position)] = value;
    }
    j = json{{"key_based", std::move(keyed)}, {"index_based", std::move(indexed)}};
}

void to_json(json &j, const ProcessConfig &cfg)
{
    j = json{{"environment_variables", cfg.environment_variables},
             {"command_line", cfg.command_line},
             {"std_in", optional_to_json(cfg.std_in)},
             {"std_out", optional_to_json(cfg.std_out)},
             {"std_err", optional_to_json(cfg.std_err)}};
}

void to_json(json &j, const CompleteProcessConfig &cfg)
{
    j = json{{"environment_variables", env_list_to_json(cfg.environment_variables)},
             {"command_line", cfg.command_line},
             {"std_in", cfg.std_in},
             {"std_out", cfg.std_out},
             {"std_err", cfg.std_err}};
}

void to_json(json &j, const ConnectionOptions &opts)
{
    j = json{{"host", optional_to_json(opts.host)},
             {"port", optional_to_json(opts.port)},
             {"dbname", optional_to_json(opts.dbname)},
             {"user", optional_to_json(opts.user)},
             {"password", opts.password.has_value() ? json(std::string(kMasked)) : json(nullptr)},
             {"connect_timeout", optional_to_json(opts.connect_timeout)},
             {"application_name", optional_to_json(opts.application_name)},
             {"sslmode", optional_to_json(opts.sslmode)}};
}

void to_json(json &j, const DirectoryType &dir)
{
    j = dir.is_permanent() ? json{{"permanent", dir.path()}} : json("temporary");
}

void to_json(json &j, const CompleteDirectoryType &dir)
{
    j = json{{dir.is_temporary() ? "temporary" : "permanent", dir.path().string()}};
}

void to_json(json &j, const InitDbCache &cache)
{
    j = json{{"copy_on_write", cache.copy_on_write}, {"cache_directory", cache.cache_directory.string()}};
}

void to_json(json &j, const PostgresPlan &plan)
{
    j = json{{"postgres_config", plan.postgres_config},
             {"connection_options", plan.connection_options}};
}

void to_json(json &j, const Plan &plan)
{
    json cache = nullptr;
    if (plan.init_db_cache.has_value())
    {
        cache = plan.init_db_cache->has_value() ? json(**plan.init_db_cache) : json("none");
    }
    j = json{{"logger", plan.logger.has_value() ? json("[LOGGER]") : json(nullptr)},
             {"init_db_config", optional_to_json(plan.init_db_config)},
             {"create_db_config", optional_to_json(plan.create_db_config)},
             {"postgres_plan", plan.postgres_plan},
             {"postgres_config_file", plan.postgres_config_file},
             {"data_directory", optional_to_json(plan.data_directory)},
             {"connection_timeout_us",
              plan.connection_timeout.has_value() ? json(plan.connection_timeout->count()) : json(nullptr)},
             {"init_db_cache", std::move(cache)}};
}

void to_json(json &j, const CompletePostgresPlan &plan)
{
    j = json{{"process_config", plan.process_config}, {"connection_options", plan.connection_options}};
}

void to_json(json &j, const CompletePlan &plan)
{
    j = json{{"logger", "[LOGGER]"},
             {"init_db_config", optional_to_json(plan.init_db_config)},
             {"create_db_config", optional_to_json(plan.create_db_config)},
             {"postgres_plan", plan.postgres_plan},
             {"config", plan.config},
             {"data_directory", plan.data_directory.string()},
             {"connection_timeout_us", plan.connection_timeout.count()},
             {"init_db_cache", plan.init_db_cache.has_value() ? json(*plan.init_db_cache) : json("none")}};
}

void to_json(json &j, const Config &cfg)
{
    j = json{{"plan", cfg.plan},
             {"socket_directory", cfg.socket_directory},
             {"data_directory", cfg.data_directory},
             {"port", port_to_json(cfg.port)},
             {"temporary_directory",
              cfg.temporary_directory.has_value() ? json(cfg.temporary_directory->string()) : json(nullptr)}};
}

void to_json(json &j, const Resources &resources)
{
    j = json{{"plan", resources.plan},
             {"socket_directory", resources.socket_directory},
             {"data_directory", resources.data_directory},
             {"temporary_directory", resources.temporary_directory.string()}};
}

std::string render_plan(const Plan &plan)
{
    return json(plan).dump(kIndent, ' ', false, json::error_handler_t::replace);
}

std::string render_config(const Config &config)
{
    return json(config).dump(kIndent, ' ', false, json::error_handler_t::replace);
}

std::string render_resources(const Resources &resources)
{
    return json(resources).dump(kIndent, ' ', false, json::error_handler_t::replace);
}

} // namespace pgtemp::config
