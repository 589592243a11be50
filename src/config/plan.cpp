/**
 * @file plan.cpp
 * @brief Plan merge, generation and completion.
 */
#include "config/plan.hpp"

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <fmt/format.h>

#include <tuple>

namespace pgtemp::config
{

PlanLogger default_plan_logger()
{
    return [](std::string_view line) { PGTEMP_LOG_INFO("{}", line); };
}

PlanLogger silent_plan_logger()
{
    return [](std::string_view) {};
}

PostgresPlan combine(const PostgresPlan &a, const PostgresPlan &b)
{
    return PostgresPlan{combine(a.postgres_config, b.postgres_config),
                        combine(a.connection_options, b.connection_options)};
}

Validation<CompletePostgresPlan> complete_postgres_plan(const EnvList &envs, const PostgresPlan &plan)
{
    auto process = complete_process_config(envs, plan.postgres_config).with_context("postgres_config: ");
    if (process.is_error())
    {
        return Validation<CompletePostgresPlan>::failure(process.errors());
    }
    return Validation<CompletePostgresPlan>::ok(
        CompletePostgresPlan{std::move(process).content(), plan.connection_options});
}

Plan combine(const Plan &a, const Plan &b)
{
    Plan out;
    out.logger = combine_last(a.logger, b.logger);
    out.init_db_config = combine_nested(a.init_db_config, b.init_db_config);
    out.create_db_config = combine_nested(a.create_db_config, b.create_db_config);
    out.postgres_plan = combine(a.postgres_plan, b.postgres_plan);
    out.postgres_config_file = combine_append(a.postgres_config_file, b.postgres_config_file);
    out.data_directory = combine_last(a.data_directory, b.data_directory);
    out.connection_timeout = combine_last(a.connection_timeout, b.connection_timeout);
    out.init_db_cache = combine_last(a.init_db_cache, b.init_db_cache);
    return out;
}

bool has_init_db(const Plan &plan)
{
    return plan.init_db_config.has_value();
}

bool has_create_db(const Plan &plan)
{
    return plan.create_db_config.has_value();
}

Validation<CompletePlan> complete_plan(const EnvList &envs, const Plan &plan)
{
    auto complete_sub = [&envs](const ProcessConfig &cfg) { return complete_process_config(envs, cfg); };

    auto parts = utils::accumulate(
        utils::require("logger", plan.logger),
        utils::complete_optional(plan.init_db_config, complete_sub).with_context("init_db_config: "),
        utils::complete_optional(plan.create_db_config, complete_sub).with_context("create_db_config: "),
        complete_postgres_plan(envs, plan.postgres_plan).with_context("postgres_plan: "),
        utils::require("data_directory", plan.data_directory),
        utils::require("connection_timeout", plan.connection_timeout),
        utils::require("init_db_cache", plan.init_db_cache));
    if (parts.is_error())
    {
        return Validation<CompletePlan>::failure(parts.errors());
    }

    auto [logger, init_db, create_db, postgres, data_dir, timeout, cache] = std::move(parts).content();
    CompletePlan complete;
    complete.logger = std::move(logger);
    complete.init_db_config = std::move(init_db);
    complete.create_db_config = std::move(create_db);
    complete.postgres_plan = std::move(postgres);
    complete.config = format_tools::join_lines(plan.postgres_config_file);
    complete.data_directory = std::move(data_dir);
    complete.connection_timeout = timeout;
    complete.init_db_cache = std::move(cache);
    return Validation<CompletePlan>::ok(std::move(complete));
}

std::vector<std::string> socket_directory_to_config(const std::string &socket_dir)
{
    return {
        "listen_addresses = '127.0.0.1, ::1'",
        fmt::format("unix_socket_directories = '{}'", socket_dir),
    };
}

Plan generate_plan(bool make_init_db, bool make_create_db, int port, const std::string &socket_dir,
                   const std::string &data_dir)
{
    const std::string port_str = std::to_string(port);

    Plan plan;
    plan.postgres_config_file = socket_directory_to_config(socket_dir);
    plan.data_directory = data_dir;
    plan.connection_timeout = kDefaultConnectionTimeout;
    plan.logger = default_plan_logger();
    plan.init_db_cache.emplace(std::nullopt);

    plan.postgres_plan.postgres_config = standard_process_config();
    plan.postgres_plan.postgres_config.command_line.key_based = {
        {"-p", port_str},
        {"-D", data_dir},
    };
    plan.postgres_plan.connection_options.host = socket_dir;
    plan.postgres_plan.connection_options.port = port;
    plan.postgres_plan.connection_options.dbname = "postgres";

    if (make_create_db)
    {
        ProcessConfig create_db = standard_process_config();
        create_db.command_line.key_based = {
            {"-h", socket_dir},
            {"-p", port_str},
        };
        plan.create_db_config = std::move(create_db);
    }
    if (make_init_db)
    {
        ProcessConfig init_db = standard_process_config();
        init_db.command_line.key_based = {{"--pgdata=", data_dir}};
        plan.init_db_config = std::move(init_db);
    }
    return plan;
}

} // namespace pgtemp::config
