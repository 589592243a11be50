#include "config/config.hpp"

#include <string>

namespace pgtemp::config
{

namespace
{
Plan dbname_to_plan(const std::optional<std::string> &user,
                    const std::optional<std::string> &password, const std::string &dbname)
{
    if (dbname == "postgres" || dbname == "template1")
    {
        return Plan{};
    }
    ProcessConfig create_db;
    create_db.command_line.index_based[0] = dbname;
    if (user.has_value())
    {
        create_db.command_line.key_based["--username="] = *user;
    }
    if (password.has_value())
    {
        create_db.environment_variables.specific["PGPASSWORD"] = *password;
    }
    Plan plan;
    plan.create_db_config = std::move(create_db);
    return plan;
}

Plan user_to_plan(const std::string &user)
{
    ProcessConfig init_db;
    init_db.command_line.key_based["--username="] = user;
    Plan plan;
    plan.init_db_config = std::move(init_db);
    return plan;
}

Plan password_to_plan(const std::string &password)
{
    ProcessConfig init_db;
    init_db.environment_variables.specific["PGPASSWORD"] = password;
    Plan plan;
    plan.init_db_config = std::move(init_db);
    return plan;
}
} // namespace

Config combine(const Config &a, const Config &b)
{
    Config out;
    out.plan = combine(a.plan, b.plan);
    out.socket_directory = combine(a.socket_directory, b.socket_directory);
    out.data_directory = combine(a.data_directory, b.data_directory);
    out.port = combine_last(a.port, b.port);
    out.temporary_directory = combine_last(a.temporary_directory, b.temporary_directory);
    return out;
}

DirectoryType host_to_socket_class(std::string_view host)
{
    if (!host.empty() && host.front() == '/')
    {
        return DirectoryType::permanent(std::string(host));
    }
    return DirectoryType::temporary();
}

Plan options_to_plan(const ConnectionOptions &opts)
{
    Plan plan;
    if (opts.dbname.has_value())
    {
        plan = combine(plan, dbname_to_plan(opts.user, opts.password, *opts.dbname));
    }
    if (opts.user.has_value())
    {
        plan = combine(plan, user_to_plan(*opts.user));
    }
    if (opts.password.has_value())
    {
        plan = combine(plan, password_to_plan(*opts.password));
    }
    Plan client;
    client.postgres_plan.connection_options = opts;
    return combine(plan, client);
}

Config options_to_config(const ConnectionOptions &opts)
{
    Config cfg;
    cfg.plan = options_to_plan(opts);
    if (opts.port.has_value())
    {
        cfg.port.emplace(*opts.port);
    }
    if (opts.host.has_value())
    {
        cfg.socket_directory = host_to_socket_class(*opts.host);
    }
    return cfg;
}

} // namespace pgtemp::config
