#include "config/connection_options.hpp"

#include "utils/format_tools.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string_view>
#include <vector>

namespace pgtemp::config
{

ConnectionOptions combine(const ConnectionOptions &a, const ConnectionOptions &b)
{
    ConnectionOptions out;
    out.host = combine_last(a.host, b.host);
    out.port = combine_last(a.port, b.port);
    out.dbname = combine_last(a.dbname, b.dbname);
    out.user = combine_last(a.user, b.user);
    out.password = combine_last(a.password, b.password);
    out.connect_timeout = combine_last(a.connect_timeout, b.connect_timeout);
    out.application_name = combine_last(a.application_name, b.application_name);
    out.sslmode = combine_last(a.sslmode, b.sslmode);
    return out;
}

std::string to_connection_string(const ConnectionOptions &opts)
{
    std::vector<std::string> parts;
    auto add = [&parts](std::string_view key, const std::optional<std::string> &value) {
        if (value.has_value())
        {
            parts.push_back(fmt::format("{}={}", key, format_tools::quote_conninfo_value(*value)));
        }
    };
    auto add_int = [&parts](std::string_view key, const std::optional<int> &value) {
        if (value.has_value())
        {
            parts.push_back(fmt::format("{}={}", key, *value));
        }
    };

    add("host", opts.host);
    add_int("port", opts.port);
    add("dbname", opts.dbname);
    add("user", opts.user);
    add("password", opts.password);
    add_int("connect_timeout", opts.connect_timeout);
    add("application_name", opts.application_name);
    add("sslmode", opts.sslmode);
    return fmt::format("{}", fmt::join(parts, " "));
}

} // namespace pgtemp::config
