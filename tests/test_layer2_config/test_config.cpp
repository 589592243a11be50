// tests/test_layer2_config/test_config.cpp
/**
 * @file test_config.cpp
 * @brief Tests for Config merging and the connection-options helpers.
 */
#include "pgt_config.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace pgtemp::config;

TEST(ConfigTest, CombineMergesEveryField)
{
    Config a;
    a.port.emplace(5432);
    a.temporary_directory = "/var/tmp";
    a.plan.data_directory = "/a";

    Config b;
    b.port.emplace(std::nullopt); // force a free port
    b.data_directory = DirectoryType::permanent("/srv/pg");

    const Config merged = combine(a, b);
    ASSERT_TRUE(merged.port.has_value());
    EXPECT_FALSE(merged.port->has_value());
    EXPECT_EQ(merged.temporary_directory, std::filesystem::path("/var/tmp"));
    EXPECT_EQ(merged.plan.data_directory, "/a");
    EXPECT_EQ(merged.data_directory, DirectoryType::permanent("/srv/pg"));
    EXPECT_EQ(merged.socket_directory, DirectoryType::temporary());
}

// An unset port in the override keeps the base choice.
TEST(ConfigTest, UnsetPortKeepsBase)
{
    Config a;
    a.port.emplace(5432);
    const Config merged = combine(a, Config{});
    ASSERT_TRUE(merged.port.has_value());
    EXPECT_EQ(*merged.port, PortChoice(5432));
}

TEST(ConfigTest, HostToSocketClass)
{
    EXPECT_EQ(host_to_socket_class("/var/run/postgresql"), DirectoryType::permanent("/var/run/postgresql"));
    EXPECT_EQ(host_to_socket_class("localhost"), DirectoryType::temporary());
    EXPECT_EQ(host_to_socket_class(""), DirectoryType::temporary());
}

TEST(OptionsToPlanTest, UserAndPasswordConfigureInitDb)
{
    ConnectionOptions opts;
    opts.user = "alice";
    opts.password = "secret";

    const Plan plan = options_to_plan(opts);
    ASSERT_TRUE(has_init_db(plan));
    EXPECT_FALSE(has_create_db(plan));
    EXPECT_EQ(plan.init_db_config->command_line.key_based.at("--username="), "alice");
    EXPECT_EQ(plan.init_db_config->environment_variables.specific.at("PGPASSWORD"), "secret");
    EXPECT_EQ(plan.postgres_plan.connection_options, opts);
}

TEST(OptionsToPlanTest, CustomDbnameAddsCreateDb)
{
    ConnectionOptions opts;
    opts.dbname = "testdb";
    opts.user = "alice";
    opts.password = "secret";

    const Plan plan = options_to_plan(opts);
    ASSERT_TRUE(has_create_db(plan));
    const ProcessConfig &create_db = *plan.create_db_config;
    EXPECT_EQ(complete_command_line_args(create_db.command_line),
              (std::vector<std::string>{"--username=alice", "testdb"}));
    EXPECT_EQ(create_db.environment_variables.specific.at("PGPASSWORD"), "secret");
}

// "postgres" and "template1" always exist, so no createdb step is added.
TEST(OptionsToPlanTest, BuiltinDbnamesSkipCreateDb)
{
    for (const char *name : {"postgres", "template1"})
    {
        ConnectionOptions opts;
        opts.dbname = name;
        EXPECT_FALSE(has_create_db(options_to_plan(opts))) << name;
    }
}

TEST(OptionsToConfigTest, PortAndSocketDirectory)
{
    ConnectionOptions opts;
    opts.host = "/run/pg";
    opts.port = 6000;

    const Config cfg = options_to_config(opts);
    ASSERT_TRUE(cfg.port.has_value());
    EXPECT_EQ(*cfg.port, PortChoice(6000));
    EXPECT_EQ(cfg.socket_directory, DirectoryType::permanent("/run/pg"));
    EXPECT_EQ(cfg.plan.postgres_plan.connection_options.host, "/run/pg");
}

TEST(OptionsToConfigTest, EmptyOptionsLeaveEverythingUnset)
{
    const Config cfg = options_to_config(ConnectionOptions{});
    EXPECT_FALSE(cfg.port.has_value());
    EXPECT_EQ(cfg.socket_directory, DirectoryType::temporary());
    EXPECT_FALSE(has_init_db(cfg.plan));
    EXPECT_FALSE(has_create_db(cfg.plan));
}
