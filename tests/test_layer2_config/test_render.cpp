// tests/test_layer2_config/test_render.cpp
/**
 * @file test_render.cpp
 * @brief Tests for the JSON diagnostics of plans, configs and resources.
 */
#include "pgt_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace pgtemp::config;
using nlohmann::json;

TEST(RenderTest, HandlesAndLoggersArePlaceholders)
{
    EXPECT_EQ(json(StreamHandle{2, "stderr"}), json("[HANDLE fd=2]"));

    const json plan = json(generate_plan(false, false, 5433, "/tmp/s", "/tmp/d"));
    EXPECT_EQ(plan["logger"], "[LOGGER]");
    EXPECT_EQ(plan["postgres_plan"]["postgres_config"]["std_out"], "[HANDLE fd=1]");
    EXPECT_TRUE(plan["init_db_config"].is_null());
    EXPECT_EQ(plan["init_db_cache"], "none");
    EXPECT_EQ(plan["connection_timeout_us"], 60'000'000);
    EXPECT_EQ(plan["postgres_plan"]["postgres_config"]["command_line"]["key_based"]["-p"], "5433");
}

TEST(RenderTest, EmptyPlanRendersNulls)
{
    const json plan = json(Plan{});
    EXPECT_TRUE(plan["logger"].is_null());
    EXPECT_TRUE(plan["data_directory"].is_null());
    EXPECT_TRUE(plan["init_db_cache"].is_null());
    EXPECT_TRUE(plan["postgres_plan"]["postgres_config"]["std_in"].is_null());
    EXPECT_TRUE(plan["postgres_plan"]["postgres_config"]["environment_variables"]["inherit"].is_null());
}

TEST(RenderTest, PasswordIsMasked)
{
    ConnectionOptions opts;
    opts.user = "alice";
    opts.password = "hunter2";

    const json j = json(opts);
    EXPECT_EQ(j["user"], "alice");
    EXPECT_EQ(j["password"], "********");
    EXPECT_TRUE(j["host"].is_null());
    EXPECT_EQ(json(opts).dump().find("hunter2"), std::string::npos);
}

TEST(RenderTest, ConfigPortAndDirectories)
{
    Config cfg;
    EXPECT_TRUE(json(cfg)["port"].is_null());

    cfg.port.emplace(std::nullopt);
    cfg.data_directory = DirectoryType::permanent("/srv/pg");
    const json j = json::parse(render_config(cfg));
    EXPECT_EQ(j["port"], "free");
    EXPECT_EQ(j["socket_directory"], "temporary");
    EXPECT_EQ(j["data_directory"]["permanent"], "/srv/pg");

    cfg.port.emplace(6000);
    EXPECT_EQ(json(cfg)["port"], 6000);
}

TEST(RenderTest, CompletedPlanAndResources)
{
    auto completed = complete_plan({{"PATH", "/bin"}}, generate_plan(true, false, 5433, "/tmp/s", "/tmp/d"));
    ASSERT_TRUE(completed.is_ok());

    const Resources resources{std::move(completed).content(),
                              CompleteDirectoryType::temporary("/tmp/s"),
                              CompleteDirectoryType::permanent("/tmp/d"), "/tmp"};
    const json j = json::parse(render_resources(resources));

    EXPECT_EQ(j["socket_directory"]["temporary"], "/tmp/s");
    EXPECT_EQ(j["data_directory"]["permanent"], "/tmp/d");
    EXPECT_EQ(j["temporary_directory"], "/tmp");
    EXPECT_EQ(j["plan"]["data_directory"], "/tmp/d");
    EXPECT_EQ(j["plan"]["init_db_cache"], "none");
    EXPECT_EQ(j["plan"]["postgres_plan"]["process_config"]["environment_variables"],
              json::array({"PATH=/bin"}));
    EXPECT_TRUE(j["plan"]["create_db_config"].is_null());
    EXPECT_TRUE(j["plan"]["init_db_config"]["command_line"].is_array());
}

TEST(RenderTest, RenderPlanIsIndentedJson)
{
    const std::string text = render_plan(Plan{});
    EXPECT_NE(text.find("\n  \""), std::string::npos) << text;
    EXPECT_NO_THROW((void)json::parse(text));
}

// PGPASSWORD is masked wherever an environment is rendered.
TEST(RenderTest, PgPasswordEnvironmentIsMasked)
{
    ConnectionOptions opts;
    opts.dbname = "testdb";
    opts.password = "hunter2";
    const Plan partial = options_to_plan(opts);

    const json j = json(partial);
    EXPECT_EQ(j["init_db_config"]["environment_variables"]["specific"]["PGPASSWORD"], "********");
    EXPECT_EQ(j["create_db_config"]["environment_variables"]["specific"]["PGPASSWORD"], "********");
    EXPECT_EQ(render_plan(partial).find("hunter2"), std::string::npos);

    const Plan merged = combine(generate_plan(true, true, 5433, "/tmp/s", "/tmp/d"), partial);
    auto completed = complete_plan({{"PGPASSWORD", "hunter2"}, {"PATH", "/bin"}}, merged);
    ASSERT_TRUE(completed.is_ok()) << ::testing::PrintToString(completed.errors());
    const Resources resources{std::move(completed).content(), CompleteDirectoryType::temporary("/tmp/s"),
                              CompleteDirectoryType::temporary("/tmp/d"), "/tmp"};
    const std::string text = render_resources(resources);
    EXPECT_EQ(text.find("hunter2"), std::string::npos) << text;
    EXPECT_NE(text.find("PGPASSWORD=********"), std::string::npos);
    EXPECT_NE(text.find("PATH=/bin"), std::string::npos);
}

// An inherited environment value that is not UTF-8 does not break rendering.
TEST(RenderTest, NonUtf8EnvironmentValueIsReplaced)
{
    auto completed =
        complete_plan({{"LEGACY", "caf\xe9"}}, generate_plan(false, false, 5433, "/tmp/s", "/tmp/d"));
    ASSERT_TRUE(completed.is_ok());
    const Resources resources{std::move(completed).content(), CompleteDirectoryType::temporary("/tmp/s"),
                              CompleteDirectoryType::temporary("/tmp/d"), "/tmp"};

    std::string text;
    ASSERT_NO_THROW(text = render_resources(resources));
    const json j = json::parse(text);
    EXPECT_EQ(j["plan"]["postgres_plan"]["process_config"]["environment_variables"][0],
              "LEGACY=caf\xef\xbf\xbd");

    Plan plan;
    plan.data_directory = "/data/caf\xe9";
    EXPECT_NO_THROW((void)render_plan(plan));
    Config cfg;
    cfg.temporary_directory = "/tmp/caf\xe9";
    EXPECT_NO_THROW((void)render_config(cfg));
}
