// tests/test_layer2_config/test_partial.cpp
/**
 * @file test_partial.cpp
 * @brief Tests for the override-merge algebra: right-wins, identity and associativity.
 */
#include "pgt_config.hpp"
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace pgtemp::config;

namespace
{
EnvironmentVariables env(std::optional<bool> inherit, std::map<std::string, std::string> specific)
{
    return EnvironmentVariables{inherit, std::move(specific)};
}
} // namespace

TEST(PartialTest, CombineLastRightmostSetWins)
{
    const std::optional<int> unset;
    EXPECT_EQ(combine_last(std::optional<int>(1), std::optional<int>(2)), 2);
    EXPECT_EQ(combine_last(std::optional<int>(1), unset), 1);
    EXPECT_EQ(combine_last(unset, std::optional<int>(2)), 2);
    EXPECT_FALSE(combine_last(unset, unset).has_value());
}

TEST(PartialTest, CombineMapRightWinsOnCollision)
{
    const std::map<std::string, int> a{{"x", 1}, {"y", 1}};
    const std::map<std::string, int> b{{"y", 2}, {"z", 2}};
    EXPECT_EQ(combine_map(a, b), (std::map<std::string, int>{{"x", 1}, {"y", 2}, {"z", 2}}));
}

TEST(PartialTest, CombineAppendKeepsOrder)
{
    EXPECT_EQ(combine_append(std::vector<int>{1, 2}, std::vector<int>{3}), (std::vector<int>{1, 2, 3}));
}

// Absent sub-records never erase present ones; two present ones merge field-wise.
TEST(PartialTest, CombineNestedMergesSubRecords)
{
    const std::optional<EnvironmentVariables> unset;
    const std::optional<EnvironmentVariables> a = env(true, {{"A", "1"}});
    const std::optional<EnvironmentVariables> b = env(std::nullopt, {{"B", "2"}});

    EXPECT_EQ(combine_nested(a, unset), a);
    EXPECT_EQ(combine_nested(unset, b), b);
    EXPECT_EQ(combine_nested(a, b), env(true, {{"A", "1"}, {"B", "2"}}));
}

TEST(PartialTest, EnvironmentVariablesIdentityAndAssociativity)
{
    const EnvironmentVariables a = env(true, {{"A", "1"}, {"K", "a"}});
    const EnvironmentVariables b = env(false, {{"K", "b"}});
    const EnvironmentVariables c = env(std::nullopt, {{"C", "3"}, {"K", "c"}});

    EXPECT_EQ(combine(EnvironmentVariables{}, a), a);
    EXPECT_EQ(combine(a, EnvironmentVariables{}), a);
    EXPECT_EQ(combine(combine(a, b), c), combine(a, combine(b, c)));
    EXPECT_EQ(combine_layers(a, b, c), combine(combine(a, b), c));
}

TEST(PartialTest, CommandLineArgsAssociativity)
{
    CommandLineArgs a;
    a.key_based = {{"-p", "1"}, {"--flag", std::nullopt}};
    a.index_based = {{0, "a0"}};
    CommandLineArgs b;
    b.key_based = {{"-p", "2"}};
    b.index_based = {{0, "b0"}, {1, "b1"}};
    CommandLineArgs c;
    c.key_based = {{"--flag", "on"}};
    c.index_based = {{2, "c2"}};

    EXPECT_EQ(combine(combine(a, b), c), combine(a, combine(b, c)));
    EXPECT_EQ(combine(CommandLineArgs{}, a), a);
    EXPECT_EQ(combine(a, CommandLineArgs{}), a);
}

// Permanent beats Temporary in either position; of two Permanents the right one wins.
TEST(PartialTest, DirectoryTypeMergeTable)
{
    const auto tmp = DirectoryType::temporary();
    const auto p = DirectoryType::permanent("/p");
    const auto q = DirectoryType::permanent("/q");

    EXPECT_EQ(combine(tmp, tmp), tmp);
    EXPECT_EQ(combine(tmp, p), p);
    EXPECT_EQ(combine(p, tmp), p);
    EXPECT_EQ(combine(p, q), q);
    EXPECT_EQ(DirectoryType{}, tmp);
}

TEST(PartialTest, DirectoryTypeAssociativity)
{
    const std::vector<DirectoryType> values{DirectoryType::temporary(), DirectoryType::permanent("/p"),
                                            DirectoryType::permanent("/q")};
    for (const auto &a : values)
        for (const auto &b : values)
            for (const auto &c : values)
                EXPECT_EQ(combine(combine(a, b), c), combine(a, combine(b, c)));
}

TEST(PartialTest, ProcessConfigOverrideWins)
{
    ProcessConfig base = standard_process_config();
    base.command_line.key_based["-p"] = "5432";

    ProcessConfig over;
    over.std_out = StreamHandle{42, "custom"};
    over.command_line.key_based["-p"] = "6543";
    over.environment_variables.inherit = false;

    const ProcessConfig merged = combine(base, over);
    EXPECT_EQ(merged.std_out, (StreamHandle{42, "custom"}));
    EXPECT_EQ(merged.std_in, stdin_handle());
    EXPECT_EQ(merged.std_err, stderr_handle());
    EXPECT_EQ(merged.command_line.key_based.at("-p"), "6543");
    EXPECT_EQ(merged.environment_variables.inherit, false);
}
