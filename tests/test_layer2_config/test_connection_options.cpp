// tests/test_layer2_config/test_connection_options.cpp
#include "pgt_config.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace pgtemp::config;

TEST(ConnectionOptionsTest, CombineRightWinsPerField)
{
    ConnectionOptions a;
    a.host = "/tmp/s";
    a.port = 5432;
    a.dbname = "postgres";

    ConnectionOptions b;
    b.port = 6543;
    b.user = "alice";

    const ConnectionOptions merged = combine(a, b);
    EXPECT_EQ(merged.host, "/tmp/s");
    EXPECT_EQ(merged.port, 6543);
    EXPECT_EQ(merged.dbname, "postgres");
    EXPECT_EQ(merged.user, "alice");
    EXPECT_FALSE(merged.password.has_value());
    EXPECT_EQ(combine(ConnectionOptions{}, a), a);
}

TEST(ConnectionOptionsTest, ConnectionStringOmitsUnsetKeys)
{
    ConnectionOptions opts;
    opts.host = "/tmp/s";
    opts.port = 5433;
    opts.dbname = "postgres";
    EXPECT_EQ(to_connection_string(opts), "host=/tmp/s port=5433 dbname=postgres");
    EXPECT_EQ(to_connection_string(ConnectionOptions{}), "");
}

// Values with spaces or quotes are quoted the way libpq expects.
TEST(ConnectionOptionsTest, ConnectionStringQuotesValues)
{
    ConnectionOptions opts;
    opts.user = "alice";
    opts.password = "it's secret";
    opts.application_name = "";
    EXPECT_EQ(to_connection_string(opts), "user=alice password='it\\'s secret' application_name=''");
}
