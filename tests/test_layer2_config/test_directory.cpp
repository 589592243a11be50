// tests/test_layer2_config/test_directory.cpp
/**
 * @file test_directory.cpp
 * @brief Tests for directory acquisition, home expansion and crash-safe release.
 */
#include "pgt_config.hpp"
#include "temp_dir_fixture.h"

#include <gtest/gtest.h>

#include <csignal>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <pthread.h>

namespace fs = std::filesystem;
using namespace pgtemp::config;
using pgtemp::tests::helper::count_entries;
using pgtemp::tests::helper::TempDirFixture;

namespace
{
class DirectoryTest : public TempDirFixture
{
};

fs::path fake_home()
{
    return fs::path("/home/tester");
}

fs::path no_home()
{
    throw std::runtime_error("home lookup must not be called");
}
} // namespace

TEST(ExpandHomeTest, ExpandsLeadingTilde)
{
    EXPECT_EQ(expand_home("~", fake_home), fs::path("/home/tester"));
    EXPECT_EQ(expand_home("~/data", fake_home), fs::path("/home/tester/data"));
    EXPECT_EQ(expand_home("~data", fake_home), fs::path("/home/tester/data"));
}

TEST(ExpandHomeTest, OtherPathsAreVerbatim)
{
    EXPECT_EQ(expand_home("/srv/pg", no_home), fs::path("/srv/pg"));
    EXPECT_EQ(expand_home("relative/~x", no_home), fs::path("relative/~x"));
}

// A temporary directory is created under the root with the requested prefix.
TEST_F(DirectoryTest, TemporaryIsCreatedUnderRoot)
{
    const auto dir = setup_directory_type(root(), "tmp-postgres-data", DirectoryType::temporary());

    ASSERT_TRUE(dir.is_temporary());
    EXPECT_TRUE(fs::is_directory(dir.path()));
    EXPECT_EQ(dir.path().parent_path(), root());
    EXPECT_EQ(dir.path().filename().string().rfind("tmp-postgres-data", 0), 0u);
}

// Two acquisitions with the same prefix never collide.
TEST_F(DirectoryTest, TemporaryNamesAreUnique)
{
    const auto a = setup_directory_type(root(), "tmp-postgres-socket", DirectoryType::temporary());
    const auto b = setup_directory_type(root(), "tmp-postgres-socket", DirectoryType::temporary());
    EXPECT_NE(a.path(), b.path());
    EXPECT_EQ(count_entries(root()), 2u);
}

// A permanent directory is resolved, never created.
TEST_F(DirectoryTest, PermanentIsNotCreated)
{
    const fs::path target = root() / "caller-owned";
    const auto dir = setup_directory_type(root(), "unused", DirectoryType::permanent(target.string()),
                                          create_temp_directory, no_home);

    EXPECT_FALSE(dir.is_temporary());
    EXPECT_EQ(dir.path(), target);
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(DirectoryTest, PermanentExpandsHome)
{
    const auto dir = setup_directory_type(root(), "unused", DirectoryType::permanent("~/pg"),
                                          create_temp_directory, fake_home);
    EXPECT_EQ(dir.path(), fs::path("/home/tester/pg"));
}

TEST_F(DirectoryTest, TemporaryCreationFailureThrows)
{
    EXPECT_THROW((void)setup_directory_type(root() / "no-such-parent", "tmp-postgres-data",
                                            DirectoryType::temporary()),
                 std::system_error);
}

// Release removes the tree and leaves no "_removing" sibling behind.
TEST_F(DirectoryTest, CleanupRemovesTemporaryTree)
{
    const auto dir = setup_directory_type(root(), "tmp-postgres-data", DirectoryType::temporary());
    fs::create_directories(dir.path() / "base" / "1");
    std::ofstream(dir.path() / "base" / "1" / "file") << "payload";

    cleanup_directory_type(dir);

    EXPECT_FALSE(fs::exists(dir.path()));
    EXPECT_EQ(count_entries(root()), 0u);
}

TEST_F(DirectoryTest, CleanupIsIdempotent)
{
    const auto dir = setup_directory_type(root(), "tmp-postgres-data", DirectoryType::temporary());
    EXPECT_NO_THROW(cleanup_directory_type(dir));
    EXPECT_NO_THROW(cleanup_directory_type(dir));
}

TEST_F(DirectoryTest, CleanupOfExternallyRemovedDirectorySucceeds)
{
    const auto dir = setup_directory_type(root(), "tmp-postgres-data", DirectoryType::temporary());
    fs::remove_all(dir.path());
    EXPECT_NO_THROW(cleanup_directory_type(dir));
}

TEST_F(DirectoryTest, CleanupLeavesPermanentAlone)
{
    const fs::path target = root() / "keep";
    fs::create_directory(target);

    cleanup_directory_type(CompleteDirectoryType::permanent(target));
    EXPECT_TRUE(fs::is_directory(target));
}

TEST_F(DirectoryTest, MakePermanentPreventsRemoval)
{
    const auto dir = setup_directory_type(root(), "tmp-postgres-data", DirectoryType::temporary());
    const auto kept = make_permanent(dir);

    EXPECT_FALSE(kept.is_temporary());
    EXPECT_EQ(kept.path(), dir.path());
    cleanup_directory_type(kept);
    EXPECT_TRUE(fs::is_directory(dir.path()));
}

// A "_removing" sibling left by an interrupted release does not block the next one.
TEST_F(DirectoryTest, CleanupReplacesStaleRemovingSibling)
{
    const auto dir = setup_directory_type(root(), "tmp-postgres-data", DirectoryType::temporary());
    fs::path stale = dir.path();
    stale += "_removing";
    fs::create_directories(stale / "leftover");
    std::ofstream(dir.path() / "file") << "payload";

    cleanup_directory_type(dir);

    EXPECT_FALSE(fs::exists(dir.path()));
    EXPECT_FALSE(fs::exists(stale));
}

// The calling thread's signal mask is unchanged after a release.
TEST_F(DirectoryTest, CleanupRestoresSignalMask)
{
    sigset_t before;
    sigset_t after;
    ASSERT_EQ(::pthread_sigmask(SIG_SETMASK, nullptr, &before), 0);

    const auto dir = setup_directory_type(root(), "tmp-postgres-socket", DirectoryType::temporary());
    cleanup_directory_type(dir);

    ASSERT_EQ(::pthread_sigmask(SIG_SETMASK, nullptr, &after), 0);
    EXPECT_EQ(sigismember(&before, SIGINT), sigismember(&after, SIGINT));
    EXPECT_EQ(sigismember(&before, SIGTERM), sigismember(&after, SIGTERM));
    EXPECT_EQ(sigismember(&before, SIGHUP), sigismember(&after, SIGHUP));
}
