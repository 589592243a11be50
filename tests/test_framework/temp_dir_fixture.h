#pragma once
/**
 * @file temp_dir_fixture.h
 * @brief A fixture giving each test its own scratch directory.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace pgtemp::tests::helper
{

/// Number of directory entries directly under @p dir, 0 if it does not exist.
size_t count_entries(const std::filesystem::path &dir);

class TempDirFixture : public ::testing::Test
{
  protected:
    void SetUp() override;
    void TearDown() override;

    /// The scratch root, unique per test, removed in TearDown().
    const std::filesystem::path &root() const { return m_root; }

  private:
    std::filesystem::path m_root;
};

} // namespace pgtemp::tests::helper
