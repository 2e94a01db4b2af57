#include <gtest/gtest.h>

#include <build_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(ferry::build_info::git_commit.empty());
    EXPECT_FALSE(ferry::build_info::git_commit_short.empty());
    EXPECT_EQ(ferry::build_info::git_commit_short.size(), 7); // typical short SHA
}

TEST(BuildInfoTest, VersionMatchesGitInfoStruct)
{
    constexpr auto info = ferry::build_info::get_git_info();
    EXPECT_EQ(info.commit, ferry::build_info::git_commit);
    EXPECT_EQ(info.dirty, ferry::build_info::git_dirty);
    EXPECT_FALSE(ferry::build_info::version.empty());
}
