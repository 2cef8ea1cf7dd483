#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(parcp::build_info::git_commit.empty());
    EXPECT_FALSE(parcp::build_info::git_commit_short.empty());
    EXPECT_EQ(parcp::build_info::git_commit_short.size(), 7u);
}

TEST(BuildInfoTest, StructMatchesConstants)
{
    constexpr auto info = parcp::build_info::get_git_info();
    static_assert(info.commit == parcp::build_info::git_commit);
    EXPECT_EQ(info.dirty, parcp::build_info::git_dirty);
    EXPECT_FALSE(info.timestamp.empty());
}
