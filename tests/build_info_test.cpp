#include <gtest/gtest.h>

#include <build_info.hpp>

TEST(BuildInfoTest, VersionIsStamped)
{
    EXPECT_FALSE(smartmig::build_info::version.empty());
    EXPECT_NE(smartmig::build_info::version.find('.'), std::string_view::npos);
}

TEST(BuildInfoTest, CommitIsKnownOrMarkedUnknown)
{
    EXPECT_FALSE(smartmig::build_info::git_commit.empty());
    if (smartmig::build_info::git_commit != "unknown") {
        EXPECT_EQ(smartmig::build_info::git_commit.substr(0, 7), smartmig::build_info::git_commit_short);
    }
}
