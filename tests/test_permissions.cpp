#include <gtest/gtest.h>

#include "fakes.hpp"
#include "music/permissions.hpp"

namespace jukebox {
namespace {

constexpr Snowflake kGuild = 1;
constexpr Snowflake kMainAdmin = 99;
constexpr Snowflake kModRole = 500;
constexpr Snowflake kAdminRole = 600;
constexpr Snowflake kChannelA = 10;
constexpr Snowflake kChannelB = 20;

class PermissionTest : public ::testing::Test {
protected:
    PermissionTest() : checker_(make_config(), members_) {}

    static PermissionConfig make_config() {
        PermissionConfig config;
        config.main_admin_id = kMainAdmin;
        config.role_levels[kModRole] = PermissionLevel::Moderator;
        config.role_levels[kAdminRole] = PermissionLevel::Admin;
        return config;
    }

    PermissionResult move(const MemberInfo& requester, std::optional<Snowflake> owner,
                          std::vector<ChannelMember> occupants = {{1000, false}}) {
        return checker_.can_move_session(requester, kGuild, kChannelA, kChannelB, owner, occupants);
    }

    testing::FakeMemberDirectory members_;
    PermissionChecker checker_;
};

TEST_F(PermissionTest, LevelFromRolesAndMainAdmin) {
    EXPECT_EQ(checker_.get_level(members_.add(1)), PermissionLevel::User);
    EXPECT_EQ(checker_.get_level(members_.add(2, {kModRole})), PermissionLevel::Moderator);
    EXPECT_EQ(checker_.get_level(members_.add(3, {kModRole, kAdminRole})), PermissionLevel::Admin);
    EXPECT_EQ(checker_.get_level(members_.add(kMainAdmin)), PermissionLevel::MainAdmin);
}

TEST_F(PermissionTest, ZeroRoleIdIsIgnored) {
    PermissionConfig config;
    config.role_levels[0] = PermissionLevel::Admin;
    PermissionChecker checker(config, members_);

    EXPECT_EQ(checker.get_level(members_.add(1, {0})), PermissionLevel::User);
}

TEST_F(PermissionTest, MoveAllowedWithoutSession) {
    auto user = members_.add(1);
    auto result = checker_.can_move_session(user, kGuild, std::nullopt, kChannelB, std::nullopt, {});
    EXPECT_TRUE(result.allowed);
}

TEST_F(PermissionTest, MoveToSameChannelAllowed) {
    members_.add(2);
    auto user = members_.add(1);
    auto result = checker_.can_move_session(user, kGuild, kChannelA, kChannelA, Snowflake{2},
                                            {{2, false}});
    EXPECT_TRUE(result.allowed);
}

TEST_F(PermissionTest, MoveAllowedWithoutOwner) {
    EXPECT_TRUE(move(members_.add(1), std::nullopt).allowed);
}

TEST_F(PermissionTest, OwnerMayMove) {
    auto owner = members_.add(1);
    EXPECT_TRUE(move(owner, Snowflake{1}).allowed);
}

TEST_F(PermissionTest, MainAdminMayAlwaysMove) {
    members_.add(1, {kAdminRole});
    auto result = move(members_.add(kMainAdmin), Snowflake{1});
    EXPECT_TRUE(result.allowed);
    EXPECT_EQ(result.level, PermissionLevel::MainAdmin);
}

TEST_F(PermissionTest, EqualLevelDenied) {
    members_.add(1);
    auto result = move(members_.add(2), Snowflake{1});
    EXPECT_FALSE(result.allowed);
    EXPECT_FALSE(result.reason.empty());

    members_.add(3, {kModRole});
    EXPECT_FALSE(move(members_.add(4, {kModRole}), Snowflake{3}).allowed);
}

TEST_F(PermissionTest, LowerLevelDenied) {
    members_.add(1, {kAdminRole});
    EXPECT_FALSE(move(members_.add(2, {kModRole}), Snowflake{1}).allowed);
}

TEST_F(PermissionTest, HigherLevelAllowed) {
    members_.add(1);
    EXPECT_TRUE(move(members_.add(2, {kModRole}), Snowflake{1}).allowed);

    members_.add(3, {kModRole});
    EXPECT_TRUE(move(members_.add(4, {kAdminRole}), Snowflake{3}).allowed);
}

// Only bots left in the old channel
TEST_F(PermissionTest, EmptyChannelMayBeTaken) {
    members_.add(1, {kAdminRole});
    auto result = move(members_.add(2), Snowflake{1}, {{777, true}});
    EXPECT_TRUE(result.allowed);
}

// Owner demoted since the session started
TEST_F(PermissionTest, OwnerLevelIsReadNow) {
    members_.add(1, {kAdminRole});
    auto requester = members_.add(2, {kModRole});
    EXPECT_FALSE(move(requester, Snowflake{1}).allowed);

    members_.add(1);
    EXPECT_TRUE(move(requester, Snowflake{1}).allowed);
}

TEST_F(PermissionTest, OwnerWhoLeftCannotBeOutranked) {
    members_.remove(1);
    EXPECT_FALSE(move(members_.add(2, {kModRole}), Snowflake{1}).allowed);
    EXPECT_FALSE(move(members_.add(3, {kAdminRole}), Snowflake{1}).allowed);
    EXPECT_FALSE(move(members_.add(4), Snowflake{1}).allowed);

    // Still free once nobody listens in the old channel
    EXPECT_TRUE(move(members_.add(5), Snowflake{1}, {{777, true}}).allowed);
    EXPECT_TRUE(move(members_.add(kMainAdmin), Snowflake{1}).allowed);
}

TEST_F(PermissionTest, SkipRules) {
    auto user = members_.add(1);
    auto moderator = members_.add(2, {kModRole});

    EXPECT_TRUE(checker_.can_skip(user, 1).allowed);
    EXPECT_FALSE(checker_.can_skip(user, 5).allowed);
    EXPECT_TRUE(checker_.can_skip(moderator, 5).allowed);
}

TEST_F(PermissionTest, ClearNeedsModerator) {
    EXPECT_FALSE(checker_.can_clear_queue(members_.add(1)).allowed);
    EXPECT_TRUE(checker_.can_clear_queue(members_.add(2, {kModRole})).allowed);
    EXPECT_TRUE(checker_.can_clear_queue(members_.add(kMainAdmin)).allowed);
}

TEST_F(PermissionTest, StopOpenToEveryone) {
    EXPECT_TRUE(checker_.can_stop(members_.add(1)).allowed);
    EXPECT_TRUE(checker_.can_stop(members_.add(2, {kModRole})).allowed);
    EXPECT_TRUE(checker_.can_use_music_commands(members_.add(3)).allowed);
}

} // namespace
} // namespace jukebox
