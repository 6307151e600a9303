#pragma once

#include "music/interfaces.hpp"
#include "music/models.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

enum class PermissionLevel {
    User = 0,
    Moderator = 1,
    Admin = 2,
    MainAdmin = 3
};

const char* to_string(PermissionLevel level);

struct PermissionResult {
    bool allowed = false;
    std::string reason;
    PermissionLevel level = PermissionLevel::User;
};

struct PermissionConfig {
    Snowflake main_admin_id = 0;
    std::map<Snowflake, PermissionLevel> role_levels;
};

// Decides who may move, skip, stop or clear a shared session.
// Holds no session state; the directory is only used to resolve the
// channel owner's current roles.
class PermissionChecker {
public:
    PermissionChecker(PermissionConfig config, const MemberDirectory& directory);

    PermissionLevel get_level(const MemberInfo& member) const;

    PermissionResult can_use_music_commands(const MemberInfo& member) const;

    // current_channel is empty when the guild has no session yet.
    // occupants are the members of current_channel as seen right now.
    PermissionResult can_move_session(const MemberInfo& requester,
                                      Snowflake guild_id,
                                      std::optional<Snowflake> current_channel,
                                      Snowflake target_channel,
                                      std::optional<Snowflake> channel_owner_id,
                                      const std::vector<ChannelMember>& occupants) const;

    PermissionResult can_skip(const MemberInfo& member, Snowflake track_requester_id) const;
    PermissionResult can_stop(const MemberInfo& member) const;
    PermissionResult can_clear_queue(const MemberInfo& member) const;

private:
    PermissionConfig config_;
    const MemberDirectory& directory_;
};

} // namespace jukebox
