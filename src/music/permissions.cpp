#include "music/permissions.hpp"
#include <algorithm>
#include <iostream>

namespace jukebox {

const char* to_string(PermissionLevel level) {
    switch (level) {
        case PermissionLevel::User: return "user";
        case PermissionLevel::Moderator: return "moderator";
        case PermissionLevel::Admin: return "admin";
        case PermissionLevel::MainAdmin: return "main admin";
    }
    return "unknown";
}

PermissionChecker::PermissionChecker(PermissionConfig config, const MemberDirectory& directory)
    : config_(std::move(config)), directory_(directory) {
    // A zero role id means "not configured"
    config_.role_levels.erase(0);
}

PermissionLevel PermissionChecker::get_level(const MemberInfo& member) const {
    if (config_.main_admin_id != 0 && member.user_id == config_.main_admin_id) {
        return PermissionLevel::MainAdmin;
    }

    PermissionLevel max_level = PermissionLevel::User;
    for (Snowflake role_id : member.role_ids) {
        auto it = config_.role_levels.find(role_id);
        if (it != config_.role_levels.end() && it->second > max_level) {
            max_level = it->second;
        }
    }
    return max_level;
}

PermissionResult PermissionChecker::can_use_music_commands(const MemberInfo& member) const {
    return {true, "", get_level(member)};
}

PermissionResult PermissionChecker::can_move_session(const MemberInfo& requester,
                                                     Snowflake guild_id,
                                                     std::optional<Snowflake> current_channel,
                                                     Snowflake target_channel,
                                                     std::optional<Snowflake> channel_owner_id,
                                                     const std::vector<ChannelMember>& occupants) const {
    PermissionLevel level = get_level(requester);

    if (!current_channel) {
        return {true, "The player is free", level};
    }

    if (*current_channel == target_channel) {
        return {true, "The player is already in this channel", level};
    }

    if (level == PermissionLevel::MainAdmin) {
        std::cout << "[music] Main admin " << requester.name << " moves the player in guild "
                  << guild_id << std::endl;
        return {true, "Main administrator", level};
    }

    if (!channel_owner_id) {
        return {true, "The session has no owner", level};
    }

    if (requester.user_id == *channel_owner_id) {
        return {true, "Session owner", level};
    }

    bool has_listeners = std::any_of(occupants.begin(), occupants.end(),
                                     [](const ChannelMember& m) { return !m.is_bot; });
    if (!has_listeners) {
        return {true, "The current channel is empty", level};
    }

    // The owner's roles may have changed since the session started.
    // An owner who left the guild cannot be outranked; the session frees up
    // once its channel empties.
    auto owner = directory_.find_member(guild_id, *channel_owner_id);
    if (owner) {
        PermissionLevel owner_level = get_level(*owner);
        if (level > owner_level) {
            std::cout << "[music] " << requester.name << " (" << to_string(level) << ") takes the player from "
                      << owner->name << " (" << to_string(owner_level) << ")" << std::endl;
            return {true, "Higher permission level than the session owner", level};
        }
    }

    return {false,
            "The player is already in use in another channel. "
            "Wait until it is free or ask someone with higher permissions.",
            level};
}

PermissionResult PermissionChecker::can_skip(const MemberInfo& member, Snowflake track_requester_id) const {
    PermissionLevel level = get_level(member);

    if (member.user_id == track_requester_id) {
        return {true, "Track requester", level};
    }

    if (level >= PermissionLevel::Moderator) {
        return {true, "Moderator permissions", level};
    }

    return {false, "You can only skip your own tracks", level};
}

PermissionResult PermissionChecker::can_stop(const MemberInfo& member) const {
    PermissionLevel level = get_level(member);

    if (level >= PermissionLevel::Moderator) {
        return {true, "Moderator permissions", level};
    }

    // Anyone in the session may stop it
    return {true, "", level};
}

PermissionResult PermissionChecker::can_clear_queue(const MemberInfo& member) const {
    PermissionLevel level = get_level(member);

    if (level >= PermissionLevel::Moderator) {
        return {true, "Moderator permissions", level};
    }

    return {false, "Not enough permissions to clear the queue", level};
}

} // namespace jukebox
