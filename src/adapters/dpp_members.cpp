#include "adapters/dpp_members.hpp"

namespace jukebox {

std::optional<MemberInfo> DppMemberDirectory::find_member(Snowflake guild_id, Snowflake user_id) const {
    dpp::guild* guild = dpp::find_guild(guild_id);
    if (!guild) {
        return std::nullopt;
    }

    auto it = guild->members.find(user_id);
    if (it == guild->members.end()) {
        return std::nullopt;
    }

    return from_member(it->second, dpp::find_user(user_id));
}

MemberInfo DppMemberDirectory::from_member(const dpp::guild_member& member, const dpp::user* user) {
    MemberInfo info;
    info.user_id = member.user_id;

    for (const auto& role : member.get_roles()) {
        info.role_ids.push_back(role);
    }

    if (!member.get_nickname().empty()) {
        info.name = member.get_nickname();
    } else if (user) {
        info.name = user->global_name.empty() ? user->username : user->global_name;
    }

    if (user) {
        info.is_bot = user->is_bot();
    }
    return info;
}

} // namespace jukebox
