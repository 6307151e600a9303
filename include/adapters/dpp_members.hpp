#pragma once

#include "music/interfaces.hpp"
#include <dpp/dpp.h>
#include <optional>

namespace jukebox {

// Member lookups answered from the D++ guild cache
class DppMemberDirectory : public MemberDirectory {
public:
    std::optional<MemberInfo> find_member(Snowflake guild_id, Snowflake user_id) const override;

    static MemberInfo from_member(const dpp::guild_member& member, const dpp::user* user);
};

} // namespace jukebox
