#include "music/session_registry.hpp"

namespace jukebox {

GuildSession::GuildSession(Snowflake id, ThreadPool& pool, size_t max_queue_size, int default_volume)
    : guild_id(id),
      strand(std::make_shared<Strand>(pool)),
      queue(max_queue_size) {
    state.volume = default_volume;
}

void GuildSession::reset(size_t max_queue_size, int default_volume) {
    state = GuildMusicState{};
    state.volume = default_volume;
    queue = TrackQueue(max_queue_size);
    connecting = false;
    moving = false;
    preloaded.reset();
    retry_count = 0;
    loading = false;
    ++generation;
}

SessionRegistry::SessionRegistry(ThreadPool& pool, size_t max_queue_size, int default_volume)
    : pool_(pool), max_queue_size_(max_queue_size), default_volume_(default_volume) {}

std::shared_ptr<GuildSession> SessionRegistry::get_or_create(Snowflake guild_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(guild_id);
    if (it == sessions_.end()) {
        it = sessions_.emplace(guild_id,
                               std::make_shared<GuildSession>(guild_id, pool_, max_queue_size_, default_volume_))
                 .first;
    }
    return it->second;
}

std::shared_ptr<GuildSession> SessionRegistry::find(Snowflake guild_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(guild_id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<GuildSession>> SessionRegistry::all() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<std::shared_ptr<GuildSession>> result;
    result.reserve(sessions_.size());
    for (const auto& [guild_id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

std::vector<Snowflake> SessionRegistry::guild_ids() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<Snowflake> ids;
    ids.reserve(sessions_.size());
    for (const auto& [guild_id, session] : sessions_) {
        ids.push_back(guild_id);
    }
    return ids;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

} // namespace jukebox
