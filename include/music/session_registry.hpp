#pragma once

#include "music/interfaces.hpp"
#include "music/models.hpp"
#include "music/track_queue.hpp"
#include "utils/strand.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

// Stream url resolved ahead of time for the track at the queue head
struct PreloadedStream {
    std::string track_url;
    std::string stream_url;
};

// Everything one guild's player owns. Apart from the strand itself, fields
// are only read or written by tasks running on that strand.
struct GuildSession : std::enable_shared_from_this<GuildSession> {
    GuildSession(Snowflake id, ThreadPool& pool, size_t max_queue_size, int default_volume);

    const Snowflake guild_id;
    const std::shared_ptr<Strand> strand;

    GuildMusicState state;
    TrackQueue queue;
    std::shared_ptr<VoiceSession> voice;
    std::atomic<bool> connecting{false};

    // Set while the voice session changes channel; streams it drops meanwhile
    // are restarted rather than counted as finished
    bool moving = false;

    // Held by connect() across the handshake, which runs off the strand
    std::mutex connect_mutex;

    // Overwritten by every preload, cleared when read
    std::optional<PreloadedStream> preloaded;

    int retry_count = 0;

    // The current item's stream url is being resolved off the strand
    bool loading = false;

    // Advanced on every resolution started; older results are dropped
    std::uint64_t resolve_serial = 0;

    // Advanced on every disconnect; async results from older generations are dropped
    std::uint64_t generation = 0;

    // Advanced on every play() handed to the voice session
    std::uint64_t play_serial = 0;

    // Fresh state and queue, preload and pending resolution dropped,
    // generation advanced. Does not touch the voice transport.
    void reset(size_t max_queue_size, int default_volume);
};

// Lazily creates one GuildSession per guild id
class SessionRegistry {
public:
    SessionRegistry(ThreadPool& pool, size_t max_queue_size, int default_volume);

    std::shared_ptr<GuildSession> get_or_create(Snowflake guild_id);
    std::shared_ptr<GuildSession> find(Snowflake guild_id) const;

    std::vector<std::shared_ptr<GuildSession>> all() const;
    std::vector<Snowflake> guild_ids() const;
    size_t size() const;

private:
    ThreadPool& pool_;
    size_t max_queue_size_;
    int default_volume_;

    mutable std::mutex sessions_mutex_;
    std::map<Snowflake, std::shared_ptr<GuildSession>> sessions_;
};

} // namespace jukebox
