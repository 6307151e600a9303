#pragma once

#include "music/models.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

// Looks tracks up and turns them into playable stream urls.
// Implementations may block; the player calls them off the caller's thread.
class TrackResolver {
public:
    virtual ~TrackResolver() = default;

    // Url of a single item or a free-text query (first search hit)
    virtual std::optional<Track> resolve_track(const std::string& url_or_query) = 0;
    virtual std::vector<Track> resolve_playlist(const std::string& url, int max_tracks) = 0;
    virtual std::vector<Track> search(const std::string& query, int max_results) = 0;

    // Idempotent. Caches the result in track.stream_url.
    virtual std::optional<std::string> get_stream_url(Track& track) = 0;

    // Whether resolve_playlist understands this url
    virtual bool is_playlist_url(const std::string& url) const { (void)url; return false; }
};

struct ChannelMember {
    Snowflake user_id = 0;
    bool is_bot = false;
};

// Invoked once per play() call, from the transport's own thread.
// An empty error means the stream ended or was stopped.
using FinishedCallback = std::function<void(const std::optional<std::string>& error)>;

class VoiceSession {
public:
    virtual ~VoiceSession() = default;

    // May end the stream in flight, whose FinishedCallback then fires as usual
    virtual bool move(Snowflake channel_id) = 0;

    // Replaces whatever is playing
    virtual bool play(const std::string& stream_url, int volume, FinishedCallback on_finished) = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;

    // Ends the current stream; its FinishedCallback still fires
    virtual void stop() = 0;
    virtual void disconnect() = 0;

    // 0-100, applied to the stream in flight
    virtual void set_volume(int volume) = 0;

    virtual bool is_connected() const = 0;
    virtual bool is_playing() const = 0;
    virtual bool is_paused() const = 0;

    virtual Snowflake channel_id() const = 0;
    virtual std::vector<ChannelMember> channel_occupants() const = 0;
};

class VoiceGateway {
public:
    virtual ~VoiceGateway() = default;

    // Returns nullptr on failure or when the timeout expires
    virtual std::shared_ptr<VoiceSession> connect(Snowflake guild_id, Snowflake channel_id,
                                                  std::chrono::milliseconds timeout) = 0;
};

struct MemberInfo {
    Snowflake user_id = 0;
    std::string name;
    std::vector<Snowflake> role_ids;
    bool is_bot = false;
};

class MemberDirectory {
public:
    virtual ~MemberDirectory() = default;

    virtual std::optional<MemberInfo> find_member(Snowflake guild_id, Snowflake user_id) const = 0;
};

} // namespace jukebox
