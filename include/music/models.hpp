#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace jukebox {

// Discord ids; same width as dpp::snowflake so the bot layer converts freely
using Snowflake = std::uint64_t;

enum class TrackSource {
    Search,           // resolved from a free-text search
    Playlist,         // expanded from a playlist url
    CrossReferenced   // metadata service entry matched against a search
};

struct Track {
    std::string title;
    std::string url;
    int duration = 0;  // seconds
    std::optional<std::string> thumbnail;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    TrackSource source = TrackSource::Search;

    // Filled by TrackResolver::get_stream_url, reused afterwards
    std::optional<std::string> stream_url;

    std::string duration_formatted() const;
    std::string display_name() const;
};

struct QueueItem {
    Track track;
    Snowflake requester_id = 0;
    std::string requester_name;
    std::chrono::system_clock::time_point added_at = std::chrono::system_clock::now();
    int position = 0;  // 1-based, 1 is the current item when one is set
};

enum class LoopMode { None, Track, Queue };

struct GuildMusicState {
    bool is_playing = false;
    bool is_paused = false;  // only ever true while is_playing
    int volume = 50;
    LoopMode loop_mode = LoopMode::None;
    std::chrono::steady_clock::time_point last_activity = std::chrono::steady_clock::now();
    std::optional<Snowflake> channel_owner_id;

    void update_activity() { last_activity = std::chrono::steady_clock::now(); }
};

enum class PlayerState { Disconnected, Connecting, Idle, Playing, Paused };

// "M:SS" below an hour, "H:MM:SS" above
std::string format_track_duration(int seconds);

const char* to_string(TrackSource source);
const char* to_string(LoopMode mode);
const char* to_string(PlayerState state);

std::optional<LoopMode> parse_loop_mode(const std::string& name);

} // namespace jukebox
