#pragma once

#include "music/events.hpp"
#include "music/interfaces.hpp"
#include "music/models.hpp"
#include "music/session_registry.hpp"
#include "music/track_queue.hpp"
#include "utils/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace jukebox {

struct PlayerOptions {
    std::chrono::seconds inactivity_timeout{300};
    std::chrono::seconds sweep_interval{60};
    std::chrono::milliseconds connect_timeout{10000};
    size_t max_queue_size = 100;
    int default_volume = 50;
    int max_retries = 3;
    size_t worker_threads = 4;
    size_t resolver_threads = 4;
};

// What a connect request sees of the session before it goes ahead
struct ConnectContext {
    std::optional<Snowflake> current_channel;
    std::optional<Snowflake> owner_id;
    std::vector<ChannelMember> occupants;
};

// Runs on the session's strand; returning false refuses the connect
using ConnectGate = std::function<bool(const ConnectContext& context)>;

// Read-only copy of a session, taken inside its strand
struct QueueSnapshot {
    std::optional<QueueItem> current;
    std::vector<QueueItem> items;
    std::vector<QueueItem> history;
    int total_duration = 0;
    GuildMusicState state;
    PlayerState player_state = PlayerState::Disconnected;
    Snowflake channel_id = 0;
};

// Owns every guild's queue and playback. Each call runs inside the guild's
// strand and returns once it has been applied there, so user commands,
// track completions and the inactivity sweep never interleave on a session.
class MusicPlayer {
public:
    MusicPlayer(TrackResolver& resolver, VoiceGateway& gateway, PlayerOptions options = {});
    ~MusicPlayer();

    MusicPlayer(const MusicPlayer&) = delete;
    MusicPlayer& operator=(const MusicPlayer&) = delete;

    void set_event_handler(SessionEventHandler handler);

    // Connection lifecycle. The handshake or move runs on the calling thread
    // with the strand free, so the session keeps serving other calls and a
    // stop() issued meanwhile wins. Returns nullptr when the gate refuses.
    std::shared_ptr<VoiceSession> connect(Snowflake guild_id, Snowflake channel_id, Snowflake requester_id,
                                          const ConnectGate& gate = nullptr);
    void disconnect(Snowflake guild_id);
    void stop(Snowflake guild_id);

    // Playback
    std::optional<QueueItem> play(Snowflake guild_id, const Track& track,
                                  Snowflake requester_id, const std::string& requester_name);
    std::vector<QueueItem> play_multiple(Snowflake guild_id, const std::vector<Track>& tracks,
                                         Snowflake requester_id, const std::string& requester_name);

    // Returns the queue head at call time. Loop modes or a failed
    // resolution can make the track that actually follows differ.
    std::optional<QueueItem> skip(Snowflake guild_id);

    bool pause(Snowflake guild_id);
    bool resume(Snowflake guild_id);

    // Returns true when applied to a stream in flight
    bool set_volume(Snowflake guild_id, int volume);

    void set_loop_mode(Snowflake guild_id, LoopMode mode);
    LoopMode get_loop_mode(Snowflake guild_id);

    // Queue management; current track is never touched
    size_t clear_queue(Snowflake guild_id);
    std::optional<QueueItem> remove_from_queue(Snowflake guild_id, int position);
    size_t shuffle_queue(Snowflake guild_id);
    QueuePage get_queue_page(Snowflake guild_id, int page, int per_page = 10);

    // Inspection
    QueueSnapshot snapshot(Snowflake guild_id);
    GuildMusicState get_state(Snowflake guild_id);
    PlayerState get_player_state(Snowflake guild_id);
    std::optional<QueueItem> current_item(Snowflake guild_id);
    std::optional<Snowflake> voice_channel(Snowflake guild_id);
    std::vector<ChannelMember> channel_occupants(Snowflake guild_id);
    bool is_connected(Snowflake guild_id);
    bool is_playing(Snowflake guild_id);

    // The current item's stream url is still being resolved
    bool is_loading(Snowflake guild_id);

    // Disconnects when the channel has no listeners or the session has
    // been idle longer than the inactivity timeout
    bool check_inactivity(Snowflake guild_id);

    // Checks every known session, returns how many were disconnected
    size_t sweep_inactive();

    void start_inactivity_monitor();
    void stop_inactivity_monitor();

    const PlayerOptions& options() const { return options_; }

private:
    TrackResolver& resolver_;
    VoiceGateway& gateway_;
    PlayerOptions options_;

    std::mutex handler_mutex_;
    SessionEventHandler event_handler_;

    std::atomic<bool> monitor_running_{false};
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    std::thread monitor_thread_;

    // Shut down explicitly in the destructor, before any other member goes.
    // Stream urls are resolved on their own pool so slow lookups never hold
    // up the strands.
    ThreadPool pool_;
    ThreadPool resolve_pool_;
    SessionRegistry sessions_;

    std::shared_ptr<GuildSession> session(Snowflake guild_id);

    // Everything below runs on the session's strand
    void disconnect_session(GuildSession& session);
    std::shared_ptr<VoiceSession> finish_connect(const std::shared_ptr<GuildSession>& s, Snowflake channel_id,
                                                 Snowflake requester_id, std::uint64_t generation);
    std::shared_ptr<VoiceSession> finish_move(const std::shared_ptr<GuildSession>& s,
                                              const std::shared_ptr<VoiceSession>& voice, Snowflake channel_id,
                                              std::uint64_t generation);
    void resume_after_move(GuildSession& session);
    void play_next(GuildSession& session);
    void resolve_current(GuildSession& session, bool replay);
    void handle_resolved(GuildSession& session, std::uint64_t generation, std::uint64_t serial,
                         const std::optional<std::string>& stream_url, bool replay);
    bool start_item(GuildSession& session, const QueueItem& item, const std::string& stream_url,
                    bool announce = true);
    void handle_track_finished(GuildSession& session, std::uint64_t generation, std::uint64_t serial,
                               const std::optional<std::string>& error);
    void preload_next(GuildSession& session);
    std::optional<std::string> take_preloaded(GuildSession& session, const Track& track);
    std::optional<std::string> resolve_stream(Track& track);
    bool check_inactivity_locked(GuildSession& session);
    PlayerState derive_state(const GuildSession& session) const;

    void emit(Snowflake guild_id, const SessionEvent& event);
};

} // namespace jukebox
