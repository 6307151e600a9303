#pragma once

#include "music/interfaces.hpp"
#include <dpp/dpp.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace jukebox {

// One guild's voice connection. Audio is decoded by an ffmpeg child process
// into 48 kHz stereo PCM and handed to the D++ voice client; the end of each
// stream is tagged with a marker so D++ reports when it actually finished playing.
class DppVoiceSession : public VoiceSession, public std::enable_shared_from_this<DppVoiceSession> {
public:
    // 20 ms frames, the size D++ expects for raw PCM
    static constexpr size_t kFrameBytes = 11520;
    static constexpr float kMaxBufferedSecs = 2.0f;

    DppVoiceSession(dpp::cluster& cluster, Snowflake guild_id, std::string ffmpeg_path,
                    std::chrono::milliseconds move_timeout);
    ~DppVoiceSession() override;

    bool move(Snowflake channel_id) override;
    bool play(const std::string& stream_url, int volume, FinishedCallback on_finished) override;
    bool pause() override;
    bool resume() override;
    void stop() override;
    void disconnect() override;
    void set_volume(int volume) override;

    bool is_connected() const override;
    bool is_playing() const override;
    bool is_paused() const override;

    Snowflake channel_id() const override { return channel_id_; }
    std::vector<ChannelMember> channel_occupants() const override;

    // Asks Discord to join channel_id, then waits for the voice handshake
    bool join(Snowflake channel_id, std::chrono::milliseconds timeout);

    // Gateway callbacks, on D++ threads
    void handle_ready(Snowflake channel_id);
    void handle_marker(const std::string& meta);
    // Returns false when the session had already left
    bool handle_detached();

private:
    dpp::cluster& cluster_;
    const Snowflake guild_id_;
    const std::string ffmpeg_path_;
    const std::chrono::milliseconds move_timeout_;

    std::atomic<Snowflake> channel_id_{0};
    std::atomic<int> volume_{100};

    // Id of the stream being fed; 0 when idle
    std::atomic<std::uint64_t> active_track_{0};

    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    bool ready_ = false;
    bool paused_ = false;
    std::uint64_t next_track_ = 0;
    FinishedCallback on_finished_;

    dpp::discord_client* shard() const;
    dpp::discord_voice_client* voice_client() const;

    void feed(std::string stream_url, std::uint64_t track_id);
    void finish(std::uint64_t track_id, const std::optional<std::string>& error);
    FinishedCallback take_callback();
};

// Creates DppVoiceSessions and routes D++ voice events to them
class DppVoiceGateway : public VoiceGateway {
public:
    DppVoiceGateway(dpp::cluster& cluster, std::string ffmpeg_path);

    std::shared_ptr<VoiceSession> connect(Snowflake guild_id, Snowflake channel_id,
                                          std::chrono::milliseconds timeout) override;

    void handle_voice_ready(const dpp::voice_ready_t& event);
    void handle_track_marker(const dpp::voice_track_marker_t& event);

    // The bot's own voice state went to no channel. Returns true when a
    // live session was cut off rather than closed by us.
    bool handle_bot_left(Snowflake guild_id);

private:
    dpp::cluster& cluster_;
    std::string ffmpeg_path_;

    std::mutex sessions_mutex_;
    std::map<Snowflake, std::weak_ptr<DppVoiceSession>> sessions_;

    std::shared_ptr<DppVoiceSession> find(Snowflake guild_id);
};

} // namespace jukebox
