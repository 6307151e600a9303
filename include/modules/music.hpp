#pragma once

#include "adapters/dpp_members.hpp"
#include "adapters/dpp_voice.hpp"
#include "adapters/spotify_resolver.hpp"
#include "adapters/ytdlp_resolver.hpp"
#include "music/events.hpp"
#include "music/music_player.hpp"
#include "music/permissions.hpp"
#include <dpp/dpp.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

class Config;

// Slash commands for the guild music player
class MusicModule {
public:
    MusicModule(dpp::cluster& bot, const Config& config);
    ~MusicModule();

    // Register slash commands
    std::vector<dpp::slashcommand> get_commands();

    // Handle slash commands
    bool handles(const std::string& command_name) const;
    void handle_command(const dpp::slashcommand_t& event);

    // Voice plumbing
    void handle_voice_state(const dpp::voice_state_update_t& event);
    void handle_voice_ready(const dpp::voice_ready_t& event);
    void handle_track_marker(const dpp::voice_track_marker_t& event);

    // Inactivity monitor
    void start();
    void stop();

private:
    dpp::cluster& bot_;
    int max_playlist_tracks_;
    Snowflake music_channel_id_;

    YtDlpResolver ytdlp_;
    std::unique_ptr<SpotifyResolver> spotify_;
    TrackResolver* resolver_;

    DppVoiceGateway gateway_;
    DppMemberDirectory members_;
    PermissionChecker permissions_;

    // Declared last: its destructor still talks to the gateway and resolver
    MusicPlayer player_;

    // Text channel each guild's notifications go to
    std::map<Snowflake, Snowflake> notification_channels_;
    std::mutex channels_mutex_;

    // Command handlers
    void cmd_play(const dpp::slashcommand_t& event);
    void cmd_pause(const dpp::slashcommand_t& event);
    void cmd_resume(const dpp::slashcommand_t& event);
    void cmd_skip(const dpp::slashcommand_t& event);
    void cmd_stop(const dpp::slashcommand_t& event);
    void cmd_queue(const dpp::slashcommand_t& event);
    void cmd_nowplaying(const dpp::slashcommand_t& event);
    void cmd_volume(const dpp::slashcommand_t& event);
    void cmd_shuffle(const dpp::slashcommand_t& event);
    void cmd_loop(const dpp::slashcommand_t& event);
    void cmd_remove(const dpp::slashcommand_t& event);
    void cmd_clear(const dpp::slashcommand_t& event);
    void cmd_join(const dpp::slashcommand_t& event);
    void cmd_leave(const dpp::slashcommand_t& event);

    // Permission checks
    MemberInfo issuer(const dpp::slashcommand_t& event) const;
    bool check_channel(const dpp::slashcommand_t& event, const MemberInfo& member);
    std::optional<Snowflake> member_voice_channel(Snowflake guild_id, Snowflake user_id) const;

    // Runs on the command pool; edits the deferred response on failure
    bool join_channel(const dpp::slashcommand_t& event, const MemberInfo& member, Snowflake channel_id);

    // Notifications
    void on_session_event(Snowflake guild_id, const SessionEvent& event);
    void notify(Snowflake guild_id, const dpp::embed& embed);
    void set_listening(const std::string& activity);
    void remember_channel(Snowflake guild_id, Snowflake channel_id);
    void forget_channel(Snowflake guild_id);
};

} // namespace jukebox
