#pragma once

#include "music/models.hpp"
#include "music/music_player.hpp"
#include "music/permissions.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

class Config {
public:
    Config() = default;

    // Load configuration from .env file. Missing keys keep their defaults.
    bool load(const std::string& env_path = ".env");

    // Discord
    std::string get_token() const { return token_; }
    Snowflake get_main_admin_id() const { return main_admin_id_; }
    const std::vector<Snowflake>& get_admin_roles() const { return admin_roles_; }
    const std::vector<Snowflake>& get_moderator_roles() const { return moderator_roles_; }

    // Music
    int get_inactivity_timeout() const { return inactivity_timeout_; }
    int get_max_queue_size() const { return max_queue_size_; }
    int get_default_volume() const { return default_volume_; }
    int get_max_retries() const { return max_retries_; }
    int get_connect_timeout() const { return connect_timeout_; }
    int get_sweep_interval() const { return sweep_interval_; }
    int get_max_playlist_tracks() const { return max_playlist_tracks_; }
    int get_worker_threads() const { return worker_threads_; }
    int get_resolver_threads() const { return resolver_threads_; }

    // 0 when music commands are allowed in every channel
    Snowflake get_music_channel_id() const { return music_channel_id_; }

    int get_thread_pool_size() const { return thread_pool_size_; }

    // External tools
    std::string get_ytdlp_path() const { return ytdlp_path_; }
    std::string get_ffmpeg_path() const { return ffmpeg_path_; }

    // Optional API keys for extended features
    std::optional<std::string> get_spotify_client_id() const { return spotify_client_id_; }
    std::optional<std::string> get_spotify_client_secret() const { return spotify_client_secret_; }

    PlayerOptions player_options() const;
    PermissionConfig permission_config() const;

    // The bot cannot start without a token
    bool is_valid() const;

private:
    std::string token_;
    Snowflake main_admin_id_ = 0;
    std::vector<Snowflake> admin_roles_;
    std::vector<Snowflake> moderator_roles_;

    int inactivity_timeout_ = 300;
    int max_queue_size_ = 100;
    int default_volume_ = 50;
    int max_retries_ = 3;
    int connect_timeout_ = 10;
    int sweep_interval_ = 60;
    int max_playlist_tracks_ = 50;
    int worker_threads_ = 4;
    int resolver_threads_ = 4;
    Snowflake music_channel_id_ = 0;
    int thread_pool_size_ = 4;

    std::string ytdlp_path_ = "yt-dlp";
    std::string ffmpeg_path_ = "ffmpeg";

    std::optional<std::string> spotify_client_id_;
    std::optional<std::string> spotify_client_secret_;

    std::string get_env_value(const std::string& key) const;
    void read_int(const std::string& key, int& target, int min_value) const;
    std::optional<Snowflake> read_id(const std::string& key) const;
    std::vector<Snowflake> read_ids(const std::string& key) const;
    std::map<std::string, std::string> env_values_;
};

// Global config instance
Config& get_config();

} // namespace jukebox
