#include "config.hpp"
#include "utils/string_utils.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>

namespace jukebox {

bool Config::load(const std::string& env_path) {
    std::ifstream file(env_path);
    if (!file.is_open()) {
        std::cerr << "Could not open .env file: " << env_path << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = string_utils::trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = string_utils::trim(line.substr(0, pos));
        std::string value = string_utils::trim(line.substr(pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                   (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        env_values_[key] = value;
    }

    token_ = get_env_value("DISCORD_BOT_TOKEN");
    if (token_.empty()) {
        std::cerr << "DISCORD_BOT_TOKEN not found in " << env_path << std::endl;
    }

    if (auto id = read_id("MAIN_ADMIN_ID")) main_admin_id_ = *id;
    if (auto id = read_id("MUSIC_CHANNEL_ID")) music_channel_id_ = *id;

    admin_roles_ = read_ids("ADMIN_ROLES");
    moderator_roles_ = read_ids("MODERATOR_ROLES");

    read_int("MUSIC_INACTIVITY_TIMEOUT", inactivity_timeout_, 0);
    read_int("MUSIC_MAX_QUEUE_SIZE", max_queue_size_, 1);
    read_int("MUSIC_DEFAULT_VOLUME", default_volume_, 0);
    read_int("MUSIC_MAX_RETRIES", max_retries_, 0);
    read_int("MUSIC_CONNECT_TIMEOUT", connect_timeout_, 1);
    read_int("MUSIC_SWEEP_INTERVAL", sweep_interval_, 1);
    read_int("MUSIC_MAX_PLAYLIST_TRACKS", max_playlist_tracks_, 1);
    read_int("MUSIC_WORKER_THREADS", worker_threads_, 1);
    read_int("MUSIC_RESOLVER_THREADS", resolver_threads_, 1);
    read_int("THREAD_POOL_SIZE", thread_pool_size_, 1);

    if (default_volume_ > 100) {
        default_volume_ = 100;
    }

    std::string ytdlp = get_env_value("YTDLP_PATH");
    if (!ytdlp.empty()) ytdlp_path_ = ytdlp;

    std::string ffmpeg = get_env_value("FFMPEG_PATH");
    if (!ffmpeg.empty()) ffmpeg_path_ = ffmpeg;

    // Optional API keys
    std::string spotify_id = get_env_value("SPOTIFY_CLIENT_ID");
    std::string spotify_secret = get_env_value("SPOTIFY_CLIENT_SECRET");

    if (!spotify_id.empty()) spotify_client_id_ = spotify_id;
    if (!spotify_secret.empty()) spotify_client_secret_ = spotify_secret;

    return true;
}

PlayerOptions Config::player_options() const {
    PlayerOptions options;
    options.inactivity_timeout = std::chrono::seconds(inactivity_timeout_);
    options.sweep_interval = std::chrono::seconds(sweep_interval_);
    options.connect_timeout = std::chrono::seconds(connect_timeout_);
    options.max_queue_size = static_cast<size_t>(max_queue_size_);
    options.default_volume = default_volume_;
    options.max_retries = max_retries_;
    options.worker_threads = static_cast<size_t>(worker_threads_);
    options.resolver_threads = static_cast<size_t>(resolver_threads_);
    return options;
}

PermissionConfig Config::permission_config() const {
    PermissionConfig config;
    config.main_admin_id = main_admin_id_;

    // A role listed twice ends up at its higher level
    for (Snowflake role : moderator_roles_) {
        config.role_levels[role] = PermissionLevel::Moderator;
    }
    for (Snowflake role : admin_roles_) {
        config.role_levels[role] = PermissionLevel::Admin;
    }
    return config;
}

bool Config::is_valid() const {
    return !token_.empty();
}

std::string Config::get_env_value(const std::string& key) const {
    auto it = env_values_.find(key);
    return it != env_values_.end() ? it->second : "";
}

void Config::read_int(const std::string& key, int& target, int min_value) const {
    std::string value = get_env_value(key);
    if (value.empty()) {
        return;
    }

    try {
        int parsed = std::stoi(value);
        if (parsed >= min_value) {
            target = parsed;
        } else {
            std::cerr << "Ignoring out of range " << key << ": " << value << std::endl;
        }
    } catch (const std::exception&) {
        // Keep default
        std::cerr << "Ignoring invalid " << key << ": " << value << std::endl;
    }
}

std::optional<Snowflake> Config::read_id(const std::string& key) const {
    std::string value = get_env_value(key);
    if (value.empty()) {
        return std::nullopt;
    }

    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        std::cerr << "Ignoring invalid " << key << ": " << value << std::endl;
        return std::nullopt;
    }
}

std::vector<Snowflake> Config::read_ids(const std::string& key) const {
    std::vector<Snowflake> ids;
    for (const auto& part : string_utils::split(get_env_value(key), ',')) {
        std::string id = string_utils::trim(part);
        if (id.empty()) {
            continue;
        }
        try {
            ids.push_back(std::stoull(id));
        } catch (const std::exception&) {
            std::cerr << "Ignoring invalid id in " << key << ": " << id << std::endl;
        }
    }
    return ids;
}

// Global config instance
static std::unique_ptr<Config> g_config;
static std::once_flag g_config_init;

Config& get_config() {
    std::call_once(g_config_init, []() {
        g_config = std::make_unique<Config>();
    });
    return *g_config;
}

} // namespace jukebox
