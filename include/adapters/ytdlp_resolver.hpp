#pragma once

#include "music/interfaces.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

// TrackResolver backed by the yt-dlp command line tool
class YtDlpResolver : public TrackResolver {
public:
    static constexpr size_t kCacheLimit = 100;

    explicit YtDlpResolver(std::string ytdlp_path = "yt-dlp");

    std::optional<Track> resolve_track(const std::string& url_or_query) override;
    std::vector<Track> resolve_playlist(const std::string& url, int max_tracks) override;
    std::vector<Track> search(const std::string& query, int max_results) override;
    std::optional<std::string> get_stream_url(Track& track) override;
    bool is_playlist_url(const std::string& url) const override;

    bool is_youtube_url(const std::string& url) const;

    // Fields yt-dlp prints with --dump-json
    static Track track_from_json(const nlohmann::json& j, TrackSource source);

    void clear_cache();

private:
    std::string ytdlp_path_;

    std::mutex cache_mutex_;
    std::map<std::string, Track> cache_;
    std::deque<std::string> cache_order_;

    std::optional<Track> cached(const std::string& key);
    void remember(const std::string& key, const Track& track);

    // One JSON document per output line
    std::vector<nlohmann::json> run_json(const std::string& args) const;

    // stdout of the command, nullopt when it could not be started or failed
    static std::optional<std::string> run_command(const std::string& cmd);
};

} // namespace jukebox
