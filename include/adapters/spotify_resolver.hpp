#pragma once

#include "music/interfaces.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

enum class SpotifyKind { Track, Album, Playlist };

struct SpotifyLink {
    SpotifyKind kind;
    std::string id;
};

// Turns Spotify links into tracks found through another resolver.
// Spotify supplies the metadata; the inner resolver supplies something playable.
// Everything that is not a Spotify link is passed through unchanged.
class SpotifyResolver : public TrackResolver {
public:
    SpotifyResolver(TrackResolver& inner, std::string client_id, std::string client_secret);

    std::optional<Track> resolve_track(const std::string& url_or_query) override;
    std::vector<Track> resolve_playlist(const std::string& url, int max_tracks) override;
    std::vector<Track> search(const std::string& query, int max_results) override;
    std::optional<std::string> get_stream_url(Track& track) override;
    bool is_playlist_url(const std::string& url) const override;

    bool is_enabled() const { return enabled_; }

    // open.spotify.com urls and spotify: uris
    static std::optional<SpotifyLink> parse_link(const std::string& url);

    // "Artist, Artist - Title"
    static std::string build_search_query(const nlohmann::json& track);

private:
    TrackResolver& inner_;
    std::string client_id_;
    std::string client_secret_;
    bool enabled_;

    std::mutex token_mutex_;
    std::string access_token_;
    std::chrono::steady_clock::time_point token_expiry_;

    std::optional<std::string> get_access_token();
    std::optional<nlohmann::json> api_get(const std::string& path);

    // Finds the track elsewhere and keeps Spotify's metadata on the result
    std::optional<Track> cross_reference(const nlohmann::json& track, const std::string& album_name,
                                         const std::optional<std::string>& album_image);
};

} // namespace jukebox
