#include "adapters/spotify_resolver.hpp"
#include "utils/curl_helper.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <iostream>
#include <regex>

namespace jukebox {

using json = nlohmann::json;

namespace {

const char* const kTokenUrl = "https://accounts.spotify.com/api/token";
const char* const kApiBase = "https://api.spotify.com/v1";

const std::regex kLinkRegex(R"(^(?:https?://open\.spotify\.com/(?:intl-[a-z]+/)?|spotify:)(track|album|playlist)[/:]([A-Za-z0-9]+))");

std::string join_artists(const json& artists) {
    std::vector<std::string> names;
    if (artists.is_array()) {
        for (const auto& artist : artists) {
            names.push_back(artist.value("name", std::string()));
        }
    }
    return string_utils::join(names, ", ");
}

std::optional<std::string> first_image(const json& images) {
    if (images.is_array() && !images.empty() && images[0].contains("url")) {
        return images[0]["url"].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

SpotifyResolver::SpotifyResolver(TrackResolver& inner, std::string client_id, std::string client_secret)
    : inner_(inner),
      client_id_(std::move(client_id)),
      client_secret_(std::move(client_secret)),
      enabled_(!client_id_.empty() && !client_secret_.empty()) {
    if (!enabled_) {
        std::cout << "[spotify] Credentials not set, Spotify links are disabled" << std::endl;
    }
}

std::optional<SpotifyLink> SpotifyResolver::parse_link(const std::string& url) {
    std::smatch match;
    std::string trimmed = string_utils::trim(url);
    if (!std::regex_search(trimmed, match, kLinkRegex)) {
        return std::nullopt;
    }

    SpotifyLink link;
    if (match[1] == "track") {
        link.kind = SpotifyKind::Track;
    } else if (match[1] == "album") {
        link.kind = SpotifyKind::Album;
    } else {
        link.kind = SpotifyKind::Playlist;
    }
    link.id = match[2];
    return link;
}

std::string SpotifyResolver::build_search_query(const json& track) {
    std::string artists = join_artists(track.value("artists", json::array()));
    std::string title = track.value("name", std::string());
    return artists.empty() ? title : artists + " - " + title;
}

std::optional<std::string> SpotifyResolver::get_access_token() {
    std::lock_guard<std::mutex> lock(token_mutex_);

    if (!access_token_.empty() && std::chrono::steady_clock::now() < token_expiry_) {
        return access_token_;
    }

    auto response = CurlHelper::post(kTokenUrl, "grant_type=client_credentials",
                                     {{"Content-Type", "application/x-www-form-urlencoded"}},
                                     CurlHelper::BasicAuth{client_id_, client_secret_});
    if (!response.success) {
        std::cerr << "[spotify] Token request failed: " << response.error << std::endl;
        return std::nullopt;
    }

    try {
        auto j = json::parse(response.body);
        access_token_ = j.at("access_token").get<std::string>();
        int expires_in = j.value("expires_in", 3600);

        // Renew a minute early
        token_expiry_ = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(0, expires_in - 60));
        return access_token_;
    } catch (const json::exception& e) {
        std::cerr << "[spotify] Bad token response: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<json> SpotifyResolver::api_get(const std::string& path) {
    auto token = get_access_token();
    if (!token) {
        return std::nullopt;
    }

    auto response = CurlHelper::get(std::string(kApiBase) + path, {{"Authorization", "Bearer " + *token}});
    if (!response.success) {
        std::cerr << "[spotify] GET " << path << " failed: " << response.error << std::endl;
        return std::nullopt;
    }

    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        std::cerr << "[spotify] Bad response for " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<Track> SpotifyResolver::cross_reference(const json& track, const std::string& album_name,
                                                      const std::optional<std::string>& album_image) {
    std::string query = build_search_query(track);
    if (query.empty()) {
        return std::nullopt;
    }

    auto found = inner_.search(query, 1);
    if (found.empty()) {
        std::cerr << "[spotify] No match found for: " << query << std::endl;
        return std::nullopt;
    }

    Track result = std::move(found.front());
    result.title = track.value("name", result.title);
    std::string artists = join_artists(track.value("artists", json::array()));
    if (!artists.empty()) {
        result.artist = artists;
    }
    if (!album_name.empty()) {
        result.album = album_name;
    }
    if (album_image) {
        result.thumbnail = album_image;
    }
    result.source = TrackSource::CrossReferenced;
    return result;
}

std::optional<Track> SpotifyResolver::resolve_track(const std::string& url_or_query) {
    auto link = parse_link(url_or_query);
    if (!link) {
        return inner_.resolve_track(url_or_query);
    }
    if (!enabled_) {
        return std::nullopt;
    }

    if (link->kind != SpotifyKind::Track) {
        // A collection asked for as a single track: take its first entry
        auto tracks = resolve_playlist(url_or_query, 1);
        if (tracks.empty()) {
            return std::nullopt;
        }
        return tracks.front();
    }

    auto data = api_get("/tracks/" + link->id);
    if (!data) {
        return std::nullopt;
    }

    try {
        const json album = data->value("album", json::object());
        return cross_reference(*data, album.value("name", std::string()),
                               first_image(album.value("images", json::array())));
    } catch (const json::exception& e) {
        std::cerr << "[spotify] Bad track data: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::vector<Track> SpotifyResolver::resolve_playlist(const std::string& url, int max_tracks) {
    auto link = parse_link(url);
    if (!link) {
        return inner_.resolve_playlist(url, max_tracks);
    }

    std::vector<Track> tracks;
    if (!enabled_ || max_tracks <= 0) {
        return tracks;
    }

    if (link->kind == SpotifyKind::Track) {
        if (auto track = resolve_track(url)) {
            tracks.push_back(std::move(*track));
        }
        return tracks;
    }

    try {
        if (link->kind == SpotifyKind::Album) {
            auto data = api_get("/albums/" + link->id);
            if (!data) {
                return tracks;
            }

            std::string album_name = data->value("name", std::string());
            auto album_image = first_image(data->value("images", json::array()));

            for (const auto& item : data->at("tracks").at("items")) {
                if (static_cast<int>(tracks.size()) >= max_tracks) {
                    break;
                }
                if (auto track = cross_reference(item, album_name, album_image)) {
                    tracks.push_back(std::move(*track));
                }
            }
        } else {
            auto data = api_get("/playlists/" + link->id + "/tracks?limit=" + std::to_string(std::min(max_tracks, 100)));
            if (!data) {
                return tracks;
            }

            for (const auto& item : data->at("items")) {
                if (static_cast<int>(tracks.size()) >= max_tracks) {
                    break;
                }

                // Local files and removed tracks come back as null
                auto entry = item.find("track");
                if (entry == item.end() || !entry->is_object()) {
                    continue;
                }

                const json album = entry->value("album", json::object());
                if (auto track = cross_reference(*entry, album.value("name", std::string()),
                                                 first_image(album.value("images", json::array())))) {
                    tracks.push_back(std::move(*track));
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[spotify] Bad collection data: " << e.what() << std::endl;
    }

    std::cout << "[spotify] Matched " << tracks.size() << " tracks" << std::endl;
    return tracks;
}

std::vector<Track> SpotifyResolver::search(const std::string& query, int max_results) {
    return inner_.search(query, max_results);
}

std::optional<std::string> SpotifyResolver::get_stream_url(Track& track) {
    return inner_.get_stream_url(track);
}

bool SpotifyResolver::is_playlist_url(const std::string& url) const {
    auto link = parse_link(url);
    if (link) {
        return link->kind != SpotifyKind::Track;
    }
    return inner_.is_playlist_url(url);
}

} // namespace jukebox
