#include "adapters/ytdlp_resolver.hpp"
#include "utils/string_utils.hpp"
#include <array>
#include <cstdio>
#include <iostream>
#include <regex>
#include <sstream>
#include <sys/wait.h>

namespace jukebox {

using json = nlohmann::json;

namespace {

const std::regex kVideoRegex(
    R"(^(https?://)?(www\.|m\.|music\.)?(youtube\.com/watch\?v=|youtu\.be/|youtube\.com/shorts/)[\w-]+)");
const std::regex kPlaylistRegex(R"(^(https?://)?(www\.|m\.|music\.)?youtube\.com/playlist\?list=[\w-]+)");

std::optional<std::string> string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

} // namespace

YtDlpResolver::YtDlpResolver(std::string ytdlp_path) : ytdlp_path_(std::move(ytdlp_path)) {}

std::optional<std::string> YtDlpResolver::run_command(const std::string& cmd) {
    std::array<char, 4096> buffer;
    std::string result;

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::cerr << "[yt-dlp] Failed to start: " << cmd << std::endl;
        return std::nullopt;
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        // Search misses still print what was found
        if (result.empty()) {
            return std::nullopt;
        }
    }
    return result;
}

std::vector<json> YtDlpResolver::run_json(const std::string& args) const {
    std::vector<json> documents;

    auto output = run_command(string_utils::shell_quote(ytdlp_path_) + " " + args + " 2>/dev/null");
    if (!output) {
        return documents;
    }

    std::istringstream lines(*output);
    std::string line;
    while (std::getline(lines, line)) {
        line = string_utils::trim(line);
        if (line.empty()) {
            continue;
        }
        try {
            documents.push_back(json::parse(line));
        } catch (const json::exception& e) {
            std::cerr << "[yt-dlp] Unparseable output: " << e.what() << std::endl;
        }
    }
    return documents;
}

Track YtDlpResolver::track_from_json(const json& j, TrackSource source) {
    Track track;
    track.title = j.value("title", std::string("Unknown"));
    track.source = source;

    if (auto page = string_field(j, "webpage_url")) {
        track.url = *page;
    } else if (auto id = string_field(j, "id"); id && j.value("ie_key", std::string("Youtube")) == "Youtube") {
        track.url = "https://www.youtube.com/watch?v=" + *id;
    } else if (auto url = string_field(j, "url")) {
        track.url = *url;
    }

    auto duration = j.find("duration");
    if (duration != j.end() && duration->is_number()) {
        track.duration = static_cast<int>(duration->get<double>());
    }

    track.thumbnail = string_field(j, "thumbnail");
    track.artist = string_field(j, "uploader");
    if (!track.artist) {
        track.artist = string_field(j, "channel");
    }

    // Full extraction with a format selected puts the media url here
    if (string_field(j, "webpage_url") && string_field(j, "format_id")) {
        track.stream_url = string_field(j, "url");
    }

    return track;
}

std::optional<Track> YtDlpResolver::resolve_track(const std::string& url_or_query) {
    std::string key = string_utils::trim(url_or_query);
    if (key.empty()) {
        return std::nullopt;
    }

    if (auto hit = cached(key)) {
        return hit;
    }

    std::string target = string_utils::is_url(key) ? key : "ytsearch1:" + key;
    auto documents = run_json("-J -f bestaudio/best --no-playlist --no-warnings " +
                              string_utils::shell_quote(target));
    if (documents.empty()) {
        std::cerr << "[yt-dlp] Nothing found for: " << key << std::endl;
        return std::nullopt;
    }

    const json* data = &documents.front();

    // Search results arrive wrapped in a playlist
    auto entries = data->find("entries");
    if (entries != data->end() && entries->is_array()) {
        data = nullptr;
        for (const auto& entry : *entries) {
            if (entry.is_object()) {
                data = &entry;
                break;
            }
        }
        if (!data) {
            return std::nullopt;
        }
    }

    Track track = track_from_json(*data, TrackSource::Search);
    if (track.url.empty()) {
        return std::nullopt;
    }

    remember(key, track);
    return track;
}

std::vector<Track> YtDlpResolver::resolve_playlist(const std::string& url, int max_tracks) {
    std::vector<Track> tracks;
    if (max_tracks <= 0) {
        return tracks;
    }

    auto documents = run_json("-j --flat-playlist --no-warnings --playlist-end " + std::to_string(max_tracks) +
                              " " + string_utils::shell_quote(url));

    for (const auto& entry : documents) {
        if (static_cast<int>(tracks.size()) >= max_tracks) {
            break;
        }
        Track track = track_from_json(entry, TrackSource::Playlist);
        if (!track.url.empty()) {
            tracks.push_back(std::move(track));
        }
    }

    std::cout << "[yt-dlp] Extracted " << tracks.size() << " tracks from playlist" << std::endl;
    return tracks;
}

std::vector<Track> YtDlpResolver::search(const std::string& query, int max_results) {
    std::vector<Track> tracks;
    if (max_results <= 0 || string_utils::trim(query).empty()) {
        return tracks;
    }

    std::string target = "ytsearch" + std::to_string(max_results) + ":" + query;
    auto documents = run_json("-j -f bestaudio/best --no-warnings " + string_utils::shell_quote(target));

    for (const auto& entry : documents) {
        Track track = track_from_json(entry, TrackSource::Search);
        if (!track.url.empty()) {
            tracks.push_back(std::move(track));
        }
    }
    return tracks;
}

std::optional<std::string> YtDlpResolver::get_stream_url(Track& track) {
    if (track.stream_url) {
        return track.stream_url;
    }

    auto output = run_command(string_utils::shell_quote(ytdlp_path_) + " -f bestaudio/best -g --no-playlist " +
                              string_utils::shell_quote(track.url) + " 2>/dev/null");
    if (!output) {
        return std::nullopt;
    }

    // One url per selected format, audio first
    std::string first_line = string_utils::trim(output->substr(0, output->find('\n')));
    if (!string_utils::is_url(first_line)) {
        return std::nullopt;
    }

    track.stream_url = first_line;
    return first_line;
}

bool YtDlpResolver::is_playlist_url(const std::string& url) const {
    return std::regex_search(string_utils::trim(url), kPlaylistRegex);
}

bool YtDlpResolver::is_youtube_url(const std::string& url) const {
    std::string trimmed = string_utils::trim(url);
    return std::regex_search(trimmed, kVideoRegex) || std::regex_search(trimmed, kPlaylistRegex);
}

void YtDlpResolver::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
    cache_order_.clear();
}

std::optional<Track> YtDlpResolver::cached(const std::string& key) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void YtDlpResolver::remember(const std::string& key, const Track& track) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cache_.count(key)) {
        cache_[key] = track;
        return;
    }

    // Oldest entry goes first
    while (cache_.size() >= kCacheLimit && !cache_order_.empty()) {
        cache_.erase(cache_order_.front());
        cache_order_.pop_front();
    }

    cache_[key] = track;
    cache_order_.push_back(key);
}

} // namespace jukebox
