#include "music/models.hpp"
#include "utils/string_utils.hpp"
#include <iomanip>
#include <sstream>

namespace jukebox {

std::string format_track_duration(int seconds) {
    if (seconds < 0) seconds = 0;

    int hours = seconds / 3600;
    int minutes = (seconds % 3600) / 60;
    int secs = seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ":" << std::setfill('0') << std::setw(2);
    }
    oss << minutes << ":" << std::setfill('0') << std::setw(2) << secs;

    return oss.str();
}

std::string Track::duration_formatted() const {
    return format_track_duration(duration);
}

std::string Track::display_name() const {
    if (artist && !artist->empty()) {
        return *artist + " - " + title;
    }
    return title;
}

const char* to_string(TrackSource source) {
    switch (source) {
        case TrackSource::Search: return "search";
        case TrackSource::Playlist: return "playlist";
        case TrackSource::CrossReferenced: return "cross-referenced";
    }
    return "unknown";
}

const char* to_string(LoopMode mode) {
    switch (mode) {
        case LoopMode::None: return "off";
        case LoopMode::Track: return "track";
        case LoopMode::Queue: return "queue";
    }
    return "unknown";
}

const char* to_string(PlayerState state) {
    switch (state) {
        case PlayerState::Disconnected: return "disconnected";
        case PlayerState::Connecting: return "connecting";
        case PlayerState::Idle: return "idle";
        case PlayerState::Playing: return "playing";
        case PlayerState::Paused: return "paused";
    }
    return "unknown";
}

std::optional<LoopMode> parse_loop_mode(const std::string& name) {
    std::string mode = string_utils::to_lower(string_utils::trim(name));

    if (mode == "off" || mode == "none") return LoopMode::None;
    if (mode == "song" || mode == "track") return LoopMode::Track;
    if (mode == "queue" || mode == "all") return LoopMode::Queue;
    return std::nullopt;
}

} // namespace jukebox
