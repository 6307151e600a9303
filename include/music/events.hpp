#pragma once

#include "music/models.hpp"
#include <functional>
#include <string>
#include <variant>

namespace jukebox {

struct TrackStarted {
    QueueItem item;
};

struct TrackEnded {
    QueueItem item;
};

struct QueueEmptied {};

struct Errored {
    std::string message;
};

// The player closed the session on its own, e.g. the inactivity reaper
struct SessionClosed {
    std::string reason;
};

using SessionEvent = std::variant<TrackStarted, TrackEnded, QueueEmptied, Errored, SessionClosed>;

// Called from the session's strand, in the order the events happened.
// Must not block on calls into the same session.
using SessionEventHandler = std::function<void(Snowflake guild_id, const SessionEvent& event)>;

} // namespace jukebox
