#pragma once

#include "music/models.hpp"
#include "music/music_player.hpp"
#include "music/track_queue.hpp"
#include <dpp/dpp.h>
#include <string>

namespace jukebox {

// Snowflake utilities
std::string snowflake_to_string(dpp::snowflake id);
dpp::snowflake string_to_snowflake(const std::string& str);

// Error response helper
dpp::message error_embed(const std::string& title, const std::string& description);
dpp::message success_embed(const std::string& title, const std::string& description);
dpp::message info_embed(const std::string& title, const std::string& description);

// Music cards
dpp::embed now_playing_embed(const QueueItem& item);
dpp::embed queued_embed(const QueueItem& item);
dpp::embed queue_embed(const QueueSnapshot& snapshot, const QueuePage& page);

} // namespace jukebox
