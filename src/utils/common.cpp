#include "utils/common.hpp"
#include "utils/string_utils.hpp"

namespace jukebox {

std::string snowflake_to_string(dpp::snowflake id) {
    return std::to_string(static_cast<uint64_t>(id));
}

dpp::snowflake string_to_snowflake(const std::string& str) {
    try {
        return dpp::snowflake(std::stoull(str));
    } catch (const std::exception&) {
        return 0;
    }
}

dpp::message error_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("❌ " + title)
         .set_description(description)
         .set_color(0xff0000);
    return dpp::message().add_embed(embed);
}

dpp::message success_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("✅ " + title)
         .set_description(description)
         .set_color(0x00ff00);
    return dpp::message().add_embed(embed);
}

dpp::message info_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("ℹ️ " + title)
         .set_description(description)
         .set_color(0x0099ff);
    return dpp::message().add_embed(embed);
}

dpp::embed now_playing_embed(const QueueItem& item) {
    dpp::embed embed;
    embed.set_title("🎵 Now Playing")
         .set_description("**" + string_utils::escape_markdown(item.track.display_name()) + "**")
         .add_field("Duration", item.track.duration_formatted(), true)
         .add_field("Requested by", "<@" + std::to_string(item.requester_id) + ">", true)
         .set_color(0x00ff00);

    if (item.track.album) {
        embed.add_field("Album", *item.track.album, true);
    }
    if (item.track.thumbnail) {
        embed.set_thumbnail(*item.track.thumbnail);
    }
    embed.set_url(item.track.url);
    return embed;
}

dpp::embed queued_embed(const QueueItem& item) {
    dpp::embed embed;
    embed.set_title("✅ Added to Queue")
         .set_description("**" + string_utils::escape_markdown(item.track.display_name()) + "**")
         .add_field("Position", std::to_string(item.position), true)
         .add_field("Duration", item.track.duration_formatted(), true)
         .set_color(0x0099ff);

    if (item.track.thumbnail) {
        embed.set_thumbnail(*item.track.thumbnail);
    }
    return embed;
}

dpp::embed queue_embed(const QueueSnapshot& snapshot, const QueuePage& page) {
    dpp::embed embed;
    embed.set_title("📜 Queue").set_color(0x0099ff);

    if (snapshot.current) {
        const auto& current = *snapshot.current;
        embed.add_field("▶️ Now Playing",
                        "**" + string_utils::escape_markdown(current.track.display_name()) + "**\n" +
                        current.track.duration_formatted() + " | " + current.requester_name,
                        false);
        if (current.track.thumbnail) {
            embed.set_thumbnail(*current.track.thumbnail);
        }
    }

    if (page.items.empty()) {
        embed.add_field("📋 Up Next", "Empty", false);
    } else {
        std::string lines;
        for (const auto& item : page.items) {
            lines += "`" + std::to_string(item.position) + ".` " +
                     string_utils::escape_markdown(item.track.display_name()) +
                     " [" + item.track.duration_formatted() + "]\n";
        }
        // Discord caps field values at 1024 characters
        embed.add_field("📋 Up Next (" + std::to_string(snapshot.items.size()) + " tracks)",
                        string_utils::truncate(lines, 1024), false);
    }

    std::string footer = "Page " + std::to_string(page.page) + "/" + std::to_string(page.total_pages) +
                         " | Total: " + format_track_duration(snapshot.total_duration) +
                         " | Loop: " + to_string(snapshot.state.loop_mode) +
                         " | Volume: " + std::to_string(snapshot.state.volume) + "%";
    embed.set_footer(dpp::embed_footer().set_text(footer));
    return embed;
}

} // namespace jukebox
