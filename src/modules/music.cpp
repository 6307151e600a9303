#include "modules/music.hpp"
#include "config.hpp"
#include "utils/common.hpp"
#include "utils/string_utils.hpp"
#include "utils/thread_pool.hpp"
#include <iostream>
#include <set>
#include <variant>

namespace jukebox {

namespace {

const std::set<std::string> kCommands = {
    "play", "pause", "resume", "skip", "stop", "queue", "nowplaying",
    "volume", "shuffle", "loop", "remove", "clear", "join", "leave"
};

// Visitor helper for SessionEvent
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::optional<int64_t> int_parameter(const dpp::slashcommand_t& event, const std::string& name) {
    auto value = event.get_parameter(name);
    if (std::holds_alternative<int64_t>(value)) {
        return std::get<int64_t>(value);
    }
    return std::nullopt;
}

std::unique_ptr<SpotifyResolver> make_spotify(const Config& config, TrackResolver& inner) {
    auto client_id = config.get_spotify_client_id();
    auto client_secret = config.get_spotify_client_secret();
    if (!client_id || !client_secret) {
        return nullptr;
    }
    return std::make_unique<SpotifyResolver>(inner, *client_id, *client_secret);
}

} // namespace

MusicModule::MusicModule(dpp::cluster& bot, const Config& config)
    : bot_(bot),
      max_playlist_tracks_(config.get_max_playlist_tracks()),
      music_channel_id_(config.get_music_channel_id()),
      ytdlp_(config.get_ytdlp_path()),
      spotify_(make_spotify(config, ytdlp_)),
      resolver_(spotify_ ? static_cast<TrackResolver*>(spotify_.get()) : &ytdlp_),
      gateway_(bot, config.get_ffmpeg_path()),
      permissions_(config.permission_config(), members_),
      player_(*resolver_, gateway_, config.player_options()) {
    player_.set_event_handler([this](Snowflake guild_id, const SessionEvent& event) {
        on_session_event(guild_id, event);
    });
}

MusicModule::~MusicModule() {
    stop();
}

void MusicModule::start() {
    player_.start_inactivity_monitor();
}

void MusicModule::stop() {
    player_.stop_inactivity_monitor();
}

std::vector<dpp::slashcommand> MusicModule::get_commands() {
    std::vector<dpp::slashcommand> commands;

    commands.push_back(
        dpp::slashcommand("play", "Play a song or add it to the queue", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_string, "query", "Search text, YouTube or Spotify link", true))
    );

    commands.push_back(dpp::slashcommand("pause", "Pause playback", bot_.me.id));
    commands.push_back(dpp::slashcommand("resume", "Resume playback", bot_.me.id));
    commands.push_back(dpp::slashcommand("skip", "Skip the current song", bot_.me.id));
    commands.push_back(dpp::slashcommand("stop", "Stop playback, clear the queue and leave", bot_.me.id));

    commands.push_back(
        dpp::slashcommand("queue", "View the queue", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_integer, "page", "Page number", false)
                .set_min_value(1))
    );

    commands.push_back(dpp::slashcommand("nowplaying", "Show the current song", bot_.me.id));

    commands.push_back(
        dpp::slashcommand("volume", "Set volume", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_integer, "level", "Volume level (0-100)", true)
                .set_min_value(0).set_max_value(100))
    );

    commands.push_back(dpp::slashcommand("shuffle", "Shuffle the queue", bot_.me.id));

    commands.push_back(
        dpp::slashcommand("loop", "Set loop mode", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_string, "mode", "Loop mode", true)
                .add_choice(dpp::command_option_choice("Off", std::string("off")))
                .add_choice(dpp::command_option_choice("Song", std::string("song")))
                .add_choice(dpp::command_option_choice("Queue", std::string("queue"))))
    );

    commands.push_back(
        dpp::slashcommand("remove", "Remove a song from the queue", bot_.me.id)
            .add_option(dpp::command_option(dpp::co_integer, "position", "Position in queue", true)
                .set_min_value(1))
    );

    commands.push_back(dpp::slashcommand("clear", "Clear upcoming songs", bot_.me.id));
    commands.push_back(dpp::slashcommand("join", "Join your voice channel", bot_.me.id));
    commands.push_back(dpp::slashcommand("leave", "Leave the voice channel", bot_.me.id));

    return commands;
}

bool MusicModule::handles(const std::string& command_name) const {
    return kCommands.count(command_name) > 0;
}

void MusicModule::handle_command(const dpp::slashcommand_t& event) {
    std::string cmd = event.command.get_command_name();

    if (cmd == "play") cmd_play(event);
    else if (cmd == "pause") cmd_pause(event);
    else if (cmd == "resume") cmd_resume(event);
    else if (cmd == "skip") cmd_skip(event);
    else if (cmd == "stop") cmd_stop(event);
    else if (cmd == "queue") cmd_queue(event);
    else if (cmd == "nowplaying") cmd_nowplaying(event);
    else if (cmd == "volume") cmd_volume(event);
    else if (cmd == "shuffle") cmd_shuffle(event);
    else if (cmd == "loop") cmd_loop(event);
    else if (cmd == "remove") cmd_remove(event);
    else if (cmd == "clear") cmd_clear(event);
    else if (cmd == "join") cmd_join(event);
    else if (cmd == "leave") cmd_leave(event);
}

// ==================== Voice plumbing ====================

void MusicModule::handle_voice_state(const dpp::voice_state_update_t& event) {
    // Only the bot being kicked or dropped matters here
    if (event.state.user_id != bot_.me.id || event.state.channel_id != 0) {
        return;
    }

    Snowflake guild_id = event.state.guild_id;
    if (!gateway_.handle_bot_left(guild_id)) {
        return;
    }

    std::cout << "[music] Voice connection closed externally in guild " << guild_id << std::endl;
    try {
        get_thread_pool().enqueue([this, guild_id]() {
            player_.disconnect(guild_id);
            forget_channel(guild_id);
        });
    } catch (const std::runtime_error& e) {
        std::cerr << "[music] Could not schedule disconnect: " << e.what() << std::endl;
    }
}

void MusicModule::handle_voice_ready(const dpp::voice_ready_t& event) {
    gateway_.handle_voice_ready(event);
}

void MusicModule::handle_track_marker(const dpp::voice_track_marker_t& event) {
    gateway_.handle_track_marker(event);
}

// ==================== Checks ====================

MemberInfo MusicModule::issuer(const dpp::slashcommand_t& event) const {
    const dpp::user& user = event.command.get_issuing_user();
    MemberInfo member = DppMemberDirectory::from_member(event.command.member, &user);
    member.user_id = user.id;
    return member;
}

bool MusicModule::check_channel(const dpp::slashcommand_t& event, const MemberInfo& member) {
    if (music_channel_id_ == 0 || event.command.channel_id == music_channel_id_) {
        return true;
    }

    // Moderators and above may use music commands anywhere
    if (permissions_.get_level(member) >= PermissionLevel::Moderator) {
        return true;
    }

    event.reply(error_embed("Wrong Channel", "Music commands are only available in <#" +
                            std::to_string(music_channel_id_) + ">").set_flags(dpp::m_ephemeral));
    return false;
}

std::optional<Snowflake> MusicModule::member_voice_channel(Snowflake guild_id, Snowflake user_id) const {
    dpp::guild* guild = dpp::find_guild(guild_id);
    if (!guild) {
        return std::nullopt;
    }

    auto vs = guild->voice_members.find(user_id);
    if (vs == guild->voice_members.end() || vs->second.channel_id == 0) {
        return std::nullopt;
    }
    return static_cast<Snowflake>(vs->second.channel_id);
}

bool MusicModule::join_channel(const dpp::slashcommand_t& event, const MemberInfo& member, Snowflake channel_id) {
    Snowflake guild_id = event.command.guild_id;

    // Decided on the session's strand, against the owner and occupants of that moment
    PermissionResult result{true, "", PermissionLevel::User};
    auto gate = [&](const ConnectContext& context) {
        result = permissions_.can_move_session(member, guild_id, context.current_channel, channel_id,
                                               context.owner_id, context.occupants);
        return result.allowed;
    };

    if (!player_.connect(guild_id, channel_id, member.user_id, gate)) {
        if (!result.allowed) {
            event.edit_response(error_embed("Permission Denied", result.reason));
        } else {
            event.edit_response(error_embed("Connection Failed", "Could not connect to the voice channel."));
        }
        return false;
    }

    remember_channel(guild_id, event.command.channel_id);
    return true;
}

// ==================== Command handlers ====================

void MusicModule::cmd_play(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    auto channel = member_voice_channel(event.command.guild_id, member.user_id);
    if (!channel) {
        event.reply(error_embed("Not in Voice", "You must be in a voice channel."));
        return;
    }

    std::string query = string_utils::trim(std::get<std::string>(event.get_parameter("query")));

    event.thinking();

    get_thread_pool().enqueue([this, event, member, query, target = *channel]() {
        Snowflake guild_id = event.command.guild_id;

        if (!join_channel(event, member, target)) {
            return;
        }

        std::vector<Track> tracks;
        if (resolver_->is_playlist_url(query)) {
            tracks = resolver_->resolve_playlist(query, max_playlist_tracks_);
        } else if (auto track = resolver_->resolve_track(query)) {
            tracks.push_back(std::move(*track));
        }

        if (tracks.empty()) {
            event.edit_response(error_embed("Not Found", "Nothing found for: " + query));
            return;
        }

        if (tracks.size() == 1) {
            auto item = player_.play(guild_id, tracks.front(), member.user_id, member.name);
            if (!item) {
                event.edit_response(error_embed("Queue Full", "The queue holds at most " +
                                    std::to_string(player_.options().max_queue_size) + " tracks."));
                return;
            }

            auto current = player_.current_item(guild_id);
            bool started = current && current->track.url == item->track.url &&
                           current->added_at == item->added_at;
            event.edit_response(dpp::message().add_embed(started ? now_playing_embed(*item) : queued_embed(*item)));
            return;
        }

        auto items = player_.play_multiple(guild_id, tracks, member.user_id, member.name);

        std::string description = "Added **" + std::to_string(items.size()) + "** tracks";
        if (items.size() < tracks.size()) {
            description += " (" + std::to_string(tracks.size() - items.size()) + " dropped, queue full)";
        }

        dpp::embed embed;
        embed.set_title("✅ Added to Queue")
             .set_description(description)
             .set_color(0x00ff00);

        if (!items.empty()) {
            std::string lines;
            for (size_t i = 0; i < items.size() && i < 5; ++i) {
                lines += "`" + std::to_string(items[i].position) + ".` " +
                         string_utils::escape_markdown(items[i].track.display_name()) + "\n";
            }
            if (items.size() > 5) {
                lines += "... and " + std::to_string(items.size() - 5) + " more";
            }
            embed.add_field("Tracks", string_utils::truncate(lines, 1024), false);
        }

        event.edit_response(dpp::message().add_embed(embed));
    });
}

void MusicModule::cmd_pause(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event]() {
        if (player_.pause(event.command.guild_id)) {
            event.edit_response(success_embed("Paused", "Playback paused."));
        } else {
            event.edit_response(error_embed("Nothing Playing", "There's nothing playing right now."));
        }
    });
}

void MusicModule::cmd_resume(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event]() {
        if (player_.resume(event.command.guild_id)) {
            event.edit_response(success_embed("Resumed", "Playback resumed."));
        } else {
            event.edit_response(error_embed("Not Paused", "Playback is not paused."));
        }
    });
}

void MusicModule::cmd_skip(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event, member]() {
        Snowflake guild_id = event.command.guild_id;

        if (!player_.is_connected(guild_id)) {
            event.edit_response(error_embed("Nothing Playing", "The bot is not playing music."));
            return;
        }

        if (auto current = player_.current_item(guild_id)) {
            auto result = permissions_.can_skip(member, current->requester_id);
            if (!result.allowed) {
                event.edit_response(error_embed("Permission Denied", result.reason));
                return;
            }
        }

        auto next = player_.skip(guild_id);

        dpp::embed embed;
        embed.set_title("⏭️ Skipped");
        if (next) {
            embed.set_description("Up next: **" + string_utils::escape_markdown(next->track.display_name()) + "**")
                 .set_color(0x0099ff);
            if (next->track.thumbnail) {
                embed.set_thumbnail(*next->track.thumbnail);
            }
        } else {
            embed.set_description("The queue is empty.").set_color(0xffa500);
        }
        event.edit_response(dpp::message().add_embed(embed));
    });
}

void MusicModule::cmd_stop(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    auto result = permissions_.can_stop(member);
    if (!result.allowed) {
        event.reply(error_embed("Permission Denied", result.reason));
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event]() {
        Snowflake guild_id = event.command.guild_id;

        if (!player_.is_connected(guild_id)) {
            event.edit_response(error_embed("Nothing Playing", "The bot is not playing music."));
            return;
        }

        player_.stop(guild_id);
        forget_channel(guild_id);
        set_listening("");

        event.edit_response(success_embed("Stopped", "Cleared the queue and left the voice channel."));
    });
}

void MusicModule::cmd_queue(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    int page = static_cast<int>(int_parameter(event, "page").value_or(1));

    event.thinking();
    get_thread_pool().enqueue([this, event, page]() {
        Snowflake guild_id = event.command.guild_id;

        auto snapshot = player_.snapshot(guild_id);
        if (!snapshot.current && snapshot.items.empty()) {
            event.edit_response(info_embed("Queue", "The queue is empty."));
            return;
        }

        auto queue_page = player_.get_queue_page(guild_id, page);
        event.edit_response(dpp::message().add_embed(queue_embed(snapshot, queue_page)));
    });
}

void MusicModule::cmd_nowplaying(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event]() {
        auto snapshot = player_.snapshot(event.command.guild_id);
        if (!snapshot.current) {
            event.edit_response(info_embed("Now Playing", "Nothing is playing right now."));
            return;
        }

        dpp::embed embed = now_playing_embed(*snapshot.current);

        // Show loop and volume status
        std::string status;
        if (snapshot.state.is_paused) status += "⏸️ Paused | ";
        if (snapshot.state.loop_mode == LoopMode::Track) status += "🔂 Loop Song | ";
        else if (snapshot.state.loop_mode == LoopMode::Queue) status += "🔁 Loop Queue | ";
        status += "🔊 " + std::to_string(snapshot.state.volume) + "%";
        embed.add_field("Status", status, false);

        event.edit_response(dpp::message().add_embed(embed));
    });
}

void MusicModule::cmd_volume(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    int level = static_cast<int>(int_parameter(event, "level").value_or(50));

    event.thinking();
    get_thread_pool().enqueue([this, event, level]() {
        bool live = player_.set_volume(event.command.guild_id, level);
        int stored = player_.get_state(event.command.guild_id).volume;

        std::string description = "Volume set to " + std::to_string(stored) + "%";
        if (!live) {
            description += ", applied from the next song";
        }
        event.edit_response(success_embed("Volume Set", description));
    });
}

void MusicModule::cmd_shuffle(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event]() {
        Snowflake guild_id = event.command.guild_id;

        if (player_.snapshot(guild_id).items.size() < 2) {
            event.edit_response(error_embed("Error", "Not enough songs to shuffle."));
            return;
        }

        size_t count = player_.shuffle_queue(guild_id);
        event.edit_response(success_embed("Shuffled", "Shuffled " + std::to_string(count) + " songs."));
    });
}

void MusicModule::cmd_loop(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    auto mode = parse_loop_mode(std::get<std::string>(event.get_parameter("mode")));
    if (!mode) {
        event.reply(error_embed("Loop Mode", "Unknown loop mode."));
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event, mode = *mode]() {
        player_.set_loop_mode(event.command.guild_id, mode);

        switch (mode) {
            case LoopMode::None:
                event.edit_response(success_embed("Loop Mode", "Loop disabled."));
                break;
            case LoopMode::Track:
                event.edit_response(success_embed("Loop Mode", "Now looping the current song."));
                break;
            case LoopMode::Queue:
                event.edit_response(success_embed("Loop Mode", "Now looping the queue."));
                break;
        }
    });
}

void MusicModule::cmd_remove(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    int position = static_cast<int>(int_parameter(event, "position").value_or(0));

    event.thinking();
    get_thread_pool().enqueue([this, event, member, position]() {
        Snowflake guild_id = event.command.guild_id;

        auto snapshot = player_.snapshot(guild_id);
        const QueueItem* target = nullptr;
        for (const auto& item : snapshot.items) {
            if (item.position == position) {
                target = &item;
                break;
            }
        }

        if (!target) {
            event.edit_response(error_embed("Invalid Position", "There is no queued song at position " +
                                std::to_string(position) + "."));
            return;
        }

        // Same rule as skipping: your own songs, or any song for moderators
        auto result = permissions_.can_skip(member, target->requester_id);
        if (!result.allowed) {
            event.edit_response(error_embed("Permission Denied", result.reason));
            return;
        }

        auto removed = player_.remove_from_queue(guild_id, position);
        if (!removed) {
            event.edit_response(error_embed("Invalid Position", "The queue changed, try again."));
            return;
        }

        event.edit_response(success_embed("Removed", "Removed **" +
                            string_utils::escape_markdown(removed->track.display_name()) + "** from the queue."));
    });
}

void MusicModule::cmd_clear(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    auto result = permissions_.can_clear_queue(member);
    if (!result.allowed) {
        event.reply(error_embed("Permission Denied", result.reason));
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event]() {
        size_t cleared = player_.clear_queue(event.command.guild_id);
        event.edit_response(success_embed("Cleared", "Removed " + std::to_string(cleared) + " upcoming songs."));
    });
}

void MusicModule::cmd_join(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    auto channel = member_voice_channel(event.command.guild_id, member.user_id);
    if (!channel) {
        event.reply(error_embed("Not in Voice", "You must be in a voice channel."));
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event, member, target = *channel]() {
        if (!join_channel(event, member, target)) {
            return;
        }
        event.edit_response(success_embed("Joined", "Joined <#" + std::to_string(target) + ">"));
    });
}

void MusicModule::cmd_leave(const dpp::slashcommand_t& event) {
    MemberInfo member = issuer(event);
    if (!check_channel(event, member)) {
        return;
    }

    auto result = permissions_.can_stop(member);
    if (!result.allowed) {
        event.reply(error_embed("Permission Denied", result.reason));
        return;
    }

    event.thinking();
    get_thread_pool().enqueue([this, event]() {
        Snowflake guild_id = event.command.guild_id;
        player_.disconnect(guild_id);
        forget_channel(guild_id);
        set_listening("");
        event.edit_response(success_embed("Left", "Disconnected from the voice channel."));
    });
}

// ==================== Notifications ====================

void MusicModule::on_session_event(Snowflake guild_id, const SessionEvent& event) {
    std::visit(overloaded{
        [&](const TrackStarted& e) {
            set_listening(e.item.track.display_name());
            notify(guild_id, now_playing_embed(e.item));
        },
        [&](const TrackEnded&) {},
        [&](const QueueEmptied&) {
            set_listening("");
            dpp::embed embed;
            embed.set_title("📭 Queue Ended")
                 .set_description("Add more songs with `/play`.")
                 .set_color(0xffa500);
            notify(guild_id, embed);
        },
        [&](const Errored& e) {
            dpp::embed embed;
            embed.set_title("❌ Playback Error")
                 .set_description(e.message)
                 .set_color(0xff0000);
            notify(guild_id, embed);
        },
        [&](const SessionClosed& e) {
            dpp::embed embed;
            embed.set_title("👋 Left Voice")
                 .set_description(e.reason + ".")
                 .set_color(0xffa500);
            notify(guild_id, embed);
            forget_channel(guild_id);
            set_listening("");
        },
    }, event);
}

void MusicModule::notify(Snowflake guild_id, const dpp::embed& embed) {
    Snowflake channel_id = 0;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = notification_channels_.find(guild_id);
        if (it == notification_channels_.end()) {
            return;
        }
        channel_id = it->second;
    }

    bot_.message_create(dpp::message(channel_id, "").add_embed(embed),
                        [channel_id](const dpp::confirmation_callback_t& callback) {
        if (callback.is_error()) {
            std::cerr << "[music] Failed to notify channel " << channel_id << ": "
                      << callback.get_error().message << std::endl;
        }
    });
}

void MusicModule::set_listening(const std::string& activity) {
    // Discord caps activity names at 128 characters
    std::string name = activity.empty() ? "/play" : string_utils::truncate(activity, 128);
    bot_.set_presence(dpp::presence(dpp::ps_online, dpp::at_listening, name));
}

void MusicModule::remember_channel(Snowflake guild_id, Snowflake channel_id) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    notification_channels_[guild_id] = channel_id;
}

void MusicModule::forget_channel(Snowflake guild_id) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    notification_channels_.erase(guild_id);
}

} // namespace jukebox
