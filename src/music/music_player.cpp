#include "music/music_player.hpp"
#include <algorithm>
#include <future>
#include <iostream>

namespace jukebox {

MusicPlayer::MusicPlayer(TrackResolver& resolver, VoiceGateway& gateway, PlayerOptions options)
    : resolver_(resolver),
      gateway_(gateway),
      options_(options),
      pool_(options.worker_threads, "music"),
      resolve_pool_(options.resolver_threads, "resolve"),
      sessions_(pool_, options.max_queue_size, std::clamp(options.default_volume, 0, 100)) {
    options_.default_volume = std::clamp(options_.default_volume, 0, 100);
}

MusicPlayer::~MusicPlayer() {
    stop_inactivity_monitor();

    // Voice sessions must stop calling back before the pool goes away
    for (auto& s : sessions_.all()) {
        try {
            s->strand->dispatch([this, &s]() { disconnect_session(*s); });
        } catch (const std::exception& e) {
            std::cerr << "[music] Failed to disconnect guild " << s->guild_id << " on shutdown: "
                      << e.what() << std::endl;
        }
    }

    // Pending lookups finish against a newer generation and are dropped
    resolve_pool_.shutdown();
    pool_.shutdown();
}

void MusicPlayer::set_event_handler(SessionEventHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

std::shared_ptr<GuildSession> MusicPlayer::session(Snowflake guild_id) {
    return sessions_.get_or_create(guild_id);
}

// ==================== Connection ====================

namespace {

// Decided on the strand before the handshake starts
struct ConnectPlan {
    std::shared_ptr<VoiceSession> voice;
    std::uint64_t generation = 0;
    bool proceed = false;
};

} // namespace

std::shared_ptr<VoiceSession> MusicPlayer::connect(Snowflake guild_id, Snowflake channel_id,
                                                   Snowflake requester_id, const ConnectGate& gate) {
    auto s = session(guild_id);
    std::lock_guard<std::mutex> connect_lock(s->connect_mutex);

    ConnectPlan plan = s->strand->dispatch([&]() {
        GuildSession& session = *s;
        ConnectPlan decided;
        decided.generation = session.generation;

        bool connected = session.voice && session.voice->is_connected();
        if (connected && session.voice->channel_id() == channel_id) {
            decided.voice = session.voice;
            return decided;
        }

        if (gate) {
            ConnectContext context;
            context.owner_id = session.state.channel_owner_id;
            if (connected) {
                context.current_channel = session.voice->channel_id();
                context.occupants = session.voice->channel_occupants();
            }
            if (!gate(context)) {
                return decided;
            }
        }

        if (connected) {
            decided.voice = session.voice;
            session.moving = true;
        } else {
            session.connecting = true;
        }
        decided.proceed = true;
        return decided;
    });

    if (!plan.proceed) {
        return plan.voice;
    }
    if (plan.voice) {
        return finish_move(s, plan.voice, channel_id, plan.generation);
    }
    return finish_connect(s, channel_id, requester_id, plan.generation);
}

std::shared_ptr<VoiceSession> MusicPlayer::finish_connect(const std::shared_ptr<GuildSession>& s,
                                                          Snowflake channel_id, Snowflake requester_id,
                                                          std::uint64_t generation) {
    Snowflake guild_id = s->guild_id;

    std::shared_ptr<VoiceSession> voice;
    try {
        voice = gateway_.connect(guild_id, channel_id, options_.connect_timeout);
    } catch (const std::exception& e) {
        std::cerr << "[music] Voice connection error: " << e.what() << std::endl;
    }

    return s->strand->dispatch([&]() -> std::shared_ptr<VoiceSession> {
        GuildSession& session = *s;

        // Stopped while the handshake ran
        if (session.generation != generation) {
            if (voice) {
                std::cout << "[music] Dropping voice connection in guild " << guild_id
                          << ", the session was stopped while connecting" << std::endl;
                try {
                    voice->disconnect();
                } catch (const std::exception& e) {
                    std::cerr << "[music] Error while disconnecting guild " << guild_id << ": " << e.what()
                              << std::endl;
                }
            }
            return nullptr;
        }

        session.connecting = false;
        if (!voice) {
            std::cerr << "[music] Could not connect to channel " << channel_id << " in guild " << guild_id
                      << std::endl;
            return nullptr;
        }

        session.voice = voice;
        if (!session.state.channel_owner_id) {
            session.state.channel_owner_id = requester_id;
        }
        session.state.update_activity();

        std::cout << "[music] Connected to channel " << channel_id << " in guild " << guild_id << std::endl;
        return voice;
    });
}

std::shared_ptr<VoiceSession> MusicPlayer::finish_move(const std::shared_ptr<GuildSession>& s,
                                                       const std::shared_ptr<VoiceSession>& voice,
                                                       Snowflake channel_id, std::uint64_t generation) {
    Snowflake guild_id = s->guild_id;

    bool moved = false;
    try {
        moved = voice->move(channel_id);
    } catch (const std::exception& e) {
        std::cerr << "[music] Voice move error: " << e.what() << std::endl;
    }

    return s->strand->dispatch([&]() -> std::shared_ptr<VoiceSession> {
        GuildSession& session = *s;

        // Stopped while moving; the move may have rejoined a channel
        if (session.generation != generation || session.voice != voice) {
            if (moved) {
                try {
                    voice->disconnect();
                } catch (const std::exception& e) {
                    std::cerr << "[music] Error while disconnecting guild " << guild_id << ": " << e.what()
                              << std::endl;
                }
            }
            return nullptr;
        }

        session.moving = false;
        if (!moved) {
            std::cerr << "[music] Failed to move to channel " << channel_id << " in guild " << guild_id
                      << std::endl;
            resume_after_move(session);
            return nullptr;
        }

        session.state.update_activity();
        std::cout << "[music] Moved to channel " << channel_id << " in guild " << guild_id << std::endl;
        resume_after_move(session);
        return session.voice;
    });
}

// Restarts the current item when the move cut its stream off
void MusicPlayer::resume_after_move(GuildSession& session) {
    const auto& current = session.queue.current();
    if (!current || !session.state.is_playing || session.loading) {
        return;
    }
    if (!session.voice || !session.voice->is_connected()) {
        return;
    }
    if (session.voice->is_playing() || session.voice->is_paused()) {
        return;
    }

    bool was_paused = session.state.is_paused;
    QueueItem item = *current;
    if (!item.track.stream_url) {
        resolve_current(session, true);
        return;
    }

    if (start_item(session, item, *item.track.stream_url, false) && was_paused && session.voice->pause()) {
        session.state.is_paused = true;
    }
}

void MusicPlayer::disconnect(Snowflake guild_id) {
    auto s = session(guild_id);
    s->strand->dispatch([&]() { disconnect_session(*s); });
}

void MusicPlayer::stop(Snowflake guild_id) {
    disconnect(guild_id);
}

void MusicPlayer::disconnect_session(GuildSession& session) {
    if (session.voice) {
        try {
            if (session.voice->is_playing() || session.voice->is_paused()) {
                session.voice->stop();
            }
            session.voice->disconnect();
        } catch (const std::exception& e) {
            std::cerr << "[music] Error while disconnecting guild " << session.guild_id << ": " << e.what()
                      << std::endl;
        }
        session.voice.reset();
        std::cout << "[music] Disconnected from guild " << session.guild_id << std::endl;
    }

    session.reset(options_.max_queue_size, options_.default_volume);
}

// ==================== Playback ====================

std::optional<QueueItem> MusicPlayer::play(Snowflake guild_id, const Track& track,
                                           Snowflake requester_id, const std::string& requester_name) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() -> std::optional<QueueItem> {
        GuildSession& session = *s;

        auto item = session.queue.add(track, requester_id, requester_name);
        if (!item) {
            return std::nullopt;
        }

        if (!session.state.is_playing && !session.loading) {
            play_next(session);
        } else {
            preload_next(session);
        }

        session.state.update_activity();
        return item;
    });
}

std::vector<QueueItem> MusicPlayer::play_multiple(Snowflake guild_id, const std::vector<Track>& tracks,
                                                  Snowflake requester_id, const std::string& requester_name) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() {
        GuildSession& session = *s;

        auto items = session.queue.add_multiple(tracks, requester_id, requester_name);
        if (items.size() < tracks.size()) {
            std::cerr << "[music] Queue full, accepted " << items.size() << " of " << tracks.size()
                      << " tracks in guild " << guild_id << std::endl;
        }

        if (!items.empty()) {
            if (!session.state.is_playing && !session.loading) {
                play_next(session);
            } else {
                preload_next(session);
            }
        }

        session.state.update_activity();
        return items;
    });
}

std::optional<QueueItem> MusicPlayer::skip(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() -> std::optional<QueueItem> {
        GuildSession& session = *s;
        if (!session.voice) {
            return std::nullopt;
        }

        auto hint = session.queue.peek_next();

        if (session.loading) {
            // Never started, so it neither ends nor enters history
            ++session.resolve_serial;
            session.loading = false;
            session.queue.discard_current();
            session.retry_count = 0;
            play_next(session);
        } else if (session.voice->is_playing() || session.voice->is_paused()) {
            // The finished callback advances the queue
            session.voice->stop();
        }

        session.state.update_activity();
        return hint;
    });
}

bool MusicPlayer::pause(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() {
        GuildSession& session = *s;
        if (!session.voice || !session.voice->is_playing() || session.state.is_paused) {
            return false;
        }
        if (!session.voice->pause()) {
            return false;
        }

        session.state.is_paused = true;
        session.state.update_activity();
        return true;
    });
}

bool MusicPlayer::resume(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() {
        GuildSession& session = *s;
        if (!session.voice || !session.voice->is_paused()) {
            return false;
        }
        if (!session.voice->resume()) {
            return false;
        }

        session.state.is_paused = false;
        session.state.update_activity();
        return true;
    });
}

bool MusicPlayer::set_volume(Snowflake guild_id, int volume) {
    volume = std::clamp(volume, 0, 100);

    auto s = session(guild_id);
    return s->strand->dispatch([&]() {
        GuildSession& session = *s;
        session.state.volume = volume;

        if (session.voice && session.state.is_playing) {
            session.voice->set_volume(volume);
            return true;
        }
        return false;
    });
}

void MusicPlayer::set_loop_mode(Snowflake guild_id, LoopMode mode) {
    auto s = session(guild_id);
    s->strand->dispatch([&]() { s->state.loop_mode = mode; });
    std::cout << "[music] Loop mode set to " << to_string(mode) << " in guild " << guild_id << std::endl;
}

LoopMode MusicPlayer::get_loop_mode(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return s->state.loop_mode; });
}

// ==================== Queue management ====================

size_t MusicPlayer::clear_queue(Snowflake guild_id) {
    auto s = session(guild_id);
    size_t cleared = s->strand->dispatch([&]() {
        s->preloaded.reset();
        return s->queue.clear_upcoming();
    });
    std::cout << "[music] Cleared " << cleared << " tracks in guild " << guild_id << std::endl;
    return cleared;
}

std::optional<QueueItem> MusicPlayer::remove_from_queue(Snowflake guild_id, int position) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return s->queue.remove_at(position); });
}

size_t MusicPlayer::shuffle_queue(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() {
        s->queue.shuffle();
        preload_next(*s);
        return s->queue.size();
    });
}

QueuePage MusicPlayer::get_queue_page(Snowflake guild_id, int page, int per_page) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return s->queue.get_page(page, per_page); });
}

// ==================== Inspection ====================

QueueSnapshot MusicPlayer::snapshot(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() {
        const GuildSession& session = *s;

        QueueSnapshot snap;
        snap.current = session.queue.current();
        snap.items = session.queue.items();
        snap.history.assign(session.queue.history().begin(), session.queue.history().end());
        snap.total_duration = session.queue.total_duration();
        snap.state = session.state;
        snap.player_state = derive_state(session);
        snap.channel_id = session.voice ? session.voice->channel_id() : 0;
        return snap;
    });
}

GuildMusicState MusicPlayer::get_state(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return s->state; });
}

PlayerState MusicPlayer::get_player_state(Snowflake guild_id) {
    auto s = session(guild_id);
    // Visible while the strand is blocked inside connect()
    if (s->connecting) {
        return PlayerState::Connecting;
    }
    return s->strand->dispatch([&]() { return derive_state(*s); });
}

std::optional<QueueItem> MusicPlayer::current_item(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return s->queue.current(); });
}

std::optional<Snowflake> MusicPlayer::voice_channel(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() -> std::optional<Snowflake> {
        if (s->voice && s->voice->is_connected()) {
            return s->voice->channel_id();
        }
        return std::nullopt;
    });
}

std::vector<ChannelMember> MusicPlayer::channel_occupants(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() -> std::vector<ChannelMember> {
        if (s->voice && s->voice->is_connected()) {
            return s->voice->channel_occupants();
        }
        return {};
    });
}

bool MusicPlayer::is_connected(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return s->voice && s->voice->is_connected(); });
}

bool MusicPlayer::is_playing(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return s->state.is_playing && !s->state.is_paused; });
}

bool MusicPlayer::is_loading(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return s->loading; });
}

PlayerState MusicPlayer::derive_state(const GuildSession& session) const {
    if (session.connecting) {
        return PlayerState::Connecting;
    }
    if (!session.voice || !session.voice->is_connected()) {
        return PlayerState::Disconnected;
    }
    if (session.state.is_paused) {
        return PlayerState::Paused;
    }
    if (session.state.is_playing || session.loading) {
        return PlayerState::Playing;
    }
    return PlayerState::Idle;
}

// ==================== Track completion ====================

void MusicPlayer::play_next(GuildSession& session) {
    if (!session.voice || !session.voice->is_connected()) {
        std::cerr << "[music] Voice is not connected in guild " << session.guild_id << std::endl;
        session.state.is_playing = false;
        session.state.is_paused = false;
        return;
    }

    auto next = session.queue.get_next();
    if (!next) {
        session.state.is_playing = false;
        session.state.is_paused = false;
        session.queue.set_current(std::nullopt);
        session.retry_count = 0;
        emit(session.guild_id, QueueEmptied{});
        return;
    }

    auto stream_url = take_preloaded(session, next->track);
    if (stream_url) {
        next->track.stream_url = stream_url;
    }

    session.queue.set_current(std::move(*next));

    if (!session.queue.current()->track.stream_url) {
        resolve_current(session, false);
        return;
    }

    session.retry_count = 0;
    QueueItem item = *session.queue.current();
    start_item(session, item, *item.track.stream_url);
}

void MusicPlayer::resolve_current(GuildSession& session, bool replay) {
    std::uint64_t serial = ++session.resolve_serial;
    std::uint64_t generation = session.generation;
    std::weak_ptr<GuildSession> weak = session.shared_from_this();
    Track track = session.queue.current()->track;

    session.loading = true;

    bool queued = resolve_pool_.try_enqueue([this, weak, generation, serial, track, replay]() mutable {
        auto stream_url = resolve_stream(track);

        auto s = weak.lock();
        if (!s) {
            return;
        }
        s->strand->post([this, s, generation, serial, stream_url, replay]() {
            handle_resolved(*s, generation, serial, stream_url, replay);
        });
    });

    if (!queued) {
        std::cerr << "[music] Resolution skipped, pool is stopped" << std::endl;
        session.loading = false;
        session.state.is_playing = false;
        session.state.is_paused = false;
    }
}

void MusicPlayer::handle_resolved(GuildSession& session, std::uint64_t generation, std::uint64_t serial,
                                  const std::optional<std::string>& stream_url, bool replay) {
    // Stopped or skipped while resolving
    if (generation != session.generation || serial != session.resolve_serial || !session.loading) {
        std::cout << "[music] Dropping a stale stream url in guild " << session.guild_id << std::endl;
        return;
    }
    session.loading = false;

    auto& current = session.queue.current();
    if (!current) {
        return;
    }

    if (!stream_url) {
        std::cerr << "[music] Could not get a stream url for " << current->track.display_name() << std::endl;

        if (replay) {
            session.state.is_playing = false;
            session.state.is_paused = false;
            emit(session.guild_id, Errored{"Could not replay " + current->track.display_name()});
            return;
        }

        std::string name = current->track.display_name();
        session.queue.discard_current();

        if (session.retry_count < options_.max_retries) {
            ++session.retry_count;
            play_next(session);
            return;
        }

        session.retry_count = 0;
        session.state.is_playing = false;
        session.state.is_paused = false;
        emit(session.guild_id, Errored{"Could not play " + name});
        return;
    }

    current->track.stream_url = stream_url;
    if (!replay) {
        session.retry_count = 0;
    }

    QueueItem item = *current;
    start_item(session, item, *stream_url);
}

bool MusicPlayer::start_item(GuildSession& session, const QueueItem& item, const std::string& stream_url,
                             bool announce) {
    if (!session.voice) {
        session.state.is_playing = false;
        session.state.is_paused = false;
        return false;
    }

    std::uint64_t serial = ++session.play_serial;
    std::uint64_t generation = session.generation;
    std::weak_ptr<GuildSession> weak = session.shared_from_this();

    auto on_finished = [this, weak, generation, serial](const std::optional<std::string>& error) {
        auto s = weak.lock();
        if (!s) {
            return;
        }
        // Arrives on the transport's thread; apply it in session order
        s->strand->post([this, s, generation, serial, error]() {
            handle_track_finished(*s, generation, serial, error);
        });
    };

    bool started = false;
    try {
        started = session.voice->play(stream_url, session.state.volume, on_finished);
    } catch (const std::exception& e) {
        std::cerr << "[music] Playback error: " << e.what() << std::endl;
    }

    if (!started) {
        session.state.is_playing = false;
        session.state.is_paused = false;
        emit(session.guild_id, Errored{"Could not start " + item.track.display_name()});
        return false;
    }

    session.state.is_playing = true;
    session.state.is_paused = false;
    session.state.update_activity();

    if (announce) {
        std::cout << "[music] Now playing in guild " << session.guild_id << ": " << item.track.display_name()
                  << std::endl;
        emit(session.guild_id, TrackStarted{item});
    } else {
        std::cout << "[music] Restarted " << item.track.display_name() << " in guild " << session.guild_id
                  << std::endl;
    }

    preload_next(session);
    return true;
}

void MusicPlayer::handle_track_finished(GuildSession& session, std::uint64_t generation, std::uint64_t serial,
                                        const std::optional<std::string>& error) {
    // Disconnected since, or a newer stream replaced this one
    if (generation != session.generation || serial != session.play_serial) {
        return;
    }

    // Dropped by a channel change; finish_move() restarts it
    if (session.moving) {
        return;
    }

    if (error) {
        std::cerr << "[music] Playback error in guild " << session.guild_id << ": " << *error << std::endl;
    }

    const auto finished = session.queue.current();
    if (finished) {
        emit(session.guild_id, TrackEnded{*finished});
    }

    if (session.state.loop_mode == LoopMode::Track && finished) {
        if (finished->track.stream_url) {
            start_item(session, *finished, *finished->track.stream_url);
        } else {
            resolve_current(session, true);
        }
        return;
    }

    if (session.state.loop_mode == LoopMode::Queue && finished) {
        if (!session.queue.add(finished->track, finished->requester_id, finished->requester_name)) {
            std::cerr << "[music] Queue full, " << finished->track.display_name() << " drops out of the loop"
                      << std::endl;
        }
    }

    play_next(session);
}

// ==================== Preloading ====================

void MusicPlayer::preload_next(GuildSession& session) {
    auto head = session.queue.peek_next();
    if (!head) {
        session.preloaded.reset();
        return;
    }

    if (session.preloaded && session.preloaded->track_url == head->track.url) {
        return;
    }

    if (head->track.stream_url) {
        session.preloaded = PreloadedStream{head->track.url, *head->track.stream_url};
        return;
    }

    std::weak_ptr<GuildSession> weak = session.shared_from_this();
    std::uint64_t generation = session.generation;
    Track track = head->track;

    bool queued = resolve_pool_.try_enqueue([this, weak, generation, track]() mutable {
        auto stream_url = resolve_stream(track);

        auto s = weak.lock();
        if (!s) {
            return;
        }
        s->strand->post([s, generation, track_url = track.url, stream_url]() {
            // Torn down while resolving
            if (s->generation != generation) {
                return;
            }
            if (stream_url) {
                s->preloaded = PreloadedStream{track_url, *stream_url};
            } else {
                s->preloaded.reset();
            }
        });
    });
    if (!queued) {
        std::cerr << "[music] Preload skipped, pool is stopped" << std::endl;
    }
}

std::optional<std::string> MusicPlayer::take_preloaded(GuildSession& session, const Track& track) {
    if (!session.preloaded) {
        return std::nullopt;
    }

    PreloadedStream preloaded = std::move(*session.preloaded);
    session.preloaded.reset();

    if (preloaded.track_url != track.url) {
        return std::nullopt;
    }
    return preloaded.stream_url;
}

std::optional<std::string> MusicPlayer::resolve_stream(Track& track) {
    if (track.stream_url) {
        return track.stream_url;
    }

    try {
        auto stream_url = resolver_.get_stream_url(track);
        if (stream_url) {
            track.stream_url = stream_url;
        }
        return stream_url;
    } catch (const std::exception& e) {
        std::cerr << "[music] Stream url resolution failed for " << track.display_name() << ": " << e.what()
                  << std::endl;
        return std::nullopt;
    }
}

// ==================== Inactivity ====================

bool MusicPlayer::check_inactivity(Snowflake guild_id) {
    auto s = session(guild_id);
    return s->strand->dispatch([&]() { return check_inactivity_locked(*s); });
}

bool MusicPlayer::check_inactivity_locked(GuildSession& session) {
    if (!session.voice || !session.voice->is_connected()) {
        return false;
    }

    auto occupants = session.voice->channel_occupants();
    bool has_listeners = std::any_of(occupants.begin(), occupants.end(),
                                     [](const ChannelMember& m) { return !m.is_bot; });
    if (!has_listeners) {
        std::cout << "[music] Channel is empty, leaving guild " << session.guild_id << std::endl;
        disconnect_session(session);
        emit(session.guild_id, SessionClosed{"Everyone left the voice channel"});
        return true;
    }

    if (!session.state.is_playing && !session.loading) {
        auto idle = std::chrono::steady_clock::now() - session.state.last_activity;
        if (idle > options_.inactivity_timeout) {
            std::cout << "[music] Inactivity timeout in guild " << session.guild_id << std::endl;
            disconnect_session(session);
            emit(session.guild_id, SessionClosed{"Nothing played for a while"});
            return true;
        }
    }

    return false;
}

size_t MusicPlayer::sweep_inactive() {
    std::vector<std::future<bool>> results;

    for (auto& s : sessions_.all()) {
        auto promise = std::make_shared<std::promise<bool>>();
        results.push_back(promise->get_future());

        bool posted = s->strand->post([this, s, promise]() {
            try {
                promise->set_value(check_inactivity_locked(*s));
            } catch (const std::exception& e) {
                std::cerr << "[music] Inactivity check failed for guild " << s->guild_id << ": " << e.what()
                          << std::endl;
                promise->set_value(false);
            }
        });
        if (!posted) {
            promise->set_value(false);
        }
    }

    size_t disconnected = 0;
    for (auto& result : results) {
        if (result.get()) {
            ++disconnected;
        }
    }
    return disconnected;
}

void MusicPlayer::start_inactivity_monitor() {
    if (monitor_running_.exchange(true)) {
        return;
    }

    monitor_thread_ = std::thread([this]() {
        std::unique_lock<std::mutex> lock(monitor_mutex_);
        while (monitor_running_) {
            if (monitor_cv_.wait_for(lock, options_.sweep_interval, [this] { return !monitor_running_; })) {
                break;
            }

            lock.unlock();
            try {
                size_t disconnected = sweep_inactive();
                if (disconnected > 0) {
                    std::cout << "[music] Inactivity sweep closed " << disconnected << " session(s)" << std::endl;
                }
            } catch (const std::exception& e) {
                std::cerr << "[music] Inactivity sweep failed: " << e.what() << std::endl;
            }
            lock.lock();
        }
    });
}

void MusicPlayer::stop_inactivity_monitor() {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_running_ = false;
    }
    monitor_cv_.notify_all();

    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
}

void MusicPlayer::emit(Snowflake guild_id, const SessionEvent& event) {
    SessionEventHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = event_handler_;
    }
    if (!handler) {
        return;
    }

    try {
        handler(guild_id, event);
    } catch (const std::exception& e) {
        std::cerr << "[music] Event handler threw: " << e.what() << std::endl;
    }
}

} // namespace jukebox
