#include "adapters/dpp_voice.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <thread>
#include <vector>

namespace jukebox {

DppVoiceSession::DppVoiceSession(dpp::cluster& cluster, Snowflake guild_id, std::string ffmpeg_path,
                                 std::chrono::milliseconds move_timeout)
    : cluster_(cluster),
      guild_id_(guild_id),
      ffmpeg_path_(std::move(ffmpeg_path)),
      move_timeout_(move_timeout) {}

DppVoiceSession::~DppVoiceSession() {
    // Feeders hold a shared_ptr, so none is running any more
    active_track_ = 0;
}

dpp::discord_client* DppVoiceSession::shard() const {
    dpp::guild* guild = dpp::find_guild(guild_id_);
    if (!guild) {
        return nullptr;
    }
    return cluster_.get_shard(guild->shard_id);
}

dpp::discord_voice_client* DppVoiceSession::voice_client() const {
    dpp::discord_client* client = shard();
    if (!client) {
        return nullptr;
    }

    dpp::voiceconn* conn = client->get_voice(guild_id_);
    if (!conn || !conn->voiceclient || !conn->voiceclient->is_ready()) {
        return nullptr;
    }
    return conn->voiceclient;
}

bool DppVoiceSession::join(Snowflake channel_id, std::chrono::milliseconds timeout) {
    dpp::discord_client* client = shard();
    if (!client) {
        std::cerr << "[voice] No shard for guild " << guild_id_ << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = false;
    }

    client->connect_voice(guild_id_, channel_id, false, true);

    std::unique_lock<std::mutex> lock(mutex_);
    bool joined = ready_cv_.wait_for(lock, timeout, [this, channel_id] {
        return ready_ && channel_id_ == channel_id;
    });

    if (!joined) {
        std::cerr << "[voice] Timed out joining channel " << channel_id << " in guild " << guild_id_ << std::endl;
    }
    return joined;
}

bool DppVoiceSession::move(Snowflake channel_id) {
    // D++ tears down the old voice client; the stream in flight ends here and
    // the player starts it again in the new channel
    stop();
    return join(channel_id, move_timeout_);
}

void DppVoiceSession::handle_ready(Snowflake channel_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = true;
        channel_id_ = channel_id;
    }
    ready_cv_.notify_all();
}

void DppVoiceSession::handle_marker(const std::string& meta) {
    std::uint64_t track_id = 0;
    try {
        track_id = std::stoull(meta);
    } catch (const std::exception&) {
        return;
    }
    finish(track_id, std::nullopt);
}

bool DppVoiceSession::handle_detached() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ready_) {
            return false;
        }
        ready_ = false;
    }
    active_track_ = 0;

    auto callback = take_callback();
    if (callback) {
        callback(std::string("Voice connection closed"));
    }
    return true;
}

bool DppVoiceSession::play(const std::string& stream_url, int volume, FinishedCallback on_finished) {
    dpp::discord_voice_client* client = voice_client();
    if (!client) {
        return false;
    }

    FinishedCallback previous;
    std::uint64_t track_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(on_finished_);
        on_finished_ = std::move(on_finished);
        paused_ = false;
        track_id = ++next_track_;
    }

    client->stop_audio();
    client->pause_audio(false);
    volume_ = std::clamp(volume, 0, 100);
    active_track_ = track_id;

    std::thread([self = shared_from_this(), stream_url, track_id]() {
        self->feed(stream_url, track_id);
    }).detach();

    if (previous) {
        previous(std::nullopt);
    }
    return true;
}

void DppVoiceSession::feed(std::string stream_url, std::uint64_t track_id) {
    std::string cmd = string_utils::shell_quote(ffmpeg_path_) +
                      " -reconnect 1 -reconnect_streamed 1 -reconnect_delay_max 5 -i " +
                      string_utils::shell_quote(stream_url) +
                      " -vn -f s16le -ar 48000 -ac 2 -loglevel error pipe:1 2>/dev/null";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        finish(track_id, std::string("Could not start ffmpeg"));
        return;
    }

    std::vector<std::uint8_t> frame(kFrameBytes);
    size_t frames_sent = 0;
    bool lost_connection = false;

    while (active_track_ == track_id) {
        size_t length = fread(frame.data(), 1, frame.size(), pipe);
        length -= length % 4;
        if (length == 0) {
            break;
        }

        // Volume is applied in software, 100 leaves samples untouched
        int volume = volume_;
        if (volume != 100) {
            auto* samples = reinterpret_cast<std::int16_t*>(frame.data());
            for (size_t i = 0; i < length / 2; ++i) {
                samples[i] = static_cast<std::int16_t>(samples[i] * volume / 100);
            }
        }

        dpp::discord_voice_client* client = voice_client();
        if (!client) {
            lost_connection = true;
            break;
        }

        // Keep the send buffer short so pause, stop and volume react quickly
        while (active_track_ == track_id && client->get_secs_remaining() > kMaxBufferedSecs) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (active_track_ != track_id) {
            break;
        }

        client->send_audio_raw(reinterpret_cast<std::uint16_t*>(frame.data()), length);
        ++frames_sent;
    }

    pclose(pipe);

    // Superseded by play() or stop(), which report on their own
    if (active_track_ != track_id) {
        return;
    }

    if (lost_connection) {
        finish(track_id, std::string("Voice connection lost"));
        return;
    }

    if (frames_sent == 0) {
        finish(track_id, std::string("ffmpeg produced no audio"));
        return;
    }

    dpp::discord_voice_client* client = voice_client();
    if (!client) {
        finish(track_id, std::string("Voice connection lost"));
        return;
    }
    client->insert_marker(std::to_string(track_id));
}

void DppVoiceSession::finish(std::uint64_t track_id, const std::optional<std::string>& error) {
    FinishedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (track_id != next_track_ || !on_finished_) {
            return;
        }
        callback = std::move(on_finished_);
        on_finished_ = nullptr;
        paused_ = false;
    }
    active_track_.compare_exchange_strong(track_id, 0);

    callback(error);
}

FinishedCallback DppVoiceSession::take_callback() {
    std::lock_guard<std::mutex> lock(mutex_);
    FinishedCallback callback = std::move(on_finished_);
    on_finished_ = nullptr;
    paused_ = false;
    return callback;
}

bool DppVoiceSession::pause() {
    dpp::discord_voice_client* client = voice_client();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client || !on_finished_ || paused_) {
        return false;
    }
    client->pause_audio(true);
    paused_ = true;
    return true;
}

bool DppVoiceSession::resume() {
    dpp::discord_voice_client* client = voice_client();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client || !paused_) {
        return false;
    }
    client->pause_audio(false);
    paused_ = false;
    return true;
}

void DppVoiceSession::stop() {
    active_track_ = 0;
    auto callback = take_callback();

    if (dpp::discord_voice_client* client = voice_client()) {
        client->stop_audio();
        client->pause_audio(false);
    }

    if (callback) {
        callback(std::nullopt);
    }
}

void DppVoiceSession::disconnect() {
    stop();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ready_) {
            return;
        }
        ready_ = false;
    }

    if (dpp::discord_client* client = shard()) {
        client->disconnect_voice(guild_id_);
    }
}

void DppVoiceSession::set_volume(int volume) {
    volume_ = std::clamp(volume, 0, 100);
}

bool DppVoiceSession::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_;
}

bool DppVoiceSession::is_playing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(on_finished_) && !paused_;
}

bool DppVoiceSession::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(on_finished_) && paused_;
}

std::vector<ChannelMember> DppVoiceSession::channel_occupants() const {
    std::vector<ChannelMember> members;

    dpp::guild* guild = dpp::find_guild(guild_id_);
    if (!guild) {
        return members;
    }

    Snowflake channel = channel_id_;
    for (const auto& [user_id, state] : guild->voice_members) {
        if (state.channel_id != channel) {
            continue;
        }
        // Uncached users count as people
        dpp::user* user = dpp::find_user(user_id);
        members.push_back(ChannelMember{static_cast<Snowflake>(user_id), user ? user->is_bot() : false});
    }
    return members;
}

// ==================== Gateway ====================

DppVoiceGateway::DppVoiceGateway(dpp::cluster& cluster, std::string ffmpeg_path)
    : cluster_(cluster), ffmpeg_path_(std::move(ffmpeg_path)) {}

std::shared_ptr<DppVoiceSession> DppVoiceGateway::find(Snowflake guild_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(guild_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto session = it->second.lock();
    if (!session) {
        sessions_.erase(it);
    }
    return session;
}

std::shared_ptr<VoiceSession> DppVoiceGateway::connect(Snowflake guild_id, Snowflake channel_id,
                                                       std::chrono::milliseconds timeout) {
    auto session = std::make_shared<DppVoiceSession>(cluster_, guild_id, ffmpeg_path_, timeout);
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[guild_id] = session;
    }

    if (!session->join(channel_id, timeout)) {
        // Leave whatever half-open handshake is left
        if (dpp::guild* guild = dpp::find_guild(guild_id)) {
            if (dpp::discord_client* shard = cluster_.get_shard(guild->shard_id)) {
                shard->disconnect_voice(guild_id);
            }
        }
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(guild_id);
        return nullptr;
    }

    return session;
}

void DppVoiceGateway::handle_voice_ready(const dpp::voice_ready_t& event) {
    if (!event.voice_client) {
        return;
    }
    if (auto session = find(event.voice_client->server_id)) {
        session->handle_ready(event.voice_client->channel_id);
    }
}

void DppVoiceGateway::handle_track_marker(const dpp::voice_track_marker_t& event) {
    if (!event.voice_client) {
        return;
    }
    if (auto session = find(event.voice_client->server_id)) {
        session->handle_marker(event.track_meta);
    }
}

bool DppVoiceGateway::handle_bot_left(Snowflake guild_id) {
    if (auto session = find(guild_id)) {
        return session->handle_detached();
    }
    return false;
}

} // namespace jukebox
