#pragma once

#include "music/interfaces.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace jukebox {
namespace testing {

inline Track make_track(const std::string& title, int duration = 180) {
    Track track;
    track.title = title;
    track.url = "https://example.test/" + title;
    track.duration = duration;
    return track;
}

// Polls until pred holds or the timeout passes
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Resolves every track to "stream://<url><tag>" unless told to fail
class FakeResolver : public TrackResolver {
public:
    std::optional<Track> resolve_track(const std::string& url_or_query) override {
        return make_track(url_or_query);
    }

    std::vector<Track> resolve_playlist(const std::string& url, int max_tracks) override {
        std::vector<Track> tracks;
        for (int i = 0; i < max_tracks; ++i) {
            tracks.push_back(make_track(url + "-" + std::to_string(i)));
        }
        return tracks;
    }

    std::vector<Track> search(const std::string& query, int max_results) override {
        return resolve_playlist(query, max_results);
    }

    std::optional<std::string> get_stream_url(Track& track) override {
        if (track.stream_url) {
            return track.stream_url;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        ++calls_[track.url];
        std::string stream_url = "stream://" + track.url + tag_;
        if (held_.count(track.url)) {
            ++waiting_;
            released_.wait(lock, [this, &track] { return held_.count(track.url) == 0; });
            --waiting_;
        }
        if (failing_.count(track.url)) {
            return std::nullopt;
        }
        if (throwing_.count(track.url)) {
            throw std::runtime_error("resolver exploded");
        }
        track.stream_url = stream_url;
        return track.stream_url;
    }

    void fail(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(url);
    }

    void throw_on(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        throwing_.insert(url);
    }

    // Appended to every stream url handed out from now on
    void set_tag(const std::string& tag) {
        std::lock_guard<std::mutex> lock(mutex_);
        tag_ = tag;
    }

    // Lookups of url block until release()
    void hold(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.insert(url);
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_.clear();
        }
        released_.notify_all();
    }

    // Lookups currently blocked in hold()
    int waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

    int calls(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(url);
        return it == calls_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::set<std::string> failing_;
    std::set<std::string> throwing_;
    std::set<std::string> held_;
    std::string tag_;
    int waiting_ = 0;
    std::map<std::string, int> calls_;
};

// Voice session driven by the test: finish() plays the part of the transport
class FakeVoiceSession : public VoiceSession {
public:
    explicit FakeVoiceSession(Snowflake channel_id) : channel_id_(channel_id) {
        occupants_.push_back(ChannelMember{1000, false});
    }

    bool move(Snowflake channel_id) override {
        bool drops_stream = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            drops_stream = move_drops_stream_;
        }
        // Like a transport that rebuilds its connection to change channel
        if (drops_stream) {
            finish();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_move_) {
            return false;
        }
        channel_id_ = channel_id;
        ++moves_;
        return true;
    }

    bool play(const std::string& stream_url, int volume, FinishedCallback on_finished) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_play_ || !connected_) {
            return false;
        }
        played_.push_back(stream_url);
        volume_ = volume;
        on_finished_ = std::move(on_finished);
        paused_ = false;
        return true;
    }

    bool pause() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!on_finished_ || paused_) {
            return false;
        }
        paused_ = true;
        return true;
    }

    bool resume() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!paused_) {
            return false;
        }
        paused_ = false;
        return true;
    }

    void stop() override {
        ++stops_;
        finish();
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        ++disconnects_;
    }

    void set_volume(int volume) override {
        std::lock_guard<std::mutex> lock(mutex_);
        volume_ = volume;
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    bool is_playing() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(on_finished_) && !paused_;
    }

    bool is_paused() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(on_finished_) && paused_;
    }

    Snowflake channel_id() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return channel_id_;
    }

    std::vector<ChannelMember> channel_occupants() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return occupants_;
    }

    // Ends the stream in flight the way a transport would, from the caller's thread
    bool finish(const std::optional<std::string>& error = std::nullopt) {
        FinishedCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = std::move(on_finished_);
            on_finished_ = nullptr;
            paused_ = false;
        }
        if (!callback) {
            return false;
        }
        callback(error);
        return true;
    }

    // Keeps the callback so a test can deliver it late
    FinishedCallback steal_callback() {
        std::lock_guard<std::mutex> lock(mutex_);
        FinishedCallback callback = std::move(on_finished_);
        on_finished_ = nullptr;
        return callback;
    }

    void set_occupants(std::vector<ChannelMember> occupants) {
        std::lock_guard<std::mutex> lock(mutex_);
        occupants_ = std::move(occupants);
    }

    void set_fail_play(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_play_ = fail;
    }

    void set_fail_move(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_move_ = fail;
    }

    void set_move_drops_stream(bool drops) {
        std::lock_guard<std::mutex> lock(mutex_);
        move_drops_stream_ = drops;
    }

    std::vector<std::string> played() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return played_;
    }

    int volume() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return volume_;
    }

    int moves() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return moves_;
    }

    int disconnects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return disconnects_;
    }

    int stops() const { return stops_; }

private:
    mutable std::mutex mutex_;
    Snowflake channel_id_;
    bool connected_ = true;
    bool paused_ = false;
    bool fail_play_ = false;
    bool fail_move_ = false;
    bool move_drops_stream_ = false;
    int volume_ = 0;
    int moves_ = 0;
    int disconnects_ = 0;
    std::atomic<int> stops_{0};
    std::vector<std::string> played_;
    std::vector<ChannelMember> occupants_;
    FinishedCallback on_finished_;
};

class FakeVoiceGateway : public VoiceGateway {
public:
    std::shared_ptr<VoiceSession> connect(Snowflake guild_id, Snowflake channel_id,
                                          std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++connects_;
        last_timeout_ = timeout;
        if (held_) {
            ++waiting_;
            released_.wait(lock, [this] { return !held_; });
            --waiting_;
        }
        if (fail_connect_) {
            return nullptr;
        }
        auto session = std::make_shared<FakeVoiceSession>(channel_id);
        sessions_[guild_id] = session;
        return session;
    }

    std::shared_ptr<FakeVoiceSession> session(Snowflake guild_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(guild_id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    void set_fail_connect(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_connect_ = fail;
    }

    // Handshakes block until release()
    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        released_.notify_all();
    }

    int waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

    int connects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connects_;
    }

    std::chrono::milliseconds last_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable released_;
    bool fail_connect_ = false;
    bool held_ = false;
    int waiting_ = 0;
    int connects_ = 0;
    std::chrono::milliseconds last_timeout_{0};
    std::map<Snowflake, std::shared_ptr<FakeVoiceSession>> sessions_;
};

class FakeMemberDirectory : public MemberDirectory {
public:
    std::optional<MemberInfo> find_member(Snowflake guild_id, Snowflake user_id) const override {
        (void)guild_id;
        auto it = members_.find(user_id);
        if (it == members_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    MemberInfo add(Snowflake user_id, std::vector<Snowflake> roles = {}) {
        MemberInfo member;
        member.user_id = user_id;
        member.name = "user" + std::to_string(user_id);
        member.role_ids = std::move(roles);
        members_[user_id] = member;
        return member;
    }

    void remove(Snowflake user_id) { members_.erase(user_id); }

private:
    std::map<Snowflake, MemberInfo> members_;
};

} // namespace testing
} // namespace jukebox
