#pragma once

#include <dpp/dpp.h>
#include <memory>
#include <string>

namespace jukebox {

class MusicModule;

class Bot {
public:
    Bot();
    ~Bot();

    // Initialize and run the bot
    bool initialize(const std::string& env_path = ".env");
    void run();
    void shutdown();

    // Makes run() return; safe from any thread
    void request_stop();

    // Get the DPP cluster
    dpp::cluster& get_cluster() { return *cluster_; }

    // Register slash commands
    void register_commands();

    MusicModule* get_music_module() { return music_module_.get(); }

private:
    // Declared first so modules are destroyed before the cluster
    std::unique_ptr<dpp::cluster> cluster_;
    std::unique_ptr<MusicModule> music_module_;
    bool curl_initialized_ = false;

    // Event handlers
    void setup_event_handlers();
    void on_ready(const dpp::ready_t& event);
    void on_slashcommand(const dpp::slashcommand_t& event);
    void on_voice_state_update(const dpp::voice_state_update_t& event);
};

// Global bot instance
Bot& get_bot();

} // namespace jukebox
