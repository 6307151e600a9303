#include "bot.hpp"
#include "config.hpp"
#include "modules/music.hpp"
#include "utils/curl_helper.hpp"
#include <iostream>
#include <mutex>

namespace jukebox {

Bot::Bot() {}

Bot::~Bot() {
    shutdown();
}

bool Bot::initialize(const std::string& env_path) {
    auto& config = get_config();

    // Load configuration
    if (!config.load(env_path) || !config.is_valid()) {
        std::cerr << "Failed to load configuration" << std::endl;
        return false;
    }

    // Spotify lookups go through libcurl
    CurlHelper::global_init();
    curl_initialized_ = true;

    // Voice states and member roles drive the music permissions
    cluster_ = std::make_unique<dpp::cluster>(
        config.get_token(),
        dpp::i_default_intents | dpp::i_guild_members
    );

    cluster_->on_log(dpp::utility::cout_logger());

    music_module_ = std::make_unique<MusicModule>(*cluster_, config);
    std::cout << "Music module enabled" << std::endl;

    setup_event_handlers();

    std::cout << "Bot initialized successfully" << std::endl;
    return true;
}

void Bot::run() {
    if (!cluster_) {
        std::cerr << "Bot not initialized" << std::endl;
        return;
    }

    music_module_->start();

    // Returns once shutdown() has stopped the cluster
    cluster_->start(dpp::st_wait);
}

void Bot::request_stop() {
    if (cluster_) {
        cluster_->shutdown();
    }
}

void Bot::shutdown() {
    if (music_module_) {
        music_module_->stop();
    }

    request_stop();

    // Voice sessions close while the cluster object is still alive
    music_module_.reset();

    if (curl_initialized_) {
        CurlHelper::global_cleanup();
        curl_initialized_ = false;
    }
}

void Bot::setup_event_handlers() {
    cluster_->on_ready([this](const dpp::ready_t& event) {
        on_ready(event);
    });

    cluster_->on_slashcommand([this](const dpp::slashcommand_t& event) {
        on_slashcommand(event);
    });

    cluster_->on_voice_state_update([this](const dpp::voice_state_update_t& event) {
        on_voice_state_update(event);
    });

    cluster_->on_voice_ready([this](const dpp::voice_ready_t& event) {
        if (music_module_) {
            music_module_->handle_voice_ready(event);
        }
    });

    cluster_->on_voice_track_marker([this](const dpp::voice_track_marker_t& event) {
        if (music_module_) {
            music_module_->handle_track_marker(event);
        }
    });
}

void Bot::register_commands() {
    std::vector<dpp::slashcommand> commands;

    if (music_module_) {
        auto cmds = music_module_->get_commands();
        commands.insert(commands.end(), cmds.begin(), cmds.end());
    }

    cluster_->global_bulk_command_create(commands, [](const dpp::confirmation_callback_t& callback) {
        if (callback.is_error()) {
            std::cerr << "Failed to register commands: " << callback.get_error().message << std::endl;
        } else {
            std::cout << "Slash commands registered successfully" << std::endl;
        }
    });
}

void Bot::on_ready(const dpp::ready_t& event) {
    if (dpp::run_once<struct register_bot_commands>()) {
        std::cout << cluster_->me.username << " has connected to Discord!" << std::endl;
        std::cout << "Bot ID: " << cluster_->me.id << std::endl;

        register_commands();
        cluster_->set_presence(dpp::presence(dpp::ps_online, dpp::at_listening, "/play"));
    }
}

void Bot::on_slashcommand(const dpp::slashcommand_t& event) {
    std::string cmd = event.command.get_command_name();

    // Music commands only make sense inside a guild
    if (music_module_ && music_module_->handles(cmd)) {
        if (event.command.guild_id == 0) {
            event.reply(dpp::message("Music commands only work in servers.").set_flags(dpp::m_ephemeral));
            return;
        }
        music_module_->handle_command(event);
    }
}

void Bot::on_voice_state_update(const dpp::voice_state_update_t& event) {
    if (music_module_) {
        music_module_->handle_voice_state(event);
    }
}

// Global bot instance
static std::unique_ptr<Bot> g_bot;
static std::once_flag g_bot_init;

Bot& get_bot() {
    std::call_once(g_bot_init, []() {
        g_bot = std::make_unique<Bot>();
    });
    return *g_bot;
}

} // namespace jukebox
