#include "bot.hpp"
#include <iostream>
#include <csignal>
#include <chrono>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_signal = 0;

void signal_handler(int signum) {
    g_signal = signum;
}

} // namespace

int main(int argc, char* argv[]) {
    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string env_path = argc > 1 ? argv[1] : ".env";

    std::cout << "Jukebox starting..." << std::endl;
    std::cout << "==========================" << std::endl;

    auto& bot = jukebox::get_bot();

    if (!bot.initialize(env_path)) {
        std::cerr << "Failed to initialize bot" << std::endl;
        return 1;
    }

    // The cluster blocks in run(); a watcher turns signals into a clean shutdown
    std::thread watcher([&bot]() {
        while (g_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        std::cout << "\nReceived signal " << g_signal << ", shutting down..." << std::endl;
        bot.request_stop();
    });
    watcher.detach();

    bot.run();

    // Cleanup
    bot.shutdown();

    std::cout << "Bot shutdown complete" << std::endl;
    return 0;
}
