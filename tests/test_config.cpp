#include <gtest/gtest.h>

#include "config.hpp"
#include <cstdio>
#include <fstream>
#include <unistd.h>

namespace jukebox {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "/tmp/jukebox_config_test_" + std::to_string(getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".env";
    }

    void TearDown() override { std::remove(path_.c_str()); }

    void write(const std::string& contents) {
        std::ofstream out(path_);
        out << contents;
    }

    std::string path_;
};

TEST_F(ConfigTest, MissingFileFails) {
    Config config;
    EXPECT_FALSE(config.load("/tmp/jukebox_config_test_does_not_exist.env"));
    EXPECT_FALSE(config.is_valid());
}

TEST_F(ConfigTest, DefaultsWhenKeysAbsent) {
    write("DISCORD_BOT_TOKEN=abc\n");
    Config config;
    ASSERT_TRUE(config.load(path_));

    EXPECT_TRUE(config.is_valid());
    EXPECT_EQ(config.get_inactivity_timeout(), 300);
    EXPECT_EQ(config.get_max_queue_size(), 100);
    EXPECT_EQ(config.get_default_volume(), 50);
    EXPECT_EQ(config.get_max_retries(), 3);
    EXPECT_EQ(config.get_max_playlist_tracks(), 50);
    EXPECT_EQ(config.get_music_channel_id(), 0u);
    EXPECT_EQ(config.get_ytdlp_path(), "yt-dlp");
    EXPECT_EQ(config.get_ffmpeg_path(), "ffmpeg");
    EXPECT_FALSE(config.get_spotify_client_id().has_value());
}

TEST_F(ConfigTest, ParsesValuesQuotesAndComments) {
    write("# bot settings\n"
          "DISCORD_BOT_TOKEN=\"quoted-token\"\n"
          "\n"
          "MAIN_ADMIN_ID = 1234\n"
          "MUSIC_CHANNEL_ID=555\n"
          "MUSIC_INACTIVITY_TIMEOUT=120\n"
          "MUSIC_MAX_QUEUE_SIZE=25\n"
          "MUSIC_WORKER_THREADS=2\n"
          "MUSIC_RESOLVER_THREADS=6\n"
          "YTDLP_PATH='/opt/bin/yt-dlp'\n"
          "SPOTIFY_CLIENT_ID=id\n"
          "SPOTIFY_CLIENT_SECRET=secret\n"
          "not a setting\n");
    Config config;
    ASSERT_TRUE(config.load(path_));

    EXPECT_EQ(config.get_token(), "quoted-token");
    EXPECT_EQ(config.get_main_admin_id(), 1234u);
    EXPECT_EQ(config.get_music_channel_id(), 555u);
    EXPECT_EQ(config.get_inactivity_timeout(), 120);
    EXPECT_EQ(config.get_max_queue_size(), 25);
    EXPECT_EQ(config.get_worker_threads(), 2);
    EXPECT_EQ(config.get_resolver_threads(), 6);
    EXPECT_EQ(config.player_options().resolver_threads, 6u);
    EXPECT_EQ(config.get_ytdlp_path(), "/opt/bin/yt-dlp");
    EXPECT_EQ(config.get_spotify_client_id(), std::string("id"));
    EXPECT_EQ(config.get_spotify_client_secret(), std::string("secret"));
}

TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
    write("DISCORD_BOT_TOKEN=abc\n"
          "MUSIC_MAX_QUEUE_SIZE=lots\n"
          "MUSIC_MAX_RETRIES=-1\n"
          "MUSIC_DEFAULT_VOLUME=250\n"
          "MUSIC_CONNECT_TIMEOUT=0\n"
          "MAIN_ADMIN_ID=nobody\n");
    Config config;
    ASSERT_TRUE(config.load(path_));

    EXPECT_EQ(config.get_max_queue_size(), 100);
    EXPECT_EQ(config.get_max_retries(), 3);
    EXPECT_EQ(config.get_default_volume(), 100);
    EXPECT_EQ(config.get_connect_timeout(), 10);
    EXPECT_EQ(config.get_main_admin_id(), 0u);
}

TEST_F(ConfigTest, RoleListsAndPermissionLevels) {
    write("DISCORD_BOT_TOKEN=abc\n"
          "MAIN_ADMIN_ID=9\n"
          "ADMIN_ROLES=100, 200,,bogus\n"
          "MODERATOR_ROLES=300,200\n");
    Config config;
    ASSERT_TRUE(config.load(path_));

    EXPECT_EQ(config.get_admin_roles(), (std::vector<Snowflake>{100, 200}));
    EXPECT_EQ(config.get_moderator_roles(), (std::vector<Snowflake>{300, 200}));

    auto permissions = config.permission_config();
    EXPECT_EQ(permissions.main_admin_id, 9u);
    EXPECT_EQ(permissions.role_levels.at(100), PermissionLevel::Admin);
    EXPECT_EQ(permissions.role_levels.at(200), PermissionLevel::Admin);
    EXPECT_EQ(permissions.role_levels.at(300), PermissionLevel::Moderator);
}

TEST_F(ConfigTest, PlayerOptionsFollowSettings) {
    write("DISCORD_BOT_TOKEN=abc\n"
          "MUSIC_INACTIVITY_TIMEOUT=30\n"
          "MUSIC_SWEEP_INTERVAL=5\n"
          "MUSIC_CONNECT_TIMEOUT=4\n"
          "MUSIC_DEFAULT_VOLUME=70\n");
    Config config;
    ASSERT_TRUE(config.load(path_));

    auto options = config.player_options();
    EXPECT_EQ(options.inactivity_timeout, std::chrono::seconds(30));
    EXPECT_EQ(options.sweep_interval, std::chrono::seconds(5));
    EXPECT_EQ(options.connect_timeout, std::chrono::milliseconds(4000));
    EXPECT_EQ(options.default_volume, 70);
    EXPECT_EQ(options.max_queue_size, 100u);
}

} // namespace
} // namespace jukebox
