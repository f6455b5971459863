#include <gtest/gtest.h>
#include "settings.hpp"
#include "logger.hpp"
#include "test_support.hpp"
#include <cstdlib>

using namespace motus;

class SettingsTest : public ::testing::Test {
protected:
    motus_test::TempDir dir;

    void TearDown() override {
        unsetenv("MOTUS_STATS_INTERVAL");
        unsetenv("MOTUS_CONFIG_DIR");
        unsetenv("XDG_DATA_HOME");
        unsetenv("XDG_CACHE_HOME");
    }
};

TEST_F(SettingsTest, MissingFileUsesDefaults) {
    Settings settings(dir.file("absent.json"));
    EXPECT_FALSE(settings.load());

    EXPECT_EQ(settings.get_log_level(), "WARNING");
    EXPECT_EQ(settings.get_stats_interval(), "2s");
    EXPECT_EQ(settings.get_connect_timeout(), "5m");
    EXPECT_EQ(settings.get_metadata_timeout_seconds(), 300);
    EXPECT_EQ(settings.get_poll_interval_ms(), 200);
    EXPECT_EQ(settings.get_error_text_limit(), 10000u);
}

TEST_F(SettingsTest, XdgDirectories) {
    setenv("XDG_DATA_HOME", dir.file("data").c_str(), 1);
    setenv("XDG_CACHE_HOME", dir.file("cache").c_str(), 1);

    Settings settings(dir.file("settings.json"));
    settings.load();

    EXPECT_EQ(settings.get_data_dir(), dir.file("data/motus"));
    EXPECT_EQ(settings.get_database_path(), dir.file("data/motus/motus.db"));
    EXPECT_EQ(settings.get_logs_dir(), dir.file("cache/motus/logs"));
    EXPECT_EQ(settings.get_log_file(), dir.file("cache/motus/motus.log"));

    EXPECT_TRUE(settings.ensure_directories());
    EXPECT_TRUE(std::filesystem::is_directory(dir.file("data/motus")));
    EXPECT_TRUE(std::filesystem::is_directory(dir.file("cache/motus/logs")));
}

TEST_F(SettingsTest, ConfigDirOverride) {
    setenv("MOTUS_CONFIG_DIR", dir.path().c_str(), 1);
    Settings settings;
    EXPECT_EQ(settings.path(), dir.file("settings.json"));
}

TEST_F(SettingsTest, LoadsFlatJson) {
    motus_test::write_file(dir.file("settings.json"),
        "{\n"
        "  \"rclone_path\": \"/opt/rclone\",\n"
        "  \"poll_interval_ms\": 50,\n"
        "  \"follow\": true,\n"
        "  \"logs_dir\": \"/tmp/with \\\"quotes\\\"\"\n"
        "}\n");

    Settings settings(dir.file("settings.json"));
    EXPECT_TRUE(settings.load());

    EXPECT_EQ(settings.get_rclone_path(), "/opt/rclone");
    EXPECT_EQ(settings.get_poll_interval_ms(), 50);
    EXPECT_TRUE(settings.get_bool("follow"));
    EXPECT_EQ(settings.get_logs_dir(), "/tmp/with \"quotes\"");
    EXPECT_EQ(settings.get_log_level(), "WARNING");
}

TEST_F(SettingsTest, EnvironmentOverridesFile) {
    motus_test::write_file(dir.file("settings.json"), "{\"stats_interval\": \"10s\"}");
    Settings settings(dir.file("settings.json"));
    settings.load();
    EXPECT_EQ(settings.get_stats_interval(), "10s");

    setenv("MOTUS_STATS_INTERVAL", "1s", 1);
    EXPECT_EQ(settings.get_stats_interval(), "1s");
}

TEST_F(SettingsTest, NonNumericFallsBack) {
    Settings settings(dir.file("settings.json"));
    settings.load();
    settings.set_string("poll_interval_ms", "fast");
    EXPECT_EQ(settings.get_poll_interval_ms(), 200);
}

TEST_F(SettingsTest, SaveAndReload) {
    Settings settings(dir.file("nested/settings.json"));
    settings.load();

    settings.set_string("rclone_config_file", "/home/u/rc \"main\".conf");
    settings.set_int("metadata_timeout_seconds", 42);
    ASSERT_TRUE(settings.save());

    Settings reloaded(dir.file("nested/settings.json"));
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.get_rclone_config_file(), "/home/u/rc \"main\".conf");
    EXPECT_EQ(reloaded.get_metadata_timeout_seconds(), 42);
}

TEST(SettingsEnvKey, UpperCasesWithPrefix) {
    EXPECT_EQ(Settings::env_key("rclone_path"), "MOTUS_RCLONE_PATH");
}

TEST(LoggerLevel, ParsesNames) {
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parse_level("info"), LogLevel::INFO);
    EXPECT_EQ(Logger::parse_level("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::parse_level("critical"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parse_level("bogus"), LogLevel::WARN);
}
