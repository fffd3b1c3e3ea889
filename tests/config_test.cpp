#include <gtest/gtest.h>
#include "config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {
std::string write_temp(const std::string &name, const std::string &content){
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << content;
    return path.string();
}

class EnvGuard {
public:
    EnvGuard(const char *name, const char *value) : m_name(name) { ::setenv(name, value, 1); }
    ~EnvGuard() { ::unsetenv(m_name); }
private:
    const char *m_name;
};
}

TEST(ServerConfigTest, Defaults) {
    ServerConfig config;
    EXPECT_EQ(config.port, 8888);
    EXPECT_EQ(config.threads, 4);
    EXPECT_EQ(config.room.max_members, 10);
    EXPECT_EQ(config.history_default_limit, 50);
    EXPECT_EQ(config.history_max_limit, 100);
    EXPECT_EQ(config.room.master_handoff, MasterHandoff::Freeze);
    EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, FileThenEnvironment) {
    auto path = write_temp("listen_room_server_config.json",
        R"({"port": 9000, "threads": 2, "max_members": 5, "master_handoff": "transfer"})");
    EnvGuard port("LISTEN_ROOM_PORT", "9100");
    char program[] = "listen_room_server";
    char flag[] = "--config";
    std::vector<char> file(path.begin(), path.end());
    file.push_back('\0');
    char *argv[] = {program, flag, file.data()};

    auto config = ServerConfig::load(3, argv);
    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.threads, 2);
    EXPECT_EQ(config.room.max_members, 5);
    EXPECT_EQ(config.room.master_handoff, MasterHandoff::Transfer);
    std::filesystem::remove(path);
}

TEST(ServerConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(parse_master_handoff("sometimes"), std::invalid_argument);
    EnvGuard threads("LISTEN_ROOM_THREADS", "many");
    ServerConfig config;
    EXPECT_THROW(config.apply_environment(), std::invalid_argument);

    ServerConfig bad;
    bad.history_default_limit = 500;
    EXPECT_THROW(bad.validate(), std::invalid_argument);
    EXPECT_THROW(ServerConfig::from_json_file("/nonexistent/listen_room.json"), std::invalid_argument);
}

TEST(ServerConfigTest, ConfigFlagNeedsPath) {
    char program[] = "listen_room_server";
    char flag[] = "--config";
    char *argv[] = {program, flag};
    EXPECT_THROW(find_config_path(2, argv), std::invalid_argument);
    EXPECT_FALSE(find_config_path(1, argv));
}

TEST(ClientConfigTest, DefaultsNeedIdentity) {
    ClientConfig config;
    EXPECT_EQ(config.heartbeat_interval, std::chrono::milliseconds(5000));
    EXPECT_DOUBLE_EQ(config.drift_threshold_seconds, 2.0);
    EXPECT_EQ(config.max_reconnect_attempts, 10);
    EXPECT_THROW(config.validate(), std::invalid_argument);
    config.user_id = 7;
    config.username = "alice";
    EXPECT_NO_THROW(config.validate());
    config.drift_threshold_seconds = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ClientConfigTest, ReadsFile) {
    auto path = write_temp("listen_room_client_config.json",
        R"({"host": "music.local", "user_id": 3, "username": "carol", "room_id": "123456",
            "heartbeat_interval_ms": 2500, "drift_threshold_seconds": 1.5})");
    auto config = ClientConfig::from_json_file(path);
    EXPECT_EQ(config.host, "music.local");
    EXPECT_EQ(config.user_id, 3);
    EXPECT_EQ(config.room_id, "123456");
    EXPECT_EQ(config.heartbeat_interval, std::chrono::milliseconds(2500));
    EXPECT_DOUBLE_EQ(config.drift_threshold_seconds, 1.5);
    EXPECT_NO_THROW(config.validate());
    std::filesystem::remove(path);
}
