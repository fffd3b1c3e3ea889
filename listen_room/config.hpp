#pragma once
#include <cstddef>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

enum class MasterHandoff { Freeze, Transfer };

MasterHandoff parse_master_handoff(const std::string &value);

struct RoomSettings {
    int max_members = 10;
    std::size_t history_capacity = 1000;
    MasterHandoff master_handoff = MasterHandoff::Freeze;
};

struct ServerConfig {
    std::uint16_t port = 8888;
    int threads = 4;
    int history_default_limit = 50;
    int history_max_limit = 100;
    RoomSettings room;

    // Defaults, then the JSON file named by --config, then LISTEN_ROOM_* variables.
    static ServerConfig load(int argc, char **argv);
    static ServerConfig from_json_file(const std::string &path);
    void apply_environment();
    void validate() const;
};

struct ClientConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8888;
    std::int64_t user_id{};
    std::string username;
    std::string avatar;
    std::string token;
    std::string room_id;

    std::chrono::milliseconds heartbeat_interval{5000};
    double drift_threshold_seconds = 2.0;
    std::chrono::milliseconds ping_interval{20000};
    std::chrono::milliseconds reconnect_base{1000};
    std::chrono::milliseconds reconnect_cap{30000};
    double reconnect_jitter = 0.2;
    int max_reconnect_attempts = 10;
    int history_limit = 50;

    static ClientConfig load(int argc, char **argv);
    static ClientConfig from_json_file(const std::string &path);
    void apply_environment();
    void validate() const;
};

std::optional<std::string> find_config_path(int argc, char **argv);
