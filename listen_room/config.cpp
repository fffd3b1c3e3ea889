#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace {
std::optional<std::string> env(const char *name){
    if(const char *value = std::getenv(name); value && *value){
        return std::string(value);
    }
    return std::nullopt;
}
int env_int(const char *name, int fallback){
    auto value = env(name);
    if(!value) return fallback;
    try{
        return std::stoi(*value);
    }catch(const std::exception &){
        throw std::invalid_argument(std::format("{} is not a number: {}", name, *value));
    }
}
std::int64_t env_int64(const char *name, std::int64_t fallback){
    auto value = env(name);
    if(!value) return fallback;
    try{
        return std::stoll(*value);
    }catch(const std::exception &){
        throw std::invalid_argument(std::format("{} is not a number: {}", name, *value));
    }
}
nlohmann::json read_json_file(const std::string &path){
    std::ifstream in(path);
    if(!in){
        throw std::invalid_argument(std::format("cannot open config file {}", path));
    }
    try{
        return nlohmann::json::parse(in);
    }catch(const nlohmann::json::parse_error &e){
        throw std::invalid_argument(std::format("config file {}: {}", path, e.what()));
    }
}
std::chrono::milliseconds millis_value(const nlohmann::json &j, const char *key, std::chrono::milliseconds fallback){
    return std::chrono::milliseconds(j.value(key, static_cast<std::int64_t>(fallback.count())));
}
}

MasterHandoff parse_master_handoff(const std::string &value){
    if(value == "freeze") return MasterHandoff::Freeze;
    if(value == "transfer") return MasterHandoff::Transfer;
    throw std::invalid_argument(std::format("unknown master_handoff policy: {}", value));
}

std::optional<std::string> find_config_path(int argc, char **argv){
    for(int i = 1; i < argc; ++i){
        std::string_view arg = argv[i] ? argv[i] : "";
        if(arg == "--config" || arg == "-c"){
            if(i + 1 >= argc || !argv[i + 1] || !*argv[i + 1]){
                throw std::invalid_argument("--config requires a path");
            }
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

ServerConfig ServerConfig::from_json_file(const std::string &path){
    auto j = read_json_file(path);
    ServerConfig config;
    config.port = j.value("port", config.port);
    config.threads = j.value("threads", config.threads);
    config.history_default_limit = j.value("history_default_limit", config.history_default_limit);
    config.history_max_limit = j.value("history_max_limit", config.history_max_limit);
    config.room.max_members = j.value("max_members", config.room.max_members);
    config.room.history_capacity = j.value("history_capacity", config.room.history_capacity);
    if(j.contains("master_handoff")){
        config.room.master_handoff = parse_master_handoff(j.at("master_handoff").get<std::string>());
    }
    return config;
}

void ServerConfig::apply_environment(){
    port = static_cast<std::uint16_t>(env_int("LISTEN_ROOM_PORT", port));
    threads = env_int("LISTEN_ROOM_THREADS", threads);
    room.max_members = env_int("LISTEN_ROOM_MAX_MEMBERS", room.max_members);
    history_default_limit = env_int("LISTEN_ROOM_HISTORY_LIMIT", history_default_limit);
    if(auto handoff = env("LISTEN_ROOM_MASTER_HANDOFF")){
        room.master_handoff = parse_master_handoff(*handoff);
    }
}

void ServerConfig::validate() const {
    if(threads < 1) throw std::invalid_argument("threads must be at least 1");
    if(room.max_members < 1) throw std::invalid_argument("max_members must be at least 1");
    if(history_max_limit < 1) throw std::invalid_argument("history_max_limit must be at least 1");
    if(history_default_limit < 1 || history_default_limit > history_max_limit){
        throw std::invalid_argument("history_default_limit must be in [1, history_max_limit]");
    }
}

ServerConfig ServerConfig::load(int argc, char **argv){
    ServerConfig config;
    if(auto path = find_config_path(argc, argv)){
        config = from_json_file(*path);
    }
    config.apply_environment();
    config.validate();
    return config;
}

ClientConfig ClientConfig::from_json_file(const std::string &path){
    auto j = read_json_file(path);
    ClientConfig config;
    config.host = j.value("host", config.host);
    config.port = j.value("port", config.port);
    config.user_id = j.value("user_id", config.user_id);
    config.username = j.value("username", config.username);
    config.avatar = j.value("avatar", config.avatar);
    config.token = j.value("token", config.token);
    config.room_id = j.value("room_id", config.room_id);
    config.heartbeat_interval = millis_value(j, "heartbeat_interval_ms", config.heartbeat_interval);
    config.drift_threshold_seconds = j.value("drift_threshold_seconds", config.drift_threshold_seconds);
    config.ping_interval = millis_value(j, "ping_interval_ms", config.ping_interval);
    config.reconnect_base = millis_value(j, "reconnect_base_ms", config.reconnect_base);
    config.reconnect_cap = millis_value(j, "reconnect_cap_ms", config.reconnect_cap);
    config.reconnect_jitter = j.value("reconnect_jitter", config.reconnect_jitter);
    config.max_reconnect_attempts = j.value("max_reconnect_attempts", config.max_reconnect_attempts);
    config.history_limit = j.value("history_limit", config.history_limit);
    return config;
}

void ClientConfig::apply_environment(){
    if(auto value = env("LISTEN_ROOM_HOST")) host = *value;
    port = static_cast<std::uint16_t>(env_int("LISTEN_ROOM_PORT", port));
    user_id = env_int64("LISTEN_ROOM_USER_ID", user_id);
    if(auto value = env("LISTEN_ROOM_USERNAME")) username = *value;
    if(auto value = env("LISTEN_ROOM_TOKEN")) token = *value;
    if(auto value = env("LISTEN_ROOM_ROOM_ID")) room_id = *value;
}

void ClientConfig::validate() const {
    if(host.empty()) throw std::invalid_argument("host is required");
    if(port == 0) throw std::invalid_argument("port must be non-zero");
    if(user_id <= 0) throw std::invalid_argument("user_id must be positive");
    if(username.empty()) throw std::invalid_argument("username is required");
    if(heartbeat_interval.count() <= 0) throw std::invalid_argument("heartbeat interval must be positive");
    if(ping_interval.count() <= 0) throw std::invalid_argument("ping interval must be positive");
    if(!(drift_threshold_seconds > 0)) throw std::invalid_argument("drift threshold must be positive");
    if(reconnect_base.count() <= 0 || reconnect_cap < reconnect_base){
        throw std::invalid_argument("reconnect delays must satisfy 0 < base <= cap");
    }
    if(reconnect_jitter < 0 || reconnect_jitter >= 1) throw std::invalid_argument("reconnect jitter must be in [0, 1)");
    if(max_reconnect_attempts < 1) throw std::invalid_argument("max_reconnect_attempts must be at least 1");
    if(history_limit < 1 || history_limit > 100) throw std::invalid_argument("history_limit must be in [1, 100]");
}

ClientConfig ClientConfig::load(int argc, char **argv){
    ClientConfig config;
    if(auto path = find_config_path(argc, argv)){
        config = from_json_file(*path);
    }
    config.apply_environment();
    config.validate();
    return config;
}
