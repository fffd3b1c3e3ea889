#pragma once
#include "common.hpp"
#include <optional>
#include <string>
#include <vector>

using RoomCode = std::string;

enum class Role { Owner, Admin, Member };
enum class Mode { Chat, Listen };
enum class RoomStatus { Active, Disbanded };
enum class SongSource { Netease, Local };
enum class MessageType { Chat, System };

struct RoomInfo {
    RoomCode id;
    std::string name;
    UserId owner_id{};
    RoomStatus status = RoomStatus::Active;
    Millis created_at{};
    int max_members = 10;
};

struct Member {
    UserId user_id{};
    std::string username;
    std::string avatar;
    Role role = Role::Member;
    Mode mode = Mode::Chat;
    bool can_control = false;
    Millis joined_at{};
    bool online = false;
};

struct PlaylistItem {
    std::string song_id;
    std::string name;
    std::string artist;
    std::string cover;
    int duration_seconds{};
    SongSource source = SongSource::Netease;
    int position{};
    UserId added_by{};
    Millis added_at{};
};

struct PlaybackSnapshot {
    std::string song_id;
    std::string song_name;
    std::string artist;
    std::string cover;
    std::int64_t duration_ms{};
    double position_seconds{};
    bool is_playing = false;
    std::string hls_url;
    Millis reported_at{};
    UserId master_id{};
    std::string master_name;
};

struct ChatMessage {
    std::int64_t id{};
    UserId user_id{};
    std::string username;
    std::string content;
    Millis timestamp{};
    MessageType type = MessageType::Chat;
    std::optional<std::string> client_msg_id;
};

// One entry of the "my rooms" listing.
struct RoomSummary {
    RoomCode id;
    std::string name;
    std::string owner_name;
    int member_count{};
    bool is_owner = false;
    Millis joined_at{};
    RoomStatus status = RoomStatus::Active;
};

struct RoomState {
    RoomInfo room;
    std::vector<Member> members;
    std::vector<PlaylistItem> playlist;
    std::optional<PlaybackSnapshot> playback;
};

inline bool is_master(const Member &member){
    return member.role == Role::Owner && member.mode == Mode::Listen;
}
