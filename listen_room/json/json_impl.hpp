#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "model/types.hpp"

NLOHMANN_JSON_NAMESPACE_BEGIN
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt) j = *opt; else j = nullptr;
    }
    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) opt = std::nullopt; else opt = j.get<T>();
    }
};
NLOHMANN_JSON_NAMESPACE_END

NLOHMANN_JSON_SERIALIZE_ENUM(Role, {
    {Role::Member, "member"},
    {Role::Owner, "owner"},
    {Role::Admin, "admin"},
})
NLOHMANN_JSON_SERIALIZE_ENUM(Mode, {
    {Mode::Chat, "chat"},
    {Mode::Listen, "listen"},
})
NLOHMANN_JSON_SERIALIZE_ENUM(RoomStatus, {
    {RoomStatus::Active, "active"},
    {RoomStatus::Disbanded, "disbanded"},
})
NLOHMANN_JSON_SERIALIZE_ENUM(SongSource, {
    {SongSource::Netease, "netease"},
    {SongSource::Local, "local"},
})
NLOHMANN_JSON_SERIALIZE_ENUM(MessageType, {
    {MessageType::Chat, "chat"},
    {MessageType::System, "system"},
})
NLOHMANN_JSON_SERIALIZE_ENUM(ErrorCode, {
    {ErrorCode::ValidationError, "ValidationError"},
    {ErrorCode::RoomNotFound, "RoomNotFound"},
    {ErrorCode::PermissionDenied, "PermissionDenied"},
    {ErrorCode::NotMaster, "NotMaster"},
    {ErrorCode::OutOfRange, "OutOfRange"},
    {ErrorCode::NotConnected, "NotConnected"},
})

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RoomInfo, id, name, owner_id, status, created_at, max_members)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Member, user_id, username, avatar, role, mode, can_control, joined_at, online)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PlaylistItem, song_id, name, artist, cover, duration_seconds, source, position, added_by, added_at)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PlaybackSnapshot, song_id, song_name, artist, cover, duration_ms,
    position_seconds, is_playing, hls_url, reported_at, master_id, master_name)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ChatMessage, id, user_id, username, content, timestamp, type, client_msg_id)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RoomSummary, id, name, owner_name, member_count, is_owner, joined_at, status)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(RoomState, room, members, playlist, playback)

// Live channel, client -> server.
enum class ClientAction {
    Chat, SetMode, GrantControl, SetRole, TransferOwner,
    SongAdd, SongRemove, SongMove,
    Play, Pause, Seek, Next, Prev,
    MasterReport, MasterRequest, Sync, Ping,
    Unknown
};
// Live channel, server -> client.
enum class ServerEvent {
    Welcome, MemberList, Playlist, MasterSync, MasterRequest, MasterModeChange, ModeChange,
    RoleUpdate, ControlUpdate, PlaybackControl, Chat, Join, Leave, RoomDisband, State, Error, Pong
};

NLOHMANN_JSON_SERIALIZE_ENUM(ClientAction, {
    {ClientAction::Unknown, nullptr},
    {ClientAction::Chat, "chat"},
    {ClientAction::SetMode, "mode"},
    {ClientAction::GrantControl, "grant_control"},
    {ClientAction::SetRole, "set_role"},
    {ClientAction::TransferOwner, "transfer_owner"},
    {ClientAction::SongAdd, "song_add"},
    {ClientAction::SongRemove, "song_del"},
    {ClientAction::SongMove, "song_move"},
    {ClientAction::Play, "play"},
    {ClientAction::Pause, "pause"},
    {ClientAction::Seek, "seek"},
    {ClientAction::Next, "next"},
    {ClientAction::Prev, "prev"},
    {ClientAction::MasterReport, "master_report"},
    {ClientAction::MasterRequest, "master_request"},
    {ClientAction::Sync, "sync"},
    {ClientAction::Ping, "ping"},
})
NLOHMANN_JSON_SERIALIZE_ENUM(ServerEvent, {
    {ServerEvent::Error, "error"},
    {ServerEvent::Welcome, "welcome"},
    {ServerEvent::MemberList, "member_list"},
    {ServerEvent::Playlist, "playlist"},
    {ServerEvent::MasterSync, "master_sync"},
    {ServerEvent::MasterRequest, "master_request"},
    {ServerEvent::MasterModeChange, "master_mode"},
    {ServerEvent::ModeChange, "mode_change"},
    {ServerEvent::RoleUpdate, "role_update"},
    {ServerEvent::ControlUpdate, "control_update"},
    {ServerEvent::PlaybackControl, "playback_control"},
    {ServerEvent::Chat, "chat"},
    {ServerEvent::Join, "join"},
    {ServerEvent::Leave, "leave"},
    {ServerEvent::RoomDisband, "room_disband"},
    {ServerEvent::State, "state"},
    {ServerEvent::Pong, "pong"},
})

struct ClientMessage {
    ClientAction type = ClientAction::Unknown;
    nlohmann::json data = nlohmann::json::object();
};
struct ServerMessage {
    ServerEvent type = ServerEvent::Error;
    nlohmann::json data = nlohmann::json::object();
    Millis timestamp{};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ClientMessage, type, data)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerMessage, type, data, timestamp)

// Payloads of the client actions.
struct ChatData {
    std::string content;
    std::optional<std::string> client_msg_id;
};
struct ModeData {
    Mode mode = Mode::Chat;
};
struct TargetData {
    UserId target_user_id{};
    bool can_control = false;
    Role role = Role::Member;
};
struct PositionData {
    int position{};
};
struct MoveData {
    int from{};
    int to{};
};
struct SeekData {
    double position{};
};
struct ErrorData {
    ErrorCode code = ErrorCode::ValidationError;
    std::string message;
};
struct ModeChangeData {
    UserId user_id{};
    Mode mode = Mode::Chat;
    bool forced = false;
};
struct PlaybackControlData {
    ClientAction action = ClientAction::Unknown;
    double position{};
    UserId requested_by{};
};
struct MemberEventData {
    UserId user_id{};
    std::string username;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ChatData, content, client_msg_id)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ModeData, mode)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(TargetData, target_user_id, can_control, role)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PositionData, position)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(MoveData, from, to)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SeekData, position)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ErrorData, code, message)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ModeChangeData, user_id, mode, forced)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PlaybackControlData, action, position, requested_by)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(MemberEventData, user_id, username)

// Text that nlohmann's strict serializer would refuse is rejected at the edges.
inline bool is_valid_utf8(const std::string &text){
    try{
        (void)nlohmann::json(text).dump();
        return true;
    }catch(const nlohmann::json::type_error &){
        return false;
    }
}

// Never throws on encoding, so a broadcast cannot fail after the room has changed.
inline std::string dump_for_wire(const nlohmann::json &value){
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline std::string make_server_message(ServerEvent type, nlohmann::json data = nlohmann::json::object()){
    return dump_for_wire(nlohmann::json(ServerMessage{type, std::move(data), now_ms()}));
}
