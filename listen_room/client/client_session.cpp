#include "client/client_session.hpp"
#include <algorithm>
#include <format>
#include <iterator>
#include <iostream>

ClientSession::ClientSession(UserId user_id, std::string username, Player &player, Transport transport,
                             double drift_threshold)
    : m_user_id(user_id),
      m_player(player),
      m_transport(std::move(transport)),
      m_chat(user_id, std::move(username), [this](const ChatData &data){ send(ClientAction::Chat, data); }),
      m_follower(player, drift_threshold),
      m_reporter(player, [this](const PlaybackSnapshot &snapshot){ send(ClientAction::MasterReport, snapshot); }){
    m_player.on_event([this](PlayerEvent event){ on_player_event(event); });
}

std::string ClientSession::stream_url(const PlaylistItem &item){
    return std::format("/streams/{}/{}/playlist.m3u8", nlohmann::json(item.source).get<std::string>(), item.song_id);
}

void ClientSession::send(ClientAction type, nlohmann::json data){
    m_transport(nlohmann::json(ClientMessage{type, std::move(data)}).dump());
}

void ClientSession::on_connected(){
    m_chat.set_connected(true);
    send(ClientAction::Sync);
    if(auto me = self(); me && me->mode == Mode::Listen && !::is_master(*me)){
        send(ClientAction::MasterRequest);
    }
}

void ClientSession::on_disconnected(){
    m_chat.set_connected(false);
}

void ClientSession::heartbeat(){
    m_player.update();
    m_reporter.on_heartbeat();
}

void ClientSession::ping(){
    send(ClientAction::Ping);
}

void ClientSession::handle(const std::string &text){
    ServerMessage message;
    try{
        message = nlohmann::json::parse(text).get<ServerMessage>();
    }catch(const nlohmann::json::exception &e){
        std::cerr << std::format("Ignoring malformed server message: {}\n", e.what());
        return;
    }
    const auto &data = message.data;
    try{
        switch(message.type){
        case ServerEvent::Welcome:
            apply_state(data.at("state").get<RoomState>());
            break;
        case ServerEvent::State:
            apply_state(data.get<RoomState>());
            break;
        case ServerEvent::MemberList:
            apply_members(data.get<std::vector<Member>>());
            break;
        case ServerEvent::Playlist:
            m_playlist = data.get<std::vector<PlaylistItem>>();
            break;
        case ServerEvent::MasterSync:
            m_follower.apply(data.get<PlaybackSnapshot>());
            break;
        case ServerEvent::MasterRequest:
            m_reporter.on_playback_requested();
            break;
        case ServerEvent::PlaybackControl:
            apply_control(data.get<PlaybackControlData>());
            break;
        case ServerEvent::Chat:
            m_chat.on_live(data.get<ChatMessage>());
            break;
        case ServerEvent::ModeChange: {
            auto change = data.get<ModeChangeData>();
            if(change.user_id == m_user_id && change.forced){
                std::cout << std::format("Switched to chat mode because the owner stopped listening\n");
            }
            break;
        }
        case ServerEvent::RoomDisband:
            m_disbanded = true;
            m_follower.set_following(false);
            m_reporter.set_active(false);
            std::cout << std::format("Room {} was disbanded\n", data.value("room_id", std::string{}));
            break;
        case ServerEvent::Error: {
            auto error = data.get<ErrorData>();
            std::cerr << std::format("Server error {}: {}\n", to_string(error.code), error.message);
            m_last_error = std::move(error);
            break;
        }
        // Fully covered by the member list that follows them.
        case ServerEvent::MasterModeChange:
        case ServerEvent::RoleUpdate:
        case ServerEvent::ControlUpdate:
        case ServerEvent::Join:
        case ServerEvent::Leave:
        case ServerEvent::Pong:
            break;
        }
    }catch(const nlohmann::json::exception &e){
        std::cerr << std::format("Ignoring malformed {} payload: {}\n",
            nlohmann::json(message.type).get<std::string>(), e.what());
    }
}

void ClientSession::apply_state(const RoomState &state){
    m_room = state.room;
    m_playlist = state.playlist;
    apply_members(state.members);
    if(state.playback){
        m_follower.apply(*state.playback);
    }
}

void ClientSession::apply_members(std::vector<Member> members){
    auto before = self();
    m_members = std::move(members);
    auto after = self();
    if(!after){
        m_follower.set_following(false);
        m_reporter.set_active(false);
        return;
    }
    bool owner = after->role == Role::Owner;
    bool was_master = before && ::is_master(*before);
    m_follower.set_owner(owner);
    if(!owner){
        m_follower.set_following(after->mode == Mode::Listen);
    }
    m_reporter.set_active(::is_master(*after));
    // A fresh master tells the room what it is playing right away.
    if(::is_master(*after) && !was_master){
        m_reporter.on_playback_requested();
    }
}

void ClientSession::on_player_event(PlayerEvent event){
    m_reporter.on_player_event(event);
    if(event == PlayerEvent::Ended && is_master()){
        if(auto next = neighbour(true)){
            play_item(*next);
        }
    }
}

std::optional<PlaylistItem> ClientSession::neighbour(bool forward) const {
    if(m_playlist.empty()) return std::nullopt;
    auto track = m_player.current_track();
    auto it = track ? std::find_if(m_playlist.begin(), m_playlist.end(),
        [&](const PlaylistItem &item){ return item.song_id == track->song_id; }) : m_playlist.end();
    if(it == m_playlist.end()) return m_playlist.front();
    if(forward){
        ++it;
        if(it == m_playlist.end()) return std::nullopt;
        return *it;
    }
    if(it == m_playlist.begin()) return std::nullopt;
    return *std::prev(it);
}

void ClientSession::play_item(const PlaylistItem &item){
    Track track{
        .song_id = item.song_id,
        .name = item.name,
        .artist = item.artist,
        .cover = item.cover,
        .hls_url = stream_url(item),
        .duration_ms = static_cast<std::int64_t>(item.duration_seconds) * 1000,
    };
    m_player.load(track, [this]{ m_player.play(); });
}

void ClientSession::apply_control(const PlaybackControlData &command){
    if(!is_master()) return;
    std::cout << std::format("Playback command {} from {}\n",
        nlohmann::json(command.action).dump(), command.requested_by);
    switch(command.action){
    case ClientAction::Play:
        if(!m_player.current_track()){
            if(auto first = neighbour(true)) play_item(*first);
        } else {
            m_player.play();
        }
        break;
    case ClientAction::Pause:
        m_player.pause();
        break;
    case ClientAction::Seek:
        m_player.seek(command.position);
        break;
    case ClientAction::Next:
    case ClientAction::Prev:
        if(auto item = neighbour(command.action == ClientAction::Next)) play_item(*item);
        break;
    default:
        break;
    }
}

void ClientSession::set_mode(Mode mode){
    send(ClientAction::SetMode, ModeData{mode});
}

void ClientSession::grant_control(UserId target, bool can_control){
    send(ClientAction::GrantControl, TargetData{.target_user_id = target, .can_control = can_control});
}

void ClientSession::set_role(UserId target, Role role){
    send(ClientAction::SetRole, TargetData{.target_user_id = target, .role = role});
}

void ClientSession::transfer_owner(UserId target){
    send(ClientAction::TransferOwner, TargetData{.target_user_id = target});
}

void ClientSession::add_song(PlaylistItem item){
    send(ClientAction::SongAdd, item);
}

void ClientSession::remove_song(int position){
    send(ClientAction::SongRemove, PositionData{position});
}

void ClientSession::move_song(int from, int to){
    send(ClientAction::SongMove, MoveData{from, to});
}

void ClientSession::control(ClientAction action, double position){
    // The master drives its own player; everyone else asks the server to forward.
    if(is_master()){
        apply_control(PlaybackControlData{action, position, m_user_id});
        return;
    }
    if(action == ClientAction::Seek){
        send(action, SeekData{position});
    } else {
        send(action);
    }
}

ChatMessage ClientSession::send_chat(std::string content){
    return m_chat.send_message(std::move(content));
}

UserId ClientSession::user_id() const {
    return m_user_id;
}

std::optional<Member> ClientSession::self() const {
    auto it = std::find_if(m_members.begin(), m_members.end(),
        [this](const Member &m){ return m.user_id == m_user_id; });
    if(it == m_members.end()) return std::nullopt;
    return *it;
}

bool ClientSession::is_master() const {
    auto me = self();
    return me && ::is_master(*me);
}

bool ClientSession::is_disbanded() const {
    return m_disbanded;
}

const std::vector<Member> &ClientSession::members() const {
    return m_members;
}

const std::vector<PlaylistItem> &ClientSession::playlist() const {
    return m_playlist;
}

const std::optional<RoomInfo> &ClientSession::room() const {
    return m_room;
}

const std::optional<ErrorData> &ClientSession::last_error() const {
    return m_last_error;
}

ChatFeed &ClientSession::chat(){
    return m_chat;
}

FollowerSync &ClientSession::follower(){
    return m_follower;
}

SnapshotReporter &ClientSession::reporter(){
    return m_reporter;
}
