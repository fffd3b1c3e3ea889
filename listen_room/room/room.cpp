#include "room/room.hpp"
#include <format>
#include <iostream>

Room::Room(RoomInfo info, RoomSettings settings, std::function<void(const RoomCode&)> on_closed)
    : m_on_closed(std::move(on_closed)),
      m_info(std::move(info)),
      m_settings(settings),
      m_members(settings.max_members),
      m_chat(settings.history_capacity) {
    m_info.max_members = settings.max_members;
}
RoomCode const& Room::get_code() const {
    return m_info.id;
}
RoomInfo Room::info() const {
    std::lock_guard lock(m_mutex);
    return m_info;
}
bool Room::is_active() const {
    std::lock_guard lock(m_mutex);
    return m_info.status == RoomStatus::Active;
}

std::pair<Member, RoomState> Room::join(UserId user_id, std::string username, std::string avatar){
    std::lock_guard lock(m_mutex);
    check_active();
    auto [member, created] = m_members.join(user_id, std::move(username), std::move(avatar), now_ms());
    if(created){
        if(member.role == Role::Owner){
            m_info.owner_id = user_id;
        }
        std::cout << std::format("[room {}] {} ({}) joined as {}\n", m_info.id, member.username, user_id,
            nlohmann::json(member.role).get<std::string>());
        broadcast_locked(make_server_message(ServerEvent::Join, MemberEventData{user_id, member.username}), user_id);
        broadcast_members_locked();
        post_system_locked(std::format("{} joined the room", member.username));
    }
    return {member, state_locked()};
}

void Room::leave(UserId user_id, std::optional<UserId> transfer_to){
    bool closed = false;
    {
        std::lock_guard lock(m_mutex);
        check_active();
        const auto &leaving = m_members.get(user_id);
        auto username = leaving.username;
        if(leaving.role == Role::Owner && m_members.size() > 1){
            auto successor = transfer_to ? transfer_to : m_members.successor(user_id, false);
            if(!successor || *successor == user_id || !m_members.contains(*successor)){
                throw RoomError(ErrorCode::ValidationError, "transfer target is not a member of the room");
            }
            hand_over_locked(user_id, *successor);
        }
        m_members.remove(user_id);
        m_pending_requests.erase(user_id);
        if(auto it = m_peers.find(user_id); it != m_peers.end()){
            if(auto peer = it->second.lock()){
                peer->close_with_message(make_server_message(ServerEvent::Leave, MemberEventData{user_id, username}));
            }
            m_peers.erase(it);
        }
        std::cout << std::format("[room {}] {} ({}) left\n", m_info.id, username, user_id);
        if(m_members.empty()){
            close_locked();
            closed = true;
        } else {
            broadcast_locked(make_server_message(ServerEvent::Leave, MemberEventData{user_id, username}));
            broadcast_members_locked();
            post_system_locked(std::format("{} left the room", username));
        }
    }
    if(closed){
        m_on_closed(m_info.id);
    }
}

void Room::disband(UserId user_id){
    {
        std::lock_guard lock(m_mutex);
        check_active();
        require(m_members.get(user_id), Operation::Disband);
        std::cout << std::format("[room {}] disbanded by {}\n", m_info.id, user_id);
        close_locked();
    }
    m_on_closed(m_info.id);
}

void Room::attach(UserId user_id, std::weak_ptr<RoomPeer> peer){
    std::lock_guard lock(m_mutex);
    check_active();
    auto member = m_members.get(user_id);
    if(auto it = m_peers.find(user_id); it != m_peers.end()){
        if(auto previous = it->second.lock()){
            previous->close_with_message(make_server_message(ServerEvent::Error,
                ErrorData{ErrorCode::ValidationError, "replaced by a newer connection"}));
        }
    }
    m_peers[user_id] = peer;
    m_members.set_online(user_id, true);
    member.online = true;
    if(auto connection = peer.lock()){
        connection->deliver(make_server_message(ServerEvent::Welcome, {
            {"user_id", user_id},
            {"member", member},
            {"state", state_locked()},
        }));
    }
    broadcast_members_locked();
    // Followers that asked while the master was away get an answer now.
    if(is_master(member) && !m_pending_requests.empty()){
        forward_request_locked(*m_pending_requests.begin(), true);
    }
}

void Room::detach(UserId user_id, const RoomPeer *peer){
    std::lock_guard lock(m_mutex);
    if(m_info.status != RoomStatus::Active) return;
    auto it = m_peers.find(user_id);
    if(it == m_peers.end()) return;
    if(auto current = it->second.lock(); current && current.get() != peer) return;
    m_peers.erase(it);
    m_pending_requests.erase(user_id);
    if(!m_members.contains(user_id)) return;
    m_members.set_online(user_id, false);
    const auto &member = m_members.get(user_id);
    if(member.role == Role::Owner){
        if(m_settings.master_handoff == MasterHandoff::Transfer){
            if(auto successor = m_members.successor(user_id, true)){
                std::cout << std::format("[room {}] owner {} disconnected, ownership moves to {}\n",
                    m_info.id, user_id, *successor);
                hand_over_locked(user_id, *successor);
            }
        } else if(is_master(member)){
            std::cout << std::format("[room {}] master {} disconnected, followers keep their last snapshot\n",
                m_info.id, user_id);
        }
    }
    broadcast_members_locked();
}

void Room::set_mode(UserId user_id, Mode mode){
    std::lock_guard lock(m_mutex);
    check_active();
    require(m_members.get(user_id), Operation::SetMode);
    auto transition = m_members.set_mode(user_id, mode);
    if(!transition.changed) return;
    const auto &member = m_members.get(user_id);

    broadcast_locked(make_server_message(ServerEvent::ModeChange, ModeChangeData{user_id, mode, false}));
    for(auto forced : transition.forced_to_chat){
        m_pending_requests.erase(forced);
        broadcast_locked(make_server_message(ServerEvent::ModeChange, ModeChangeData{forced, Mode::Chat, true}));
    }
    if(member.role == Role::Owner){
        broadcast_locked(make_server_message(ServerEvent::MasterModeChange, {
            {"mode", mode},
            {"master_id", user_id},
        }));
        if(mode == Mode::Chat){
            m_playback.reset();
        } else if(!m_pending_requests.empty()){
            forward_request_locked(*m_pending_requests.begin(), true);
        }
    } else if(mode == Mode::Listen){
        forward_request_locked(user_id);
    } else {
        m_pending_requests.erase(user_id);
    }
    broadcast_members_locked();
}

void Room::grant_control(UserId user_id, UserId target, bool can_control){
    std::lock_guard lock(m_mutex);
    check_active();
    require(m_members.get(user_id), Operation::GrantControl);
    m_members.grant_control(target, can_control);
    broadcast_locked(make_server_message(ServerEvent::ControlUpdate, {
        {"user_id", target},
        {"can_control", can_control},
    }));
    broadcast_members_locked();
}

void Room::set_role(UserId user_id, UserId target, Role role){
    std::lock_guard lock(m_mutex);
    check_active();
    require(m_members.get(user_id), Operation::SetRole);
    m_members.set_role(target, role);
    broadcast_locked(make_server_message(ServerEvent::RoleUpdate, {
        {"user_id", target},
        {"role", role},
    }));
    broadcast_members_locked();
}

void Room::transfer_owner(UserId user_id, UserId target){
    std::lock_guard lock(m_mutex);
    check_active();
    require(m_members.get(user_id), Operation::TransferOwner);
    hand_over_locked(user_id, target);
    broadcast_members_locked();
}

void Room::add_song(UserId user_id, PlaylistItem item){
    std::lock_guard lock(m_mutex);
    check_active();
    require(m_members.get(user_id), Operation::AddSong);
    if(item.duration_seconds < 0){
        throw RoomError(ErrorCode::ValidationError, "duration must not be negative");
    }
    item.added_by = user_id;
    item.added_at = now_ms();
    m_playlist.add(std::move(item));
    broadcast_playlist_locked();
}

void Room::remove_song(UserId user_id, int position){
    std::lock_guard lock(m_mutex);
    check_active();
    require(m_members.get(user_id), Operation::RemoveSong);
    m_playlist.remove(position);
    broadcast_playlist_locked();
}

void Room::reorder_song(UserId user_id, int from, int to){
    std::lock_guard lock(m_mutex);
    check_active();
    require(m_members.get(user_id), Operation::ReorderSong);
    m_playlist.reorder(from, to);
    broadcast_playlist_locked();
}

void Room::control_playback(UserId user_id, ClientAction action, double position){
    std::lock_guard lock(m_mutex);
    check_active();
    require(m_members.get(user_id), Operation::ControlPlayback);
    switch(action){
        case ClientAction::Play:
        case ClientAction::Pause:
        case ClientAction::Next:
        case ClientAction::Prev:
            break;
        case ClientAction::Seek:
            if(position < 0){
                throw RoomError(ErrorCode::ValidationError, "seek position must not be negative");
            }
            break;
        default:
            throw RoomError(ErrorCode::ValidationError, "not a playback control action");
    }
    auto master = m_members.master();
    if(!master || !is_online_locked(master->user_id)){
        throw RoomError(ErrorCode::NotMaster, "no active master to control");
    }
    send_locked(master->user_id, make_server_message(ServerEvent::PlaybackControl,
        PlaybackControlData{action, position, user_id}));
}

void Room::report_playback(UserId user_id, PlaybackSnapshot snapshot){
    std::lock_guard lock(m_mutex);
    check_active();
    const auto &member = m_members.get(user_id);
    require(member, Operation::ReportPlayback);
    if(snapshot.position_seconds < 0 || snapshot.song_id.empty()){
        throw RoomError(ErrorCode::ValidationError, "snapshot needs a song id and a non-negative position");
    }
    snapshot.reported_at = now_ms();
    snapshot.master_id = user_id;
    snapshot.master_name = member.username;
    m_playback = snapshot;

    auto message = make_server_message(ServerEvent::MasterSync, snapshot);
    for(const auto &other : m_members.list()){
        if(other.user_id == user_id) continue;
        if(other.mode == Mode::Listen || m_pending_requests.contains(other.user_id)){
            send_locked(other.user_id, message);
        }
    }
    m_pending_requests.clear();
}

void Room::request_playback(UserId user_id){
    std::lock_guard lock(m_mutex);
    check_active();
    const auto &member = m_members.get(user_id);
    require(member, Operation::RequestPlayback);
    if(is_master(member)) return;
    forward_request_locked(user_id);
}

ChatMessage Room::send_chat(UserId user_id, std::string content, std::optional<std::string> client_msg_id){
    std::lock_guard lock(m_mutex);
    check_active();
    const auto &member = m_members.get(user_id);
    require(member, Operation::SendChat);
    auto [message, created] = m_chat.append(user_id, member.username, std::move(content),
        MessageType::Chat, std::move(client_msg_id), now_ms());
    auto serialized = make_server_message(ServerEvent::Chat, message);
    if(created){
        broadcast_locked(serialized);
    } else {
        send_locked(user_id, serialized);
    }
    return message;
}

RoomState Room::snapshot_state() const {
    std::lock_guard lock(m_mutex);
    check_active();
    return state_locked();
}

std::vector<ChatMessage> Room::history(std::size_t limit, std::size_t offset) const {
    std::lock_guard lock(m_mutex);
    check_active();
    return m_chat.history(limit, offset);
}

std::optional<Member> Room::member(UserId user_id) const {
    std::lock_guard lock(m_mutex);
    if(auto *found = m_members.find(user_id)) return *found;
    return std::nullopt;
}

std::size_t Room::member_count() const {
    std::lock_guard lock(m_mutex);
    return m_members.size();
}

void Room::check_active() const {
    if(m_info.status != RoomStatus::Active){
        throw RoomError(ErrorCode::RoomNotFound, std::format("room {} is disbanded", m_info.id));
    }
}

RoomState Room::state_locked() const {
    return RoomState{m_info, m_members.list(), m_playlist.items(), m_playback};
}

void Room::close_locked(){
    m_info.status = RoomStatus::Disbanded;
    auto message = make_server_message(ServerEvent::RoomDisband, {{"room_id", m_info.id}});
    for(const auto &[id, weak_peer] : m_peers){
        if(auto peer = weak_peer.lock()){
            peer->close_with_message(message);
        }
    }
    m_peers.clear();
    m_pending_requests.clear();
    m_playback.reset();
}

void Room::broadcast_locked(const std::string &message, std::optional<UserId> exclude_id){
    for(const auto &[id, weak_peer] : m_peers){
        if(id == exclude_id) continue;
        if(auto peer = weak_peer.lock()){
            peer->deliver(message);
        }
    }
}

bool Room::send_locked(UserId user_id, const std::string &message){
    auto it = m_peers.find(user_id);
    if(it == m_peers.end()) return false;
    if(auto peer = it->second.lock()){
        peer->deliver(message);
        return true;
    }
    return false;
}

void Room::broadcast_members_locked(){
    broadcast_locked(make_server_message(ServerEvent::MemberList, m_members.list()));
}

void Room::broadcast_playlist_locked(){
    broadcast_locked(make_server_message(ServerEvent::Playlist, m_playlist.items()));
}

void Room::post_system_locked(const std::string &content){
    auto [message, created] = m_chat.append(0, "system", content, MessageType::System, std::nullopt, now_ms());
    if(created){
        broadcast_locked(make_server_message(ServerEvent::Chat, message));
    }
}

void Room::forward_request_locked(UserId requester, bool force){
    auto master = m_members.master();
    if(!master){
        // Waiting for the owner to enter listen mode.
        m_pending_requests.insert(requester);
        return;
    }
    if(!is_online_locked(master->user_id)){
        // Master disconnected: answer from the frozen snapshot, if any.
        m_pending_requests.insert(requester);
        if(m_playback){
            send_locked(requester, make_server_message(ServerEvent::MasterSync, *m_playback));
        }
        return;
    }
    auto now = now_ms();
    bool outstanding = !force && !m_pending_requests.empty() && now - m_last_request_forward < request_coalesce_ms;
    m_pending_requests.insert(requester);
    if(outstanding) return;
    const auto *member = m_members.find(requester);
    m_last_request_forward = now;
    send_locked(master->user_id, make_server_message(ServerEvent::MasterRequest,
        MemberEventData{requester, member ? member->username : std::string{}}));
}

void Room::hand_over_locked(UserId from, UserId to){
    m_members.transfer_owner(from, to);
    m_info.owner_id = to;
    m_playback.reset();
    const auto &owner = m_members.get(to);
    broadcast_locked(make_server_message(ServerEvent::RoleUpdate, {{"user_id", to}, {"role", Role::Owner}}));
    broadcast_locked(make_server_message(ServerEvent::RoleUpdate, {{"user_id", from}, {"role", Role::Member}}));
    broadcast_locked(make_server_message(ServerEvent::MasterModeChange, {
        {"mode", owner.mode},
        {"master_id", to},
    }));
    if(is_master(owner) && !m_pending_requests.empty()){
        forward_request_locked(*m_pending_requests.begin(), true);
    }
}

bool Room::is_online_locked(UserId user_id) const {
    auto it = m_peers.find(user_id);
    return it != m_peers.end() && !it->second.expired();
}
