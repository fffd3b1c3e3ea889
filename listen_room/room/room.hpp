#pragma once
#include "json/json_impl.hpp"
#include "config.hpp"
#include "room/chat_log.hpp"
#include "room/membership.hpp"
#include "room/permission.hpp"
#include "room/playlist.hpp"
#include "room/room_peer.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>

// Canonical state of one room. Every operation runs under the room mutex, and
// broadcasts are handed to the peers before it is released, so all members
// observe room events in the same order.
class Room {
public:
    Room(RoomInfo info, RoomSettings settings, std::function<void(const RoomCode &)> on_closed);

    RoomCode const &get_code() const;
    RoomInfo info() const;
    bool is_active() const;

    std::pair<Member, RoomState> join(UserId user_id, std::string username, std::string avatar);
    void leave(UserId user_id, std::optional<UserId> transfer_to = std::nullopt);
    void disband(UserId user_id);

    // Binds a live connection to a member and sends it the welcome state.
    void attach(UserId user_id, std::weak_ptr<RoomPeer> peer);
    void detach(UserId user_id, const RoomPeer *peer);

    void set_mode(UserId user_id, Mode mode);
    void grant_control(UserId user_id, UserId target, bool can_control);
    void set_role(UserId user_id, UserId target, Role role);
    void transfer_owner(UserId user_id, UserId target);

    void add_song(UserId user_id, PlaylistItem item);
    void remove_song(UserId user_id, int position);
    void reorder_song(UserId user_id, int from, int to);

    void control_playback(UserId user_id, ClientAction action, double position = 0);
    void report_playback(UserId user_id, PlaybackSnapshot snapshot);
    void request_playback(UserId user_id);

    ChatMessage send_chat(UserId user_id, std::string content, std::optional<std::string> client_msg_id = std::nullopt);

    RoomState snapshot_state() const;
    std::vector<ChatMessage> history(std::size_t limit, std::size_t offset = 0) const;
    std::optional<Member> member(UserId user_id) const;
    std::size_t member_count() const;

    static constexpr Millis request_coalesce_ms = 1000;
private:
    void check_active() const;
    RoomState state_locked() const;
    void close_locked();

    void broadcast_locked(const std::string &message, std::optional<UserId> exclude_id = std::nullopt);
    bool send_locked(UserId user_id, const std::string &message);
    void broadcast_members_locked();
    void broadcast_playlist_locked();
    void post_system_locked(const std::string &content);
    void forward_request_locked(UserId requester, bool force = false);
    void hand_over_locked(UserId from, UserId to);
    bool is_online_locked(UserId user_id) const;

    mutable std::mutex m_mutex;
    std::function<void(const RoomCode &)> m_on_closed;
    RoomInfo m_info;
    RoomSettings m_settings;

    Membership m_members;
    Playlist m_playlist;
    ChatLog m_chat;
    std::optional<PlaybackSnapshot> m_playback;

    std::set<UserId> m_pending_requests;
    Millis m_last_request_forward{};
    std::unordered_map<UserId, std::weak_ptr<RoomPeer>> m_peers{};
};
