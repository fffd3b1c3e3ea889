#pragma once
#include "client/chat_feed.hpp"
#include "client/follower_sync.hpp"
#include "client/snapshot_reporter.hpp"

// Protocol state of one client in one room, independent of the transport.
// Outbound messages go through the supplied function; inbound ones arrive via handle().
class ClientSession {
public:
    using Transport = std::function<void(const std::string &)>;

    ClientSession(UserId user_id, std::string username, Player &player, Transport transport,
                  double drift_threshold = FollowerSync::default_drift_threshold);

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Resynchronizes after every (re)connect.
    void on_connected();
    void on_disconnected();
    void handle(const std::string &text);
    void heartbeat();
    void ping();

    void set_mode(Mode mode);
    void grant_control(UserId target, bool can_control);
    void set_role(UserId target, Role role);
    void transfer_owner(UserId target);
    void add_song(PlaylistItem item);
    void remove_song(int position);
    void move_song(int from, int to);
    void control(ClientAction action, double position = 0);
    ChatMessage send_chat(std::string content);

    UserId user_id() const;
    std::optional<Member> self() const;
    bool is_master() const;
    bool is_disbanded() const;
    const std::vector<Member> &members() const;
    const std::vector<PlaylistItem> &playlist() const;
    const std::optional<RoomInfo> &room() const;
    const std::optional<ErrorData> &last_error() const;

    ChatFeed &chat();
    FollowerSync &follower();
    SnapshotReporter &reporter();

    static std::string stream_url(const PlaylistItem &item);

private:
    void send(ClientAction type, nlohmann::json data = nlohmann::json::object());
    void apply_state(const RoomState &state);
    void apply_members(std::vector<Member> members);
    void apply_control(const PlaybackControlData &command);
    void on_player_event(PlayerEvent event);
    void play_item(const PlaylistItem &item);
    std::optional<PlaylistItem> neighbour(bool forward) const;

    UserId m_user_id;
    Player &m_player;
    Transport m_transport;
    ChatFeed m_chat;
    FollowerSync m_follower;
    SnapshotReporter m_reporter;

    std::optional<RoomInfo> m_room;
    std::vector<Member> m_members;
    std::vector<PlaylistItem> m_playlist;
    std::optional<ErrorData> m_last_error;
    bool m_disbanded = false;
};
