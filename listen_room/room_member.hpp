#pragma once

#include "common.hpp"
#include <memory>
#include <deque>
#include "room/room.hpp"

// One live WebSocket connection of a room member.
class RoomMember : public RoomPeer, public std::enable_shared_from_this<RoomMember> {
public:
    using Connection = beast::websocket::stream<beast::tcp_stream>;
    RoomMember(UserId user_id, Connection connection, std::shared_ptr<Room> room);

    RoomMember(const RoomMember&) = delete;
    RoomMember& operator=(const RoomMember&) = delete;

    void deliver(const std::string &message) override;
    void close_with_message(const std::string &message) override;
    net::awaitable<void> run(http::request<http::string_body> req);

    UserId get_user_id() const;

private:
    void send_impl(std::string message, bool close_after = false);
    void handle_message(Room &room, const std::string &text);
    void dispatch(Room &room, const ClientMessage &message);
    void send_error(ErrorCode code, const std::string &message);
    net::awaitable<void> write_loop(std::shared_ptr<RoomMember> self);

    UserId m_user_id;
    Connection m_connection;
    std::weak_ptr<Room> m_room;

    bool m_should_close = false;
    bool m_is_writing = false;
    std::deque<std::string> m_write_queue;
};
