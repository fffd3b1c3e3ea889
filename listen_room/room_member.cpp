#include "room_member.hpp"
#include <format>
#include <iostream>

RoomMember::RoomMember(UserId user_id, Connection connection, std::shared_ptr<Room> room)
    : m_user_id(user_id), m_connection(std::move(connection)), m_room(room){
}

void RoomMember::deliver(const std::string &message){
    send_impl(message);
}
void RoomMember::close_with_message(const std::string &message) {
    send_impl(message, true);
}

void RoomMember::send_impl(std::string message, bool close_after){
    net::post(
        m_connection.get_executor(),
        [self = shared_from_this(), message = std::move(message), close_after]() mutable {
            if(self->m_should_close){
                return;
            }
            self->m_write_queue.push_back(std::move(message));
            if(close_after){
                self->m_should_close = true;
            }
            if(!self->m_is_writing){
                self->m_is_writing = true;
                auto executor = self->m_connection.get_executor();
                net::co_spawn(
                    executor,
                    self->write_loop(std::move(self)),
                    LogOnCatch("session write_loop")
                    );
            }
        });
}

UserId RoomMember::get_user_id() const {
    return m_user_id;
}

void RoomMember::send_error(ErrorCode code, const std::string &message){
    deliver(make_server_message(ServerEvent::Error, ErrorData{code, message}));
}

void RoomMember::handle_message(Room &room, const std::string &text){
    try{
        dispatch(room, nlohmann::json::parse(text).get<ClientMessage>());
    }catch(const RoomError &e){
        send_error(e.code(), e.what());
    }catch(const nlohmann::json::exception &e){
        send_error(ErrorCode::ValidationError, std::format("malformed message: {}", e.what()));
    }
}

void RoomMember::dispatch(Room &room, const ClientMessage &message){
    const auto &data = message.data;
    switch(message.type){
    case ClientAction::Chat: {
        auto chat = data.get<ChatData>();
        room.send_chat(m_user_id, std::move(chat.content), std::move(chat.client_msg_id));
        break;
    }
    case ClientAction::SetMode: {
        auto mode = data.value("mode", std::string{});
        if(mode != "chat" && mode != "listen"){
            throw RoomError(ErrorCode::ValidationError, std::format("unknown mode \"{}\"", mode));
        }
        room.set_mode(m_user_id, mode == "listen" ? Mode::Listen : Mode::Chat);
        break;
    }
    case ClientAction::GrantControl: {
        auto target = data.get<TargetData>();
        room.grant_control(m_user_id, target.target_user_id, target.can_control);
        break;
    }
    case ClientAction::SetRole: {
        auto target = data.get<TargetData>();
        room.set_role(m_user_id, target.target_user_id, target.role);
        break;
    }
    case ClientAction::TransferOwner:
        room.transfer_owner(m_user_id, data.get<TargetData>().target_user_id);
        break;
    case ClientAction::SongAdd:
        room.add_song(m_user_id, data.get<PlaylistItem>());
        break;
    case ClientAction::SongRemove:
        room.remove_song(m_user_id, data.get<PositionData>().position);
        break;
    case ClientAction::SongMove: {
        auto move = data.get<MoveData>();
        room.reorder_song(m_user_id, move.from, move.to);
        break;
    }
    case ClientAction::Play:
    case ClientAction::Pause:
    case ClientAction::Next:
    case ClientAction::Prev:
        room.control_playback(m_user_id, message.type);
        break;
    case ClientAction::Seek:
        room.control_playback(m_user_id, message.type, data.get<SeekData>().position);
        break;
    case ClientAction::MasterReport:
        room.report_playback(m_user_id, data.get<PlaybackSnapshot>());
        break;
    case ClientAction::MasterRequest:
        room.request_playback(m_user_id);
        break;
    case ClientAction::Sync:
        deliver(make_server_message(ServerEvent::State, room.snapshot_state()));
        break;
    case ClientAction::Ping:
        deliver(make_server_message(ServerEvent::Pong));
        break;
    case ClientAction::Unknown:
        throw RoomError(ErrorCode::ValidationError, "unknown message type");
    }
}

net::awaitable<void> RoomMember::run(http::request<http::string_body> req){
    auto room = m_room.lock();
    if (!room) co_return;
    co_await m_connection.async_accept(req, net::use_awaitable);
    auto self = shared_from_this();
    try {
        room->attach(m_user_id, self);
    } catch (const RoomError &e) {
        close_with_message(make_server_message(ServerEvent::Error, ErrorData{e.code(), e.what()}));
        co_return;
    }
    std::cout << std::format("[room {}] user {} connected\n", room->get_code(), m_user_id);
    // session starts here
    try {
        beast::flat_buffer buffer;
        for (;;) {
            co_await m_connection.async_read(buffer, net::use_awaitable);
            handle_message(*room, beast::buffers_to_string(buffer.data()));
            buffer.consume(buffer.size());
        }
    }
    catch (const boost::system::system_error& e) {
        if (session_ended(e.code())) {
            std::cout << std::format("[room {}] user {} disconnected\n", room->get_code(), m_user_id);
        } else {
            room->detach(m_user_id, this);
            throw;
        }
    }
    room->detach(m_user_id, this);
}

net::awaitable<void> RoomMember::write_loop(std::shared_ptr<RoomMember> self){
    try{
        while(!m_write_queue.empty()){
            const auto &msg = m_write_queue.front();
            co_await m_connection.async_write(net::buffer(msg), net::use_awaitable);
            m_write_queue.pop_front();
        }
        if (m_should_close) {
            co_await m_connection.async_close(websocket::close_code::normal, net::use_awaitable);
        }
    } catch(const boost::system::system_error &e) {
        m_write_queue.clear();
        if(!session_ended(e.code())){
            std::cerr << std::format("write to user {} failed: {}\n", m_user_id, e.what());
        }
    }
    m_is_writing = false;
}
