#include "client/room_client.hpp"
#include "client/simulated_player.hpp"
#include <format>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace {
void print_help(){
    std::cout <<
        "/listen | /chat          switch mode\n"
        "/play /pause /next /prev  playback control\n"
        "/seek <seconds>\n"
        "/add <song_id> <duration_seconds> <name>\n"
        "/del <position> | /move <from> <to>\n"
        "/grant <user_id> | /revoke <user_id> | /admin <user_id> | /owner <user_id>\n"
        "/members | /playlist | /history\n"
        "/leave | /quit\n"
        "anything else is sent as chat\n";
}

void print_state(ClientSession &session){
    for(const auto &member : session.members()){
        std::cout << std::format("  {} ({}) {} {}{}{}\n", member.username, member.user_id,
            nlohmann::json(member.role).get<std::string>(), nlohmann::json(member.mode).get<std::string>(),
            member.can_control ? " control" : "", member.online ? "" : " offline");
    }
}

// Returns false when the client should stop reading commands.
bool run_command(RoomClient &client, const std::string &line){
    auto &session = client.session();
    std::istringstream in(line);
    std::string command;
    in >> command;
    if(command.empty() || command.front() != '/'){
        session.send_chat(line);
        return true;
    }
    if(command == "/listen") session.set_mode(Mode::Listen);
    else if(command == "/chat") session.set_mode(Mode::Chat);
    else if(command == "/play") session.control(ClientAction::Play);
    else if(command == "/pause") session.control(ClientAction::Pause);
    else if(command == "/next") session.control(ClientAction::Next);
    else if(command == "/prev") session.control(ClientAction::Prev);
    else if(command == "/seek"){
        double seconds{};
        if(!(in >> seconds)) throw RoomError(ErrorCode::ValidationError, "usage: /seek <seconds>");
        session.control(ClientAction::Seek, seconds);
    } else if(command == "/add"){
        PlaylistItem item;
        if(!(in >> item.song_id >> item.duration_seconds)){
            throw RoomError(ErrorCode::ValidationError, "usage: /add <song_id> <duration_seconds> <name>");
        }
        std::getline(in >> std::ws, item.name);
        session.add_song(std::move(item));
    } else if(command == "/del"){
        int position{};
        if(!(in >> position)) throw RoomError(ErrorCode::ValidationError, "usage: /del <position>");
        session.remove_song(position);
    } else if(command == "/move"){
        int from{}, to{};
        if(!(in >> from >> to)) throw RoomError(ErrorCode::ValidationError, "usage: /move <from> <to>");
        session.move_song(from, to);
    } else if(command == "/grant" || command == "/revoke" || command == "/admin" || command == "/owner"){
        UserId target{};
        if(!(in >> target)) throw RoomError(ErrorCode::ValidationError, std::format("usage: {} <user_id>", command));
        if(command == "/grant") session.grant_control(target, true);
        else if(command == "/revoke") session.grant_control(target, false);
        else if(command == "/admin") session.set_role(target, Role::Admin);
        else session.transfer_owner(target);
    } else if(command == "/members") print_state(session);
    else if(command == "/playlist"){
        for(const auto &item : session.playlist()){
            std::cout << std::format("  {}. {} [{}]\n", item.position, item.name, item.song_id);
        }
    } else if(command == "/history"){
        for(const auto &message : session.chat().messages()){
            std::cout << std::format("  {}: {}\n", message.username, message.content);
        }
    } else if(command == "/leave"){
        client.leave();
        return false;
    } else if(command == "/quit"){
        client.stop();
        return false;
    } else {
        print_help();
    }
    return true;
}

net::awaitable<void> read_commands(RoomClient &client, net::posix::stream_descriptor &input){
    std::string buffer;
    for(;;){
        std::size_t n{};
        boost::system::error_code ec;
        n = co_await net::async_read_until(input, net::dynamic_buffer(buffer), '\n',
            net::redirect_error(net::use_awaitable, ec));
        // Without a terminal the client keeps following the room.
        if(ec == net::error::eof || ec == net::error::operation_aborted) co_return;
        if(ec) throw boost::system::system_error(ec);
        std::string line = buffer.substr(0, n - 1);
        buffer.erase(0, n);
        try{
            if(!run_command(client, line)) co_return;
        }catch(const RoomError &e){
            std::cerr << std::format("{}\n", e.what());
        }
    }
}
}

int main(int argc, char **argv) {
    ClientConfig config;
    try{
        config = ClientConfig::load(argc, argv);
    }catch(const std::exception &e){
        std::cerr << std::format("Invalid configuration: {}\n", e.what());
        return 1;
    }
    net::io_context ioc(1);
    SimulatedPlayer player;
    RoomClient client(ioc, config, player);

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&client, &ioc](const boost::system::error_code &ec, int){
        if(ec) return;
        client.stop();
        ioc.stop();
    });
    net::posix::stream_descriptor input(ioc, ::dup(STDIN_FILENO));
    client.on_stopped([&signals, &input]{
        signals.cancel();
        boost::system::error_code ec;
        input.cancel(ec);
    });

    client.start();
    net::co_spawn(ioc, read_commands(client, input), [&client](std::exception_ptr e){
        if(!e) return;
        LogOnCatch("commands")(e);
        client.stop();
    });
    print_help();
    ioc.run();
}
