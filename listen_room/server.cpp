#include "server.hpp"
#include "room_member.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <iostream>
#include <memory>
#include <thread>

namespace {
constexpr auto server_name = "ListenRoomServer";

Server::Response make_response(const Server::Request &req, http::status status, const nlohmann::json &body){
    Server::Response res{status, req.version()};
    res.set(http::field::server, server_name);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = dump_for_wire(body);
    res.prepare_payload();
    return res;
}

Server::Response make_error(const Server::Request &req, http::status status, ErrorCode code, std::string message){
    return make_response(req, status, ErrorData{code, std::move(message)});
}

nlohmann::json parse_body(const Server::Request &req){
    if(req.body().empty()){
        return nlohmann::json::object();
    }
    auto body = nlohmann::json::parse(req.body());
    if(!body.is_object()){
        throw RoomError(ErrorCode::ValidationError, "request body must be a JSON object");
    }
    return body;
}

RoomCode room_id_from(const nlohmann::json &body){
    auto it = body.find("room_id");
    if(it == body.end()){
        throw RoomError(ErrorCode::ValidationError, "room_id is required");
    }
    // Numeric ids are accepted as well as strings.
    return it->is_number_integer() ? std::to_string(it->get<std::int64_t>()) : it->get<std::string>();
}

int query_int(const std::string &text, std::string_view name, int minimum){
    int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if(ec != std::errc{} || ptr != text.data() + text.size() || value < minimum){
        throw RoomError(ErrorCode::ValidationError, std::format("invalid {} \"{}\"", name, text));
    }
    return value;
}

std::optional<UserId> parse_user_id(std::string_view text){
    UserId value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if(ec != std::errc{} || ptr != text.data() + text.size() || value <= 0){
        return std::nullopt;
    }
    return value;
}
}

Server::Server(ServerConfig config)
    : m_config(std::move(config)), m_room_manager(m_config.room){
}

RoomManager &Server::rooms(){
    return m_room_manager;
}

http::status Server::status_for(ErrorCode code){
    switch(code){
    case ErrorCode::RoomNotFound: return http::status::not_found;
    case ErrorCode::PermissionDenied:
    case ErrorCode::NotMaster: return http::status::forbidden;
    case ErrorCode::ValidationError:
    case ErrorCode::OutOfRange: return http::status::bad_request;
    case ErrorCode::NotConnected: return http::status::service_unavailable;
    }
    return http::status::internal_server_error;
}

std::optional<Identity> Server::identity_from(const Request &req){
    auto id_it = req.find("X-User-Id");
    auto name_it = req.find("X-Username");
    if(id_it == req.end() || name_it == req.end() || name_it->value().empty()){
        return std::nullopt;
    }
    auto user_id = parse_user_id(id_it->value());
    if(!user_id){
        return std::nullopt;
    }
    Identity identity{.user_id = *user_id, .username = std::string(name_it->value())};
    if(auto avatar_it = req.find("X-Avatar"); avatar_it != req.end()){
        identity.avatar = std::string(avatar_it->value());
    }
    if(!is_valid_utf8(identity.username) || !is_valid_utf8(identity.avatar)){
        throw RoomError(ErrorCode::ValidationError, "identity headers must be valid UTF-8");
    }
    return identity;
}

net::awaitable<void> Server::send_bad_response(
    beast::tcp_stream stream,
    const Request &req,
    http::status status,
    ErrorData error
    ){
    auto res = make_response(req, status, error);
    co_await http::async_write(stream, res, net::use_awaitable);
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

Server::Response Server::handle_request(const Request &req){
    try{
        boost::url_view url(req.target());
        std::vector<std::string> segments(url.segments().begin(), url.segments().end());
        if(segments.size() < 2 || segments[0] != "api" || segments[1] != "rooms"){
            return make_error(req, http::status::not_found, ErrorCode::ValidationError,
                std::format("no route for {}", std::string(req.target())));
        }
        return route_api(req, url, segments);
    }catch(const RoomError &e){
        return make_error(req, status_for(e.code()), e.code(), e.what());
    }catch(const nlohmann::json::exception &e){
        return make_error(req, http::status::bad_request, ErrorCode::ValidationError, e.what());
    }catch(const boost::system::system_error &e){
        return make_error(req, http::status::bad_request, ErrorCode::ValidationError, e.what());
    }
}

Server::Response Server::route_api(const Request &req, const boost::url_view &url, const std::vector<std::string> &segments){
    auto identity = identity_from(req);
    if(!identity){
        return make_error(req, http::status::unauthorized, ErrorCode::PermissionDenied, "missing user identity");
    }
    auto method = req.method();
    if(segments.size() == 2 && method == http::verb::post){
        return create_room(req, *identity);
    }
    if(segments.size() == 3){
        const auto &action = segments[2];
        if(method == http::verb::post && action == "join") return join_room(req, *identity);
        if(method == http::verb::post && action == "leave") return leave_room(req, *identity);
        if(method == http::verb::post && action == "disband") return disband_room(req, *identity);
        if(method == http::verb::get && action == "my") return my_rooms(req, *identity);
        if(method == http::verb::get) return room_state(req, *identity, action);
    }
    if(segments.size() == 4 && method == http::verb::get && segments[3] == "messages"){
        return room_messages(req, *identity, segments[2], url);
    }
    return make_error(req, http::status::not_found, ErrorCode::ValidationError,
        std::format("no route for {} {}", std::string(req.method_string()), std::string(req.target())));
}

Server::Response Server::create_room(const Request &req, const Identity &identity){
    auto body = parse_body(req);
    auto room = m_room_manager.create_room(identity.user_id, identity.username, identity.avatar,
        body.value("name", std::string{}));
    return make_response(req, http::status::created, room->info());
}

Server::Response Server::join_room(const Request &req, const Identity &identity){
    auto room = m_room_manager.get_room(room_id_from(parse_body(req)));
    auto [member, state] = room->join(identity.user_id, identity.username, identity.avatar);
    return make_response(req, http::status::ok, {
        {"room", state.room},
        {"member", member},
        {"state", state},
    });
}

Server::Response Server::leave_room(const Request &req, const Identity &identity){
    auto body = parse_body(req);
    auto room = m_room_manager.get_room(room_id_from(body));
    std::optional<UserId> transfer_to;
    if(auto it = body.find("transfer_to"); it != body.end() && !it->is_null()){
        transfer_to = it->get<UserId>();
    }
    room->leave(identity.user_id, transfer_to);
    return make_response(req, http::status::ok, {{"room_id", room->get_code()}});
}

Server::Response Server::disband_room(const Request &req, const Identity &identity){
    auto room = m_room_manager.get_room(room_id_from(parse_body(req)));
    room->disband(identity.user_id);
    return make_response(req, http::status::ok, {{"room_id", room->get_code()}});
}

Server::Response Server::my_rooms(const Request &req, const Identity &identity){
    return make_response(req, http::status::ok, m_room_manager.user_rooms(identity.user_id));
}

Server::Response Server::room_state(const Request &req, const Identity &identity, const RoomCode &code){
    auto room = m_room_manager.get_room(code);
    if(!room->member(identity.user_id)){
        throw RoomError(ErrorCode::PermissionDenied, "not a member of this room");
    }
    return make_response(req, http::status::ok, room->snapshot_state());
}

Server::Response Server::room_messages(const Request &req, const Identity &identity, const RoomCode &code, const boost::url_view &url){
    auto room = m_room_manager.get_room(code);
    if(!room->member(identity.user_id)){
        throw RoomError(ErrorCode::PermissionDenied, "not a member of this room");
    }
    int limit = m_config.history_default_limit;
    int offset = 0;
    auto params = url.params();
    if(auto it = params.find("limit"); it != params.end()){
        limit = query_int((*it).value, "limit", 1);
        limit = std::min(limit, m_config.history_max_limit);
    }
    if(auto it = params.find("offset"); it != params.end()){
        offset = query_int((*it).value, "offset", 0);
    }
    return make_response(req, http::status::ok,
        room->history(static_cast<std::size_t>(limit), static_cast<std::size_t>(offset)));
}

net::awaitable<void> Server::handle_socket_route(beast::tcp_stream stream, Request req, RoomCode room_code){
    std::optional<UserId> user_id;
    std::shared_ptr<Room> room;
    std::optional<std::pair<http::status, ErrorData>> failure;
    try{
        boost::url_view url(req.target());
        auto params = url.params();
        if(auto it = params.find("userId"); it != params.end()){
            user_id = parse_user_id((*it).value);
        }
        if(!user_id){
            failure.emplace(http::status::unauthorized, ErrorData{ErrorCode::PermissionDenied, "missing user identity"});
        } else {
            room = m_room_manager.get_room(room_code);
            if(!room->member(*user_id)){
                throw RoomError(ErrorCode::PermissionDenied, "not a member of this room");
            }
        }
    }catch(const RoomError &e){
        failure.emplace(status_for(e.code()), ErrorData{e.code(), e.what()});
    }
    if(failure){
        co_return co_await send_bad_response(std::move(stream), req, failure->first, std::move(failure->second));
    }
    auto room_member = std::make_shared<RoomMember>(
        *user_id,
        websocket::stream<beast::tcp_stream>(std::move(stream)),
        std::move(room));
    co_await room_member->run(std::move(req));
}

net::awaitable<void> Server::run_session(tcp::socket socket) {
    beast::tcp_stream stream(std::move(socket));
    Request req;
    beast::flat_buffer buffer;

    co_await http::async_read(stream, buffer, req, net::use_awaitable);
    std::cout << std::format("{} {}\n", std::string(req.method_string()), std::string(req.target()));

    if(websocket::is_upgrade(req)) {
        std::optional<RoomCode> room_code;
        auto parsed = boost::urls::parse_origin_form(req.target());
        if(parsed){
            std::vector<std::string> segments(parsed->segments().begin(), parsed->segments().end());
            if(segments.size() == 3 && segments[0] == "ws" && segments[1] == "room"){
                room_code = segments[2];
            }
        }
        if(room_code){
            co_return co_await handle_socket_route(std::move(stream), std::move(req), std::move(*room_code));
        }
        co_return co_await send_bad_response(std::move(stream), req, http::status::not_found,
            ErrorData{ErrorCode::ValidationError, "unknown websocket route"});
    }

    auto res = handle_request(req);
    co_await http::async_write(stream, res, net::use_awaitable);
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

net::awaitable<void> Server::listener(net::ip::port_type port){
    std::cout << std::format("Server is listening port {}\n", port);
    auto executor = co_await net::this_coro::executor;
    tcp::acceptor acceptor(executor, tcp::endpoint(tcp::v4(), port));
    for(;;){
        auto socket = co_await acceptor.async_accept(net::make_strand(executor), net::use_awaitable);
        auto strand = socket.get_executor();
        net::co_spawn(
            strand,
            run_session(std::move(socket)),
            LogOnCatch("run_session")
            );
    }
}

void Server::start(const ServerConfig &config){
    Server server(config);
    int num_threads = config.threads;
    net::io_context ioc(num_threads);
    std::vector<std::jthread> runners;
    runners.reserve(num_threads-1);
    net::co_spawn(
        ioc,
        server.listener(config.port),
        LogOnCatch("listener"));

    for(int i{};i<num_threads-1;++i){
        runners.emplace_back([&ioc]{ioc.run();});
    }
    ioc.run();
}
