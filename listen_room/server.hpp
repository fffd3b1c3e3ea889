#pragma once
#include "common.hpp"
#include "config.hpp"
#include "room_manager.hpp"
#include <boost/url.hpp>

// Identity supplied by the external session layer.
struct Identity {
    UserId user_id{};
    std::string username;
    std::string avatar;
};

class Server{
public:
    using tcp = net::ip::tcp;
    using WebSocket = beast::websocket::stream<beast::tcp_stream>;
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    explicit Server(ServerConfig config);

    // Answers one REST request. Never throws; failures become error responses.
    Response handle_request(const Request &req);

    static http::status status_for(ErrorCode code);
    static std::optional<Identity> identity_from(const Request &req);

    net::awaitable<void> send_bad_response(
        beast::tcp_stream stream,
        const Request &req,
        http::status status,
        ErrorData error
    );
    net::awaitable<void> handle_socket_route(beast::tcp_stream stream, Request req, RoomCode room_code);

    net::awaitable<void> run_session(tcp::socket socket);
    net::awaitable<void> listener(net::ip::port_type port);

    RoomManager &rooms();

    static void start(const ServerConfig &config);
private:
    Response route_api(const Request &req, const boost::url_view &url, const std::vector<std::string> &segments);
    Response create_room(const Request &req, const Identity &identity);
    Response join_room(const Request &req, const Identity &identity);
    Response leave_room(const Request &req, const Identity &identity);
    Response disband_room(const Request &req, const Identity &identity);
    Response my_rooms(const Request &req, const Identity &identity);
    Response room_state(const Request &req, const Identity &identity, const RoomCode &code);
    Response room_messages(const Request &req, const Identity &identity, const RoomCode &code, const boost::url_view &url);

    ServerConfig m_config;
    RoomManager m_room_manager;
};
