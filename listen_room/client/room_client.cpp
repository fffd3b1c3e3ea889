#include "client/room_client.hpp"
#include <boost/url.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

RoomClient::RoomClient(net::io_context &ioc, ClientConfig config, Player &player)
    : m_ioc(ioc),
      m_config(std::move(config)),
      m_session(m_config.user_id, m_config.username, player,
                [this](const std::string &message){ send(message); },
                m_config.drift_threshold_seconds),
      m_room_id(m_config.room_id),
      m_retry_timer(ioc),
      m_heartbeat_timer(ioc),
      m_ping_timer(ioc),
      m_rand_eng(std::random_device{}()){
}

ClientSession &RoomClient::session(){
    return m_session;
}

const RoomCode &RoomClient::room_id() const {
    return m_room_id;
}

bool RoomClient::is_connected() const {
    return m_ws != nullptr;
}

std::chrono::milliseconds RoomClient::backoff_delay(int attempt, const ClientConfig &config, double unit){
    double delay = static_cast<double>(config.reconnect_base.count()) * std::pow(2.0, std::max(attempt - 1, 0));
    delay = std::min(delay, static_cast<double>(config.reconnect_cap.count()));
    delay *= 1.0 + config.reconnect_jitter * std::clamp(unit, -1.0, 1.0);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay)));
}

void RoomClient::start(){
    net::co_spawn(m_ioc, run(), LogOnCatch("client run"));
    net::co_spawn(m_ioc, heartbeat_loop(), LogOnCatch("client heartbeat"));
    net::co_spawn(m_ioc, ping_loop(), LogOnCatch("client ping"));
}

void RoomClient::on_stopped(std::function<void()> handler){
    m_on_stopped = std::move(handler);
}

void RoomClient::stop(){
    if(m_stopped) return;
    m_stopped = true;
    m_retry_timer.cancel();
    m_heartbeat_timer.cancel();
    m_ping_timer.cancel();
    if(auto ws = m_ws){
        ws->async_close(websocket::close_code::normal, [ws](beast::error_code ec){
            if(ec && !session_ended(ec)){
                std::cerr << std::format("Close failed: {}\n", ec.message());
            }
        });
    }
    if(m_on_stopped) m_on_stopped();
}

void RoomClient::leave(std::optional<UserId> transfer_to){
    nlohmann::json body{{"room_id", m_room_id}};
    if(transfer_to) body["transfer_to"] = *transfer_to;
    net::co_spawn(m_ioc, leave_room(body.dump()), LogOnCatch("client leave"));
}

net::awaitable<void> RoomClient::leave_room(std::string body){
    co_await rest(http::verb::post, "/api/rooms/leave", std::move(body));
    std::cout << std::format("Left room {}\n", m_room_id);
    stop();
}

void RoomClient::send(const std::string &message){
    if(!m_ws){
        std::cerr << "Not connected, message dropped\n";
        return;
    }
    m_write_queue.push_back(message);
    if(!m_is_writing){
        m_is_writing = true;
        net::co_spawn(m_ioc, write_loop(m_ws), LogOnCatch("client write_loop"));
    }
}

net::awaitable<void> RoomClient::write_loop(std::shared_ptr<WebSocket> ws){
    try{
        while(!m_write_queue.empty()){
            const auto &msg = m_write_queue.front();
            co_await ws->async_write(net::buffer(msg), net::use_awaitable);
            m_write_queue.pop_front();
        }
    } catch(const boost::system::system_error &e) {
        m_write_queue.clear();
        if(!session_ended(e.code())){
            std::cerr << std::format("Write failed: {}\n", e.what());
        }
    }
    m_is_writing = false;
}

net::awaitable<RoomClient::Response> RoomClient::rest(http::verb method, std::string target, std::string body){
    auto executor = co_await net::this_coro::executor;
    net::ip::tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(m_config.host, std::to_string(m_config.port), net::use_awaitable);
    beast::tcp_stream stream(executor);
    stream.expires_after(std::chrono::seconds(10));
    co_await stream.async_connect(endpoints, net::use_awaitable);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, m_config.host);
    req.set(http::field::user_agent, "ListenRoomClient");
    req.set(http::field::content_type, "application/json");
    req.set("X-User-Id", std::to_string(m_config.user_id));
    req.set("X-Username", m_config.username);
    if(!m_config.avatar.empty()) req.set("X-Avatar", m_config.avatar);
    req.body() = std::move(body);
    req.prepare_payload();
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buffer;
    Response res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);
    beast::error_code ec;
    stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);

    if(res.result_int() >= 400){
        auto error = nlohmann::json::parse(res.body(), nullptr, false);
        auto data = error.is_object() ? error.get<ErrorData>() : ErrorData{ErrorCode::ValidationError, res.body()};
        throw RoomError(data.code, std::format("{} {} failed: {}", std::string(http::to_string(method)), target, data.message));
    }
    co_return res;
}

net::awaitable<void> RoomClient::enter_room(){
    if(m_room_id.empty()){
        auto res = co_await rest(http::verb::post, "/api/rooms",
            nlohmann::json{{"name", std::format("{}'s room", m_config.username)}}.dump());
        m_room_id = nlohmann::json::parse(res.body()).get<RoomInfo>().id;
        std::cout << std::format("Created room {}\n", m_room_id);
    }
    co_await rest(http::verb::post, "/api/rooms/join", nlohmann::json{{"room_id", m_room_id}}.dump());
    std::cout << std::format("Joined room {}\n", m_room_id);
}

net::awaitable<void> RoomClient::fetch_history(){
    auto res = co_await rest(http::verb::get,
        std::format("/api/rooms/{}/messages?limit={}", m_room_id, m_config.history_limit));
    m_session.chat().merge_history(nlohmann::json::parse(res.body()).get<std::vector<ChatMessage>>());
}

std::string RoomClient::socket_target() const {
    boost::url url(std::format("/ws/room/{}", m_room_id));
    url.params().append({"userId", std::to_string(m_config.user_id)});
    url.params().append({"username", m_config.username});
    url.params().append({"token", m_config.token});
    return std::string(url.buffer());
}

net::awaitable<void> RoomClient::connect_once(){
    auto executor = co_await net::this_coro::executor;
    net::ip::tcp::resolver resolver(executor);
    auto endpoints = co_await resolver.async_resolve(m_config.host, std::to_string(m_config.port), net::use_awaitable);
    auto ws = std::make_shared<WebSocket>(executor);
    beast::get_lowest_layer(*ws).expires_after(std::chrono::seconds(10));
    co_await beast::get_lowest_layer(*ws).async_connect(endpoints, net::use_awaitable);
    beast::get_lowest_layer(*ws).expires_never();
    ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    co_await ws->async_handshake(std::format("{}:{}", m_config.host, m_config.port), socket_target(), net::use_awaitable);

    m_ws = ws;
    m_attempt = 0;
    std::cout << std::format("Connected to room {}\n", m_room_id);
    m_session.on_connected();
    try {
        co_await fetch_history();
    } catch (const RoomError &e) {
        std::cerr << std::format("History unavailable: {}\n", e.what());
    } catch (const nlohmann::json::exception &e) {
        std::cerr << std::format("History unreadable: {}\n", e.what());
    }

    try {
        beast::flat_buffer buffer;
        while(!m_session.is_disbanded()){
            co_await ws->async_read(buffer, net::use_awaitable);
            m_session.handle(beast::buffers_to_string(buffer.data()));
            buffer.consume(buffer.size());
        }
    } catch (const boost::system::system_error &e) {
        m_ws.reset();
        m_write_queue.clear();
        m_session.on_disconnected();
        if(!session_ended(e.code())) throw;
        std::cout << "Connection closed\n";
        co_return;
    }
    m_ws.reset();
    m_write_queue.clear();
    m_session.on_disconnected();
}

net::awaitable<void> RoomClient::run(){
    bool entered = false;
    try {
        co_await enter_room();
        entered = true;
    } catch (const RoomError &e) {
        std::cerr << std::format("Cannot enter room: {}\n", e.what());
    } catch (const boost::system::system_error &e) {
        std::cerr << std::format("Cannot reach server: {}\n", e.what());
    }
    if(!entered){
        stop();
        co_return;
    }
    std::uniform_real_distribution<double> jitter(-1.0, 1.0);
    while(!m_stopped && !m_session.is_disbanded()){
        try {
            co_await connect_once();
        } catch (const boost::system::system_error &e) {
            std::cerr << std::format("Connection failed: {}\n", e.what());
        }
        if(m_stopped || m_session.is_disbanded()) break;
        if(++m_attempt > m_config.max_reconnect_attempts){
            std::cerr << std::format("Giving up after {} reconnect attempts\n", m_config.max_reconnect_attempts);
            break;
        }
        auto delay = backoff_delay(m_attempt, m_config, jitter(m_rand_eng));
        std::cout << std::format("Reconnecting in {} ms (attempt {})\n", delay.count(), m_attempt);
        m_retry_timer.expires_after(delay);
        boost::system::error_code ec;
        co_await m_retry_timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    stop();
}

net::awaitable<void> RoomClient::heartbeat_loop(){
    while(!m_stopped){
        m_heartbeat_timer.expires_after(m_config.heartbeat_interval);
        boost::system::error_code ec;
        co_await m_heartbeat_timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        if(ec == net::error::operation_aborted || m_stopped) co_return;
        if(m_ws) m_session.heartbeat();
    }
}

net::awaitable<void> RoomClient::ping_loop(){
    while(!m_stopped){
        m_ping_timer.expires_after(m_config.ping_interval);
        boost::system::error_code ec;
        co_await m_ping_timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        if(ec == net::error::operation_aborted || m_stopped) co_return;
        if(m_ws) m_session.ping();
    }
}
