#pragma once
#include "common.hpp"
#include "config.hpp"
#include "client/client_session.hpp"
#include <deque>
#include <memory>
#include <random>

// WebSocket and REST transport of the listening client. Runs on a single
// threaded io_context; reconnects with exponential backoff.
class RoomClient {
public:
    using WebSocket = websocket::stream<beast::tcp_stream>;
    using Response = http::response<http::string_body>;

    RoomClient(net::io_context &ioc, ClientConfig config, Player &player);

    RoomClient(const RoomClient&) = delete;
    RoomClient& operator=(const RoomClient&) = delete;

    void start();
    void stop();
    void on_stopped(std::function<void()> handler);
    // Leaves the room over REST, then stops.
    void leave(std::optional<UserId> transfer_to = std::nullopt);

    ClientSession &session();
    const RoomCode &room_id() const;
    bool is_connected() const;

    // Delay before reconnect attempt number `attempt` (1-based); unit in [-1, 1] scales the jitter.
    static std::chrono::milliseconds backoff_delay(int attempt, const ClientConfig &config, double unit);

private:
    net::awaitable<void> run();
    net::awaitable<void> enter_room();
    net::awaitable<void> leave_room(std::string body);
    net::awaitable<void> connect_once();
    net::awaitable<void> fetch_history();
    net::awaitable<Response> rest(http::verb method, std::string target, std::string body = {});
    net::awaitable<void> heartbeat_loop();
    net::awaitable<void> ping_loop();
    net::awaitable<void> write_loop(std::shared_ptr<WebSocket> ws);

    void send(const std::string &message);
    std::string socket_target() const;

    net::io_context &m_ioc;
    ClientConfig m_config;
    ClientSession m_session;
    RoomCode m_room_id;

    std::shared_ptr<WebSocket> m_ws;
    std::deque<std::string> m_write_queue;
    bool m_is_writing = false;
    bool m_stopped = false;
    std::function<void()> m_on_stopped;
    int m_attempt{};

    net::steady_timer m_retry_timer;
    net::steady_timer m_heartbeat_timer;
    net::steady_timer m_ping_timer;
    std::default_random_engine m_rand_eng;
};
