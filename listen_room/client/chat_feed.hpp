#pragma once
#include "json/json_impl.hpp"
#include <functional>
#include <vector>

// Client view of a room's chat: optimistic echoes, live messages and fetched history.
class ChatFeed {
public:
    using Transport = std::function<void(const ChatData &)>;

    ChatFeed(UserId self_id, std::string self_name, Transport transport);

    void set_connected(bool connected);
    bool is_connected() const;

    // Throws RoomError(NotConnected) while the transport is down.
    ChatMessage send_message(std::string content);

    void on_live(const ChatMessage &message);
    void merge_history(const std::vector<ChatMessage> &history);
    void clear();

    const std::vector<ChatMessage> &messages() const;

private:
    bool replace_provisional(const ChatMessage &message);
    bool contains_id(std::int64_t id) const;
    void sort();

    UserId m_self_id;
    std::string m_self_name;
    Transport m_transport;
    bool m_connected = false;
    std::int64_t m_next_provisional{};
    std::vector<ChatMessage> m_messages;
};
