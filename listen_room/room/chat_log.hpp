#pragma once
#include "model/types.hpp"
#include <deque>
#include <optional>
#include <vector>

// Room chat history. Ids are assigned in arrival order starting at 1; only the
// newest `capacity` messages are kept.
class ChatLog {
public:
    static constexpr std::size_t max_content_length = 4096;

    explicit ChatLog(std::size_t capacity);

    // A repeated (user, client_msg_id) pair returns the stored message and false.
    std::pair<ChatMessage, bool> append(UserId user_id, std::string username, std::string content,
        MessageType type, std::optional<std::string> client_msg_id, Millis now);

    // Up to `limit` messages in ascending order, skipping the `offset` newest.
    std::vector<ChatMessage> history(std::size_t limit, std::size_t offset = 0) const;
    std::int64_t last_id() const { return m_next_id - 1; }
    std::size_t size() const { return m_messages.size(); }
private:
    std::size_t m_capacity;
    std::int64_t m_next_id = 1;
    std::deque<ChatMessage> m_messages;
};
