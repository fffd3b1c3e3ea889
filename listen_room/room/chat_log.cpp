#include "chat_log.hpp"
#include "errors.hpp"
#include <algorithm>
#include <format>

ChatLog::ChatLog(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(capacity, 1)){
}

std::pair<ChatMessage, bool> ChatLog::append(UserId user_id, std::string username, std::string content,
    MessageType type, std::optional<std::string> client_msg_id, Millis now){
    if(content.empty()){
        throw RoomError(ErrorCode::ValidationError, "message is empty");
    }
    if(content.size() > max_content_length){
        throw RoomError(ErrorCode::ValidationError,
            std::format("message exceeds {} bytes", max_content_length));
    }
    if(client_msg_id){
        auto it = std::find_if(m_messages.rbegin(), m_messages.rend(), [&](const ChatMessage &m){
            return m.user_id == user_id && m.client_msg_id == client_msg_id;
        });
        if(it != m_messages.rend()) return {*it, false};
    }
    ChatMessage message{
        .id = m_next_id++,
        .user_id = user_id,
        .username = std::move(username),
        .content = std::move(content),
        .timestamp = now,
        .type = type,
        .client_msg_id = std::move(client_msg_id),
    };
    m_messages.push_back(message);
    while(m_messages.size() > m_capacity){
        m_messages.pop_front();
    }
    return {message, true};
}

std::vector<ChatMessage> ChatLog::history(std::size_t limit, std::size_t offset) const {
    auto skipped = std::min(offset, m_messages.size());
    auto last = m_messages.end() - static_cast<std::ptrdiff_t>(skipped);
    auto count = std::min(limit, m_messages.size() - skipped);
    return {last - static_cast<std::ptrdiff_t>(count), last};
}
