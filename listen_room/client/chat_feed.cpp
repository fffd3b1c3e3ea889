#include "client/chat_feed.hpp"
#include <algorithm>
#include <format>

ChatFeed::ChatFeed(UserId self_id, std::string self_name, Transport transport)
    : m_self_id(self_id), m_self_name(std::move(self_name)), m_transport(std::move(transport)){
}

void ChatFeed::set_connected(bool connected){
    m_connected = connected;
}

bool ChatFeed::is_connected() const {
    return m_connected;
}

ChatMessage ChatFeed::send_message(std::string content){
    if(!m_connected){
        throw RoomError(ErrorCode::NotConnected, "chat is not connected");
    }
    if(content.empty()){
        throw RoomError(ErrorCode::ValidationError, "message is empty");
    }
    auto sequence = ++m_next_provisional;
    auto timestamp = now_ms();
    ChatMessage message{
        .id = -sequence,
        .user_id = m_self_id,
        .username = m_self_name,
        .content = std::move(content),
        .timestamp = timestamp,
        .client_msg_id = std::format("{}-{}-{}", m_self_id, timestamp, sequence),
    };
    m_messages.push_back(message);
    m_transport(ChatData{message.content, message.client_msg_id});
    return message;
}

bool ChatFeed::contains_id(std::int64_t id) const {
    return std::any_of(m_messages.begin(), m_messages.end(),
        [id](const ChatMessage &m){ return m.id == id; });
}

bool ChatFeed::replace_provisional(const ChatMessage &message){
    if(!message.client_msg_id) return false;
    auto it = std::find_if(m_messages.begin(), m_messages.end(), [&](const ChatMessage &m){
        return m.id < 0 && m.client_msg_id == message.client_msg_id;
    });
    if(it == m_messages.end()) return false;
    *it = message;
    return true;
}

void ChatFeed::on_live(const ChatMessage &message){
    if(contains_id(message.id)) return;
    if(replace_provisional(message)){
        sort();
        return;
    }
    // Our own message without a key would double the optimistic echo.
    if(message.user_id == m_self_id && message.type == MessageType::Chat && !message.client_msg_id) return;
    m_messages.push_back(message);
    sort();
}

void ChatFeed::merge_history(const std::vector<ChatMessage> &history){
    for(const auto &message : history){
        if(contains_id(message.id)) continue;
        if(!replace_provisional(message)){
            m_messages.push_back(message);
        }
    }
    sort();
}

void ChatFeed::clear(){
    m_messages.clear();
}

const std::vector<ChatMessage> &ChatFeed::messages() const {
    return m_messages;
}

// Confirmed messages by id, ties by timestamp; provisional echoes stay last.
void ChatFeed::sort(){
    std::stable_sort(m_messages.begin(), m_messages.end(), [](const ChatMessage &a, const ChatMessage &b){
        bool a_pending = a.id < 0, b_pending = b.id < 0;
        if(a_pending != b_pending) return b_pending;
        if(a_pending) return a.timestamp < b.timestamp;
        if(a.id != b.id) return a.id < b.id;
        return a.timestamp < b.timestamp;
    });
}
