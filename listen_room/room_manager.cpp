#include "room_manager.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <iostream>

namespace {
constexpr int max_code_attempts = 100;
}

RoomManager::RoomManager(RoomSettings settings)
    : m_settings(settings), m_rand_eng(std::random_device{}()){
}

bool RoomManager::is_valid_code(const RoomCode &code){
    return code.size() == 6 && code.front() != '0' &&
        std::all_of(code.begin(), code.end(), [](unsigned char c){ return std::isdigit(c); });
}

RoomCode RoomManager::generate_code(){
    std::uniform_int_distribution<int> dist(100000, 999999);
    return std::to_string(dist(m_rand_eng));
}

std::shared_ptr<Room> RoomManager::create_room(UserId owner_id, std::string owner_name, std::string avatar, std::string name){
    if(name.empty()){
        name = std::format("{}'s room", owner_name);
    }
    std::shared_ptr<Room> room;
    {
        std::lock_guard lock(m_mutex);
        for(int attempt = 0; attempt < max_code_attempts && !room; ++attempt){
            auto code = generate_code();
            if(m_rooms.find(code) != m_rooms.end()){
                continue;
            }
            auto destroyer = [this](const RoomCode &code){
                std::lock_guard lock(m_mutex);
                m_rooms.erase(code);
                std::cout << std::format("[rooms] room {} closed\n", code);
            };
            RoomInfo info{.id = code, .name = name, .owner_id = owner_id, .created_at = now_ms()};
            room = std::make_shared<Room>(std::move(info), m_settings, destroyer);
            m_rooms.emplace(std::move(code), room);
        }
    }
    if(!room){
        throw std::runtime_error("could not generate a unique room code");
    }
    room->join(owner_id, std::move(owner_name), std::move(avatar));
    std::cout << std::format("[rooms] room {} \"{}\" created by {}\n", room->get_code(), name, owner_id);
    return room;
}

std::shared_ptr<Room> RoomManager::get_room(const RoomCode &code){
    if(!is_valid_code(code)){
        throw RoomError(ErrorCode::ValidationError, std::format("malformed room id \"{}\"", code));
    }
    if(auto room = find_room(code)){
        return std::move(*room);
    }
    throw RoomError(ErrorCode::RoomNotFound, std::format("room {} does not exist", code));
}

std::optional<std::shared_ptr<Room>> RoomManager::find_room(const RoomCode &code){
    std::lock_guard lock(m_mutex);
    auto it = m_rooms.find(code);
    if (it != m_rooms.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<RoomSummary> RoomManager::user_rooms(UserId user_id){
    std::vector<std::shared_ptr<Room>> rooms;
    {
        std::lock_guard lock(m_mutex);
        rooms.reserve(m_rooms.size());
        for(const auto &[code, room] : m_rooms){
            rooms.push_back(room);
        }
    }
    std::vector<RoomSummary> result;
    for(const auto &room : rooms){
        auto member = room->member(user_id);
        if(!member) continue;
        auto info = room->info();
        auto owner = room->member(info.owner_id);
        result.push_back(RoomSummary{
            .id = info.id,
            .name = info.name,
            .owner_name = owner ? owner->username : std::string{},
            .member_count = static_cast<int>(room->member_count()),
            .is_owner = info.owner_id == user_id,
            .joined_at = member->joined_at,
            .status = info.status,
        });
    }
    std::sort(result.begin(), result.end(),
        [](const RoomSummary &a, const RoomSummary &b){ return a.joined_at > b.joined_at; });
    return result;
}

std::size_t RoomManager::room_count(){
    std::lock_guard lock(m_mutex);
    return m_rooms.size();
}
