#pragma once
#include "room/room.hpp"
#include <random>

class RoomManager {
public:
    explicit RoomManager(RoomSettings settings = {});
    std::shared_ptr<Room> create_room(UserId owner_id, std::string owner_name, std::string avatar, std::string name);
    // Throws ValidationError for a malformed code, RoomNotFound for an unknown one.
    std::shared_ptr<Room> get_room(const RoomCode &code);
    std::optional<std::shared_ptr<Room>> find_room(const RoomCode &code);
    std::vector<RoomSummary> user_rooms(UserId user_id);
    std::size_t room_count();

    static bool is_valid_code(const RoomCode &code);
private:
    RoomCode generate_code();
    std::mutex m_mutex;
    RoomSettings m_settings;
    std::default_random_engine m_rand_eng;
    std::unordered_map<RoomCode, std::shared_ptr<Room>> m_rooms;
};
