#pragma once
#include <string>

// Receiving end of room broadcasts; one per live connection.
class RoomPeer {
public:
    virtual ~RoomPeer() = default;
    virtual void deliver(const std::string &message) = 0;
    virtual void close_with_message(const std::string &message) = 0;
};
