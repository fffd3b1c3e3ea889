#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

enum class ErrorCode { RoomNotFound, PermissionDenied, NotMaster, ValidationError, OutOfRange, NotConnected };

std::string_view to_string(ErrorCode code);

// Recoverable failure of a single room operation. Reported only to the caller;
// the room state is left untouched.
class RoomError : public std::runtime_error {
public:
    RoomError(ErrorCode code, const std::string &message);
    ErrorCode code() const noexcept { return m_code; }
private:
    ErrorCode m_code;
};
