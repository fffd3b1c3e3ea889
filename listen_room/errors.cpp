#include "errors.hpp"
#include <format>

std::string_view to_string(ErrorCode code){
    switch(code){
        case ErrorCode::RoomNotFound: return "RoomNotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::NotMaster: return "NotMaster";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::NotConnected: return "NotConnected";
    }
    return "Unknown";
}

RoomError::RoomError(ErrorCode code, const std::string &message)
    : std::runtime_error(std::format("{}: {}", to_string(code), message)), m_code(code){
}
