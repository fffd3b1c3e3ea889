#include "permission.hpp"
#include "errors.hpp"
#include <format>

namespace {
bool can_edit(const Member &member){
    return member.role == Role::Owner || member.role == Role::Admin || member.can_control;
}
std::string_view operation_name(Operation operation){
    switch(operation){
        case Operation::Disband: return "disband";
        case Operation::GrantControl: return "grant_control";
        case Operation::SetRole: return "set_role";
        case Operation::TransferOwner: return "transfer_owner";
        case Operation::AddSong: return "song_add";
        case Operation::RemoveSong: return "song_del";
        case Operation::ReorderSong: return "song_move";
        case Operation::ControlPlayback: return "playback_control";
        case Operation::SetMode: return "mode";
        case Operation::ReportPlayback: return "master_report";
        case Operation::RequestPlayback: return "master_request";
        case Operation::SendChat: return "chat";
    }
    return "unknown";
}
}

bool can_perform(const Member &member, Operation operation){
    switch(operation){
        case Operation::Disband:
        case Operation::GrantControl:
        case Operation::SetRole:
        case Operation::TransferOwner:
            return member.role == Role::Owner;
        case Operation::AddSong:
        case Operation::RemoveSong:
        case Operation::ReorderSong:
        case Operation::ControlPlayback:
            return can_edit(member);
        case Operation::ReportPlayback:
            return is_master(member);
        case Operation::SetMode:
        case Operation::RequestPlayback:
        case Operation::SendChat:
            return true;
    }
    return false;
}

void require(const Member &member, Operation operation){
    if(can_perform(member, operation)) return;
    if(operation == Operation::ReportPlayback){
        throw RoomError(ErrorCode::NotMaster,
            std::format("user {} is not the room master", member.user_id));
    }
    throw RoomError(ErrorCode::PermissionDenied,
        std::format("user {} may not {}", member.user_id, operation_name(operation)));
}
