#pragma once
#include "model/types.hpp"

enum class Operation {
    Disband,
    GrantControl,
    SetRole,
    TransferOwner,
    AddSong,
    RemoveSong,
    ReorderSong,
    ControlPlayback,
    SetMode,
    ReportPlayback,
    RequestPlayback,
    SendChat,
};

// Pure role check. Target-specific rules (grantControl on the owner, setMode
// for somebody else) are checked by the room against the target member.
bool can_perform(const Member &member, Operation operation);

// Throws RoomError(PermissionDenied or NotMaster) when can_perform is false.
void require(const Member &member, Operation operation);
