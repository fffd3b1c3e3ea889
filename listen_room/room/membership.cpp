#include "membership.hpp"
#include "errors.hpp"
#include "json/json_impl.hpp"
#include <algorithm>
#include <format>

Membership::Membership(int max_members)
    : m_max_members(max_members){
}

std::pair<Member, bool> Membership::join(UserId user_id, std::string username, std::string avatar, Millis now){
    if(!is_valid_utf8(username) || !is_valid_utf8(avatar)){
        throw RoomError(ErrorCode::ValidationError, "username and avatar must be valid UTF-8");
    }
    if(auto *existing = find_mut(user_id)){
        auto &member = *existing;
        if(!username.empty()) member.username = std::move(username);
        if(!avatar.empty()) member.avatar = std::move(avatar);
        return {member, false};
    }
    if(static_cast<int>(m_members.size()) >= m_max_members){
        throw RoomError(ErrorCode::ValidationError, std::format("room is full ({} members)", m_max_members));
    }
    Member member;
    member.user_id = user_id;
    member.username = std::move(username);
    member.avatar = std::move(avatar);
    member.joined_at = now;
    if(!owner()){
        member.role = Role::Owner;
        member.can_control = true;
    }
    m_members.push_back(member);
    return {member, true};
}

Member Membership::remove(UserId user_id){
    auto it = std::find_if(m_members.begin(), m_members.end(),
        [&](const Member &m){ return m.user_id == user_id; });
    if(it == m_members.end()){
        throw RoomError(ErrorCode::ValidationError, std::format("user {} is not in the room", user_id));
    }
    Member removed = std::move(*it);
    m_members.erase(it);
    return removed;
}

const Member &Membership::get(UserId user_id) const {
    if(auto *member = find(user_id)) return *member;
    throw RoomError(ErrorCode::PermissionDenied, std::format("user {} is not a member of the room", user_id));
}

const Member *Membership::find(UserId user_id) const {
    auto it = std::find_if(m_members.begin(), m_members.end(),
        [&](const Member &m){ return m.user_id == user_id; });
    return it == m_members.end() ? nullptr : &*it;
}

Member *Membership::find_mut(UserId user_id){
    auto it = std::find_if(m_members.begin(), m_members.end(),
        [&](const Member &m){ return m.user_id == user_id; });
    return it == m_members.end() ? nullptr : &*it;
}

Member &Membership::get_mut(UserId user_id){
    if(auto *member = find_mut(user_id)) return *member;
    throw RoomError(ErrorCode::PermissionDenied, std::format("user {} is not a member of the room", user_id));
}

ModeTransition Membership::set_mode(UserId user_id, Mode mode){
    ModeTransition transition;
    auto &member = get_mut(user_id);
    if(member.mode == mode) return transition;
    member.mode = mode;
    transition.changed = true;
    if(member.role == Role::Owner && mode == Mode::Chat){
        for(auto &other : m_members){
            if(other.user_id != user_id && other.mode == Mode::Listen){
                other.mode = Mode::Chat;
                transition.forced_to_chat.push_back(other.user_id);
            }
        }
    }
    return transition;
}

void Membership::grant_control(UserId target, bool can_control){
    auto &member = get_mut(target);
    if(member.role == Role::Owner){
        throw RoomError(ErrorCode::PermissionDenied, "control grant does not apply to the owner");
    }
    member.can_control = can_control;
}

void Membership::set_role(UserId target, Role role){
    auto &member = get_mut(target);
    if(member.role == Role::Owner || role == Role::Owner){
        throw RoomError(ErrorCode::ValidationError, "ownership changes only through transfer_owner");
    }
    member.role = role;
}

void Membership::transfer_owner(UserId from, UserId to){
    if(from == to){
        throw RoomError(ErrorCode::ValidationError, "user already owns the room");
    }
    auto &target = get_mut(to);
    auto &current = get_mut(from);
    if(current.role != Role::Owner){
        throw RoomError(ErrorCode::PermissionDenied, std::format("user {} is not the owner", from));
    }
    current.role = Role::Member;
    current.can_control = false;
    target.role = Role::Owner;
    target.can_control = true;
}

void Membership::set_online(UserId user_id, bool online){
    if(auto *member = find_mut(user_id)){
        member->online = online;
    }
}

std::optional<Member> Membership::owner() const {
    for(const auto &member : m_members){
        if(member.role == Role::Owner) return member;
    }
    return std::nullopt;
}

std::optional<Member> Membership::master() const {
    auto current = owner();
    if(current && is_master(*current)) return current;
    return std::nullopt;
}

std::optional<UserId> Membership::successor(UserId excluding, bool online_only) const {
    for(const auto &member : m_members){
        if(member.user_id == excluding) continue;
        if(online_only && !member.online) continue;
        return member.user_id;
    }
    return std::nullopt;
}
