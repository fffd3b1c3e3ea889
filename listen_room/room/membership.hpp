#pragma once
#include "model/types.hpp"
#include <optional>
#include <vector>

struct ModeTransition {
    bool changed = false;
    // Listeners moved back to chat because the owner left listen mode.
    std::vector<UserId> forced_to_chat;
};

// Members of one room in join order, with their role, mode and control grant.
class Membership {
public:
    explicit Membership(int max_members);

    // Returns the member record and whether it was created by this call.
    std::pair<Member, bool> join(UserId user_id, std::string username, std::string avatar, Millis now);
    Member remove(UserId user_id);

    const Member &get(UserId user_id) const;
    const Member *find(UserId user_id) const;
    bool contains(UserId user_id) const { return find(user_id) != nullptr; }

    ModeTransition set_mode(UserId user_id, Mode mode);
    void grant_control(UserId target, bool can_control);
    void set_role(UserId target, Role role);
    void transfer_owner(UserId from, UserId to);
    void set_online(UserId user_id, bool online);

    std::optional<Member> owner() const;
    std::optional<Member> master() const;
    // Earliest-joined member other than `excluding`.
    std::optional<UserId> successor(UserId excluding, bool online_only) const;

    const std::vector<Member> &list() const { return m_members; }
    std::size_t size() const { return m_members.size(); }
    bool empty() const { return m_members.empty(); }
private:
    Member *find_mut(UserId user_id);
    Member &get_mut(UserId user_id);

    int m_max_members;
    std::vector<Member> m_members;
};
