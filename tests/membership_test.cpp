#include <gtest/gtest.h>
#include "room/membership.hpp"
#include "errors.hpp"

class MembershipTest : public ::testing::Test {
protected:
    void SetUp() override {
        members.join(1, "owner", "", 100);
        members.join(2, "bob", "", 200);
        members.join(3, "carol", "", 300);
    }
    Membership members{4};
};

TEST_F(MembershipTest, FirstJoinerBecomesOwner) {
    EXPECT_EQ(members.get(1).role, Role::Owner);
    EXPECT_TRUE(members.get(1).can_control);
    EXPECT_EQ(members.get(2).role, Role::Member);
    EXPECT_FALSE(members.get(2).can_control);
}

TEST_F(MembershipTest, RejoinUpdatesProfileWithoutDuplicating) {
    auto [member, created] = members.join(2, "bobby", "a.png", 999);
    EXPECT_FALSE(created);
    EXPECT_EQ(member.username, "bobby");
    EXPECT_EQ(member.joined_at, 200);
    EXPECT_EQ(members.size(), 3u);
}

TEST_F(MembershipTest, FullRoomRejectsNewcomers) {
    members.join(4, "dave", "", 400);
    EXPECT_THROW(members.join(5, "eve", "", 500), RoomError);
}

TEST_F(MembershipTest, MasterIsOwnerInListenMode) {
    EXPECT_FALSE(members.master());
    members.set_mode(2, Mode::Listen);
    EXPECT_FALSE(members.master());
    members.set_mode(1, Mode::Listen);
    ASSERT_TRUE(members.master());
    EXPECT_EQ(members.master()->user_id, 1);
}

TEST_F(MembershipTest, OwnerLeavingListenForcesListenersToChat) {
    members.set_mode(1, Mode::Listen);
    members.set_mode(2, Mode::Listen);
    members.set_mode(3, Mode::Listen);
    auto transition = members.set_mode(1, Mode::Chat);
    EXPECT_TRUE(transition.changed);
    EXPECT_EQ(transition.forced_to_chat, (std::vector<UserId>{2, 3}));
    for(const auto &member : members.list()){
        EXPECT_EQ(member.mode, Mode::Chat);
    }
}

TEST_F(MembershipTest, MemberLeavingListenDoesNotCascade) {
    members.set_mode(2, Mode::Listen);
    members.set_mode(3, Mode::Listen);
    auto transition = members.set_mode(2, Mode::Chat);
    EXPECT_TRUE(transition.forced_to_chat.empty());
    EXPECT_EQ(members.get(3).mode, Mode::Listen);
}

TEST_F(MembershipTest, GrantControlOnOwnerIsDenied) {
    members.grant_control(2, true);
    EXPECT_TRUE(members.get(2).can_control);
    EXPECT_THROW(members.grant_control(1, false), RoomError);
}

TEST_F(MembershipTest, SetRoleCannotTouchOwnership) {
    members.set_role(2, Role::Admin);
    EXPECT_EQ(members.get(2).role, Role::Admin);
    EXPECT_THROW(members.set_role(3, Role::Owner), RoomError);
    EXPECT_THROW(members.set_role(1, Role::Member), RoomError);
}

TEST_F(MembershipTest, TransferOwnerSwapsRoles) {
    members.transfer_owner(1, 3);
    EXPECT_EQ(members.get(1).role, Role::Member);
    EXPECT_FALSE(members.get(1).can_control);
    EXPECT_EQ(members.get(3).role, Role::Owner);
    EXPECT_TRUE(members.get(3).can_control);
    EXPECT_THROW(members.transfer_owner(2, 1), RoomError);
}

TEST_F(MembershipTest, SuccessorIsEarliestJoined) {
    EXPECT_EQ(members.successor(1, false).value(), 2);
    members.set_online(3, true);
    EXPECT_EQ(members.successor(1, true).value(), 3);
    EXPECT_FALSE(members.successor(3, true));
}
