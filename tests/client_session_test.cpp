#include <gtest/gtest.h>
#include "client/client_session.hpp"
#include "client/simulated_player.hpp"
#include "test_support.hpp"

class ClientSessionTest : public ::testing::Test {
protected:
    Member member(UserId id, Role role, Mode mode){
        Member m;
        m.user_id = id;
        m.username = "u" + std::to_string(id);
        m.role = role;
        m.mode = mode;
        m.online = true;
        return m;
    }

    void receive(ServerEvent type, nlohmann::json data){
        session.handle(make_server_message(type, std::move(data)));
    }

    std::vector<nlohmann::json> sent_of(const std::string &type){
        std::vector<nlohmann::json> result;
        for(const auto &m : sent){
            if(m.at("type") == type) result.push_back(m.at("data"));
        }
        return result;
    }

    double now = 0;
    SimulatedPlayer player{[this]{ return now; }};
    std::vector<nlohmann::json> sent;
    ClientSession session{2, "u2", player, [this](const std::string &text){ sent.push_back(nlohmann::json::parse(text)); }};
};

TEST_F(ClientSessionTest, ReconnectResynchronizes) {
    receive(ServerEvent::MemberList, std::vector<Member>{member(1, Role::Owner, Mode::Listen), member(2, Role::Member, Mode::Listen)});
    sent.clear();
    session.on_connected();
    EXPECT_EQ(sent_of("sync").size(), 1u);
    EXPECT_EQ(sent_of("master_request").size(), 1u);
    EXPECT_TRUE(session.chat().is_connected());
    session.on_disconnected();
    EXPECT_FALSE(session.chat().is_connected());
}

TEST_F(ClientSessionTest, FollowerAppliesMasterSync) {
    RoomState state;
    state.room.id = "123456";
    state.members = {member(1, Role::Owner, Mode::Listen), member(2, Role::Member, Mode::Listen)};
    receive(ServerEvent::Welcome, {{"user_id", 2}, {"member", state.members[1]}, {"state", state}});
    EXPECT_EQ(session.room()->id, "123456");
    EXPECT_FALSE(session.is_master());

    PlaybackSnapshot snapshot;
    snapshot.song_id = "X";
    snapshot.duration_ms = 200000;
    snapshot.position_seconds = 42;
    snapshot.is_playing = true;
    receive(ServerEvent::MasterSync, snapshot);
    ASSERT_TRUE(player.current_track());
    EXPECT_EQ(player.current_track()->song_id, "X");
    EXPECT_DOUBLE_EQ(player.position(), 42);
    EXPECT_EQ(session.follower().state(), SyncState::Synced);
    EXPECT_TRUE(sent_of("master_report").empty());
}

TEST_F(ClientSessionTest, MasterAnswersRequestsAndAppliesControl) {
    receive(ServerEvent::Playlist, std::vector<PlaylistItem>{make_song("A"), make_song("B")});
    receive(ServerEvent::MemberList, std::vector<Member>{member(2, Role::Owner, Mode::Listen)});
    EXPECT_TRUE(session.is_master());
    EXPECT_TRUE(session.reporter().is_active());

    receive(ServerEvent::PlaybackControl, PlaybackControlData{ClientAction::Play, 0, 3});
    EXPECT_EQ(player.current_track()->song_id, "A");
    EXPECT_TRUE(player.is_playing());

    sent.clear();
    receive(ServerEvent::PlaybackControl, PlaybackControlData{ClientAction::Next, 0, 3});
    EXPECT_EQ(player.current_track()->song_id, "B");
    auto reports = sent_of("master_report");
    ASSERT_FALSE(reports.empty());
    EXPECT_EQ(reports.front().at("song_id"), "B");
    EXPECT_EQ(reports.front().at("position_seconds"), 0.0);

    sent.clear();
    receive(ServerEvent::MasterRequest, MemberEventData{5, "late"});
    ASSERT_EQ(sent_of("master_report").size(), 1u);
    EXPECT_EQ(sent_of("master_report")[0].at("song_id"), "B");
}

TEST_F(ClientSessionTest, TrackEndAdvancesPlaylist) {
    receive(ServerEvent::Playlist, std::vector<PlaylistItem>{make_song("A", 10), make_song("B", 10)});
    receive(ServerEvent::MemberList, std::vector<Member>{member(2, Role::Owner, Mode::Listen)});
    session.control(ClientAction::Play);
    now = 11;
    session.heartbeat();
    EXPECT_EQ(player.current_track()->song_id, "B");
}

TEST_F(ClientSessionTest, NonMasterControlGoesToServer) {
    receive(ServerEvent::MemberList, std::vector<Member>{member(1, Role::Owner, Mode::Listen), member(2, Role::Admin, Mode::Chat)});
    session.control(ClientAction::Seek, 90);
    auto seeks = sent_of("seek");
    ASSERT_EQ(seeks.size(), 1u);
    EXPECT_EQ(seeks[0].at("position"), 90.0);
    EXPECT_FALSE(player.current_track());
}

TEST_F(ClientSessionTest, ErrorsAndDisbandAreRecorded) {
    receive(ServerEvent::Error, ErrorData{ErrorCode::PermissionDenied, "nope"});
    ASSERT_TRUE(session.last_error());
    EXPECT_EQ(session.last_error()->code, ErrorCode::PermissionDenied);

    receive(ServerEvent::RoomDisband, {{"room_id", "123456"}});
    EXPECT_TRUE(session.is_disbanded());
    session.handle("not json");
    EXPECT_TRUE(session.is_disbanded());
}

TEST_F(ClientSessionTest, ChatUsesIdempotencyKey) {
    session.on_connected();
    sent.clear();
    auto echo = session.send_chat("hi all");
    auto chats = sent_of("chat");
    ASSERT_EQ(chats.size(), 1u);
    EXPECT_EQ(chats[0].at("content"), "hi all");
    EXPECT_EQ(chats[0].at("client_msg_id"), *echo.client_msg_id);
}

TEST_F(ClientSessionTest, OwnerEnteringListenReportsCurrentPosition) {
    receive(ServerEvent::MemberList, std::vector<Member>{member(2, Role::Owner, Mode::Chat), member(3, Role::Member, Mode::Listen)});
    player.load(Track{.song_id = "X", .name = "Song X", .hls_url = "/streams/netease/X/playlist.m3u8", .duration_ms = 240000}, {});
    player.seek(60);
    EXPECT_TRUE(sent_of("master_report").empty());

    receive(ServerEvent::MemberList, std::vector<Member>{member(2, Role::Owner, Mode::Listen), member(3, Role::Member, Mode::Listen)});
    auto reports = sent_of("master_report");
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].at("song_id"), "X");
    EXPECT_DOUBLE_EQ(reports[0].at("position_seconds").get<double>(), 60);
}
