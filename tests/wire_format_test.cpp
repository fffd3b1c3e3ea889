#include <gtest/gtest.h>
#include "json/json_impl.hpp"

TEST(WireFormatTest, ParsesClientMessages) {
    auto message = nlohmann::json::parse(R"({"type":"song_move","data":{"from":2,"to":0}})").get<ClientMessage>();
    EXPECT_EQ(message.type, ClientAction::SongMove);
    auto move = message.data.get<MoveData>();
    EXPECT_EQ(move.from, 2);
    EXPECT_EQ(move.to, 0);

    auto mode = nlohmann::json::parse(R"({"type":"mode","data":{"mode":"listen"}})").get<ClientMessage>();
    EXPECT_EQ(mode.type, ClientAction::SetMode);
    EXPECT_EQ(mode.data.get<ModeData>().mode, Mode::Listen);
}

TEST(WireFormatTest, UnknownTypeAndMissingDataAreTolerated) {
    auto message = nlohmann::json::parse(R"({"type":"teleport"})").get<ClientMessage>();
    EXPECT_EQ(message.type, ClientAction::Unknown);
    EXPECT_TRUE(message.data.is_object());
    auto ping = nlohmann::json::parse(R"({"type":"ping"})").get<ClientMessage>();
    EXPECT_EQ(ping.type, ClientAction::Ping);
}

TEST(WireFormatTest, ServerMessageCarriesTypeDataAndTimestamp) {
    auto text = make_server_message(ServerEvent::ModeChange, ModeChangeData{4, Mode::Chat, true});
    auto j = nlohmann::json::parse(text);
    EXPECT_EQ(j.at("type"), "mode_change");
    EXPECT_EQ(j.at("data").at("user_id"), 4);
    EXPECT_EQ(j.at("data").at("mode"), "chat");
    EXPECT_EQ(j.at("data").at("forced"), true);
    EXPECT_GT(j.at("timestamp").get<Millis>(), 0);
}

TEST(WireFormatTest, SnapshotUsesSnakeCaseKeys) {
    PlaybackSnapshot snapshot;
    snapshot.song_id = "42";
    snapshot.position_seconds = 61.5;
    snapshot.is_playing = true;
    snapshot.hls_url = "/streams/netease/42/playlist.m3u8";
    nlohmann::json j = snapshot;
    EXPECT_EQ(j.at("song_id"), "42");
    EXPECT_EQ(j.at("position_seconds"), 61.5);
    EXPECT_EQ(j.at("is_playing"), true);
    EXPECT_EQ(j.at("hls_url"), "/streams/netease/42/playlist.m3u8");
}

TEST(WireFormatTest, OptionalClientKeyIsNullWhenAbsent) {
    ChatMessage message{.id = 3, .user_id = 1, .username = "a", .content = "hi"};
    nlohmann::json j = message;
    EXPECT_TRUE(j.at("client_msg_id").is_null());
    auto parsed = nlohmann::json::parse(R"({"id":5,"content":"x","client_msg_id":"k"})").get<ChatMessage>();
    EXPECT_EQ(parsed.id, 5);
    EXPECT_EQ(parsed.client_msg_id.value_or(""), "k");
    EXPECT_EQ(parsed.type, MessageType::Chat);
}

TEST(WireFormatTest, EnumsUseLowercaseNames) {
    EXPECT_EQ(nlohmann::json(Role::Owner), "owner");
    EXPECT_EQ(nlohmann::json(Role::Admin), "admin");
    EXPECT_EQ(nlohmann::json(SongSource::Local), "local");
    EXPECT_EQ(nlohmann::json(RoomStatus::Disbanded), "disbanded");
    EXPECT_EQ(nlohmann::json(ErrorCode::NotMaster), "NotMaster");
    EXPECT_EQ(nlohmann::json("superuser").get<Role>(), Role::Member);
}
