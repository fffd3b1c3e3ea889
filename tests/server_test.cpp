#include <gtest/gtest.h>
#include "server.hpp"

class ServerTest : public ::testing::Test {
protected:
    Server::Request request(http::verb method, std::string target, UserId user_id = 1,
                            std::string username = "alice", std::string body = {}){
        Server::Request req{method, target, 11};
        if(user_id != 0){
            req.set("X-User-Id", std::to_string(user_id));
            req.set("X-Username", username);
        }
        req.body() = std::move(body);
        req.prepare_payload();
        return req;
    }

    nlohmann::json body_of(const Server::Response &res){
        return nlohmann::json::parse(res.body());
    }

    RoomCode create_room(UserId owner = 1, std::string name = "alice"){
        auto res = server.handle_request(request(http::verb::post, "/api/rooms", owner, name, R"({"name":"late night"})"));
        EXPECT_EQ(res.result(), http::status::created);
        return body_of(res).at("id").get<std::string>();
    }

    Server server{ServerConfig{}};
};

TEST_F(ServerTest, CreateRoomReturnsDescriptor) {
    auto res = server.handle_request(request(http::verb::post, "/api/rooms", 1, "alice", R"({"name":"late night"})"));
    ASSERT_EQ(res.result(), http::status::created);
    auto info = body_of(res).get<RoomInfo>();
    EXPECT_EQ(info.name, "late night");
    EXPECT_EQ(info.owner_id, 1);
    EXPECT_EQ(info.max_members, 10);
}

TEST_F(ServerTest, MissingIdentityIsUnauthorized) {
    auto res = server.handle_request(request(http::verb::get, "/api/rooms/my", 0));
    EXPECT_EQ(res.result(), http::status::unauthorized);
}

TEST_F(ServerTest, NonUtf8IdentityIsRejected) {
    auto code = create_room();
    auto res = server.handle_request(request(http::verb::post, "/api/rooms/join", 2, "bad\xff",
        nlohmann::json{{"room_id", code}}.dump()));
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(body_of(res).at("code"), "ValidationError");
    EXPECT_FALSE(server.rooms().get_room(code)->member(2).has_value());
}

TEST_F(ServerTest, JoinReturnsMemberAndState) {
    auto code = create_room();
    auto res = server.handle_request(request(http::verb::post, "/api/rooms/join", 2, "bob",
        nlohmann::json{{"room_id", code}}.dump()));
    ASSERT_EQ(res.result(), http::status::ok);
    auto body = body_of(res);
    EXPECT_EQ(body.at("member").at("role"), "member");
    EXPECT_EQ(body.at("room").at("id"), code);
    EXPECT_EQ(body.at("state").at("members").size(), 2u);
}

TEST_F(ServerTest, ErrorCodesMapToStatuses) {
    auto code = create_room();
    EXPECT_EQ(server.handle_request(request(http::verb::get, "/api/rooms/654321")).result(), http::status::not_found);
    EXPECT_EQ(server.handle_request(request(http::verb::get, "/api/rooms/12ab")).result(), http::status::bad_request);
    // Not a member of the room.
    EXPECT_EQ(server.handle_request(request(http::verb::get, "/api/rooms/" + code, 5, "eve")).result(), http::status::forbidden);

    server.handle_request(request(http::verb::post, "/api/rooms/join", 2, "bob", nlohmann::json{{"room_id", code}}.dump()));
    auto denied = server.handle_request(request(http::verb::post, "/api/rooms/disband", 2, "bob",
        nlohmann::json{{"room_id", code}}.dump()));
    EXPECT_EQ(denied.result(), http::status::forbidden);
    EXPECT_EQ(body_of(denied).at("code"), "PermissionDenied");

    auto malformed = server.handle_request(request(http::verb::post, "/api/rooms/join", 2, "bob", "{not json"));
    EXPECT_EQ(malformed.result(), http::status::bad_request);
}

TEST_F(ServerTest, MessagesHonourLimit) {
    auto code = create_room();
    auto room = server.rooms().get_room(code);
    for(int i = 0; i < 120; ++i){
        room->send_chat(1, "message " + std::to_string(i));
    }
    auto res = server.handle_request(request(http::verb::get, "/api/rooms/" + code + "/messages?limit=5"));
    ASSERT_EQ(res.result(), http::status::ok);
    auto messages = body_of(res).get<std::vector<ChatMessage>>();
    ASSERT_EQ(messages.size(), 5u);
    EXPECT_EQ(messages.back().content, "message 119");
    EXPECT_LT(messages.front().id, messages.back().id);

    auto defaulted = body_of(server.handle_request(request(http::verb::get, "/api/rooms/" + code + "/messages")));
    EXPECT_EQ(defaulted.size(), 50u);
    auto clamped = body_of(server.handle_request(request(http::verb::get, "/api/rooms/" + code + "/messages?limit=500")));
    EXPECT_EQ(clamped.size(), 100u);
    EXPECT_EQ(server.handle_request(request(http::verb::get, "/api/rooms/" + code + "/messages?limit=x")).result(),
        http::status::bad_request);
}

TEST_F(ServerTest, MessagesPageWithOffset) {
    auto code = create_room();
    auto room = server.rooms().get_room(code);
    for(int i = 0; i < 10; ++i){
        room->send_chat(1, "message " + std::to_string(i));
    }
    auto page = body_of(server.handle_request(request(http::verb::get, "/api/rooms/" + code + "/messages?limit=3&offset=4")))
        .get<std::vector<ChatMessage>>();
    ASSERT_EQ(page.size(), 3u);
    EXPECT_EQ(page.front().content, "message 3");
    EXPECT_EQ(page.back().content, "message 5");
    EXPECT_EQ(server.handle_request(request(http::verb::get, "/api/rooms/" + code + "/messages?offset=-1")).result(),
        http::status::bad_request);
}

TEST_F(ServerTest, MyRoomsAndLeave) {
    auto code = create_room();
    server.handle_request(request(http::verb::post, "/api/rooms/join", 2, "bob", nlohmann::json{{"room_id", code}}.dump()));
    auto mine = body_of(server.handle_request(request(http::verb::get, "/api/rooms/my", 2, "bob")));
    ASSERT_EQ(mine.size(), 1u);
    EXPECT_EQ(mine[0].at("id"), code);
    EXPECT_EQ(mine[0].at("is_owner"), false);

    auto left = server.handle_request(request(http::verb::post, "/api/rooms/leave", 1, "alice",
        nlohmann::json{{"room_id", code}, {"transfer_to", 2}}.dump()));
    EXPECT_EQ(left.result(), http::status::ok);
    mine = body_of(server.handle_request(request(http::verb::get, "/api/rooms/my", 2, "bob")));
    EXPECT_EQ(mine[0].at("is_owner"), true);
}

TEST_F(ServerTest, UnknownRouteIsNotFound) {
    EXPECT_EQ(server.handle_request(request(http::verb::get, "/api/songs")).result(), http::status::not_found);
    EXPECT_EQ(server.handle_request(request(http::verb::delete_, "/api/rooms/my")).result(), http::status::not_found);
}
