#include <gtest/gtest.h>
#include "room/chat_log.hpp"
#include "errors.hpp"

TEST(ChatLogTest, AssignsIncreasingIds) {
    ChatLog log(10);
    auto [first, created_first] = log.append(1, "a", "hi", MessageType::Chat, std::nullopt, 10);
    auto [second, created_second] = log.append(2, "b", "hey", MessageType::Chat, std::nullopt, 11);
    EXPECT_TRUE(created_first);
    EXPECT_TRUE(created_second);
    EXPECT_EQ(first.id, 1);
    EXPECT_EQ(second.id, 2);
    EXPECT_EQ(log.last_id(), 2);
}

TEST(ChatLogTest, RepeatedClientKeyIsStoredOnce) {
    ChatLog log(10);
    auto [original, created] = log.append(1, "a", "hi", MessageType::Chat, "k-1", 10);
    auto [again, created_again] = log.append(1, "a", "hi", MessageType::Chat, "k-1", 20);
    EXPECT_TRUE(created);
    EXPECT_FALSE(created_again);
    EXPECT_EQ(again.id, original.id);
    EXPECT_EQ(log.size(), 1u);
    // Same key from another user is a different message.
    EXPECT_TRUE(log.append(2, "b", "hi", MessageType::Chat, "k-1", 30).second);
}

TEST(ChatLogTest, RejectsEmptyAndOversizedContent) {
    ChatLog log(10);
    EXPECT_THROW(log.append(1, "a", "", MessageType::Chat, std::nullopt, 1), RoomError);
    EXPECT_THROW(log.append(1, "a", std::string(ChatLog::max_content_length + 1, 'x'),
        MessageType::Chat, std::nullopt, 1), RoomError);
    EXPECT_EQ(log.size(), 0u);
}

TEST(ChatLogTest, HistoryReturnsNewestInAscendingOrder) {
    ChatLog log(3);
    for(int i = 0; i < 5; ++i){
        log.append(1, "a", "m" + std::to_string(i), MessageType::Chat, std::nullopt, i);
    }
    EXPECT_EQ(log.size(), 3u);
    auto last_two = log.history(2);
    ASSERT_EQ(last_two.size(), 2u);
    EXPECT_EQ(last_two[0].id, 4);
    EXPECT_EQ(last_two[1].id, 5);
    EXPECT_EQ(log.history(50).size(), 3u);
}

TEST(ChatLogTest, OffsetPagesBackwards) {
    ChatLog log(10);
    for(int i = 0; i < 6; ++i){
        log.append(1, "a", "m" + std::to_string(i), MessageType::Chat, std::nullopt, i);
    }
    auto page = log.history(2, 2);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].id, 3);
    EXPECT_EQ(page[1].id, 4);
    EXPECT_EQ(log.history(5, 4).size(), 2u);
    EXPECT_TRUE(log.history(5, 6).empty());
    EXPECT_TRUE(log.history(5, 100).empty());
}
