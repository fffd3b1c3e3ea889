#include <gtest/gtest.h>
#include "client/simulated_player.hpp"
#include "client/snapshot_reporter.hpp"
#include <algorithm>

class SnapshotReporterTest : public ::testing::Test {
protected:
    Track track(std::string id){
        return Track{.song_id = id, .name = "Song " + id, .hls_url = "/streams/netease/" + id + "/playlist.m3u8",
                     .duration_ms = 240000};
    }

    double now = 0;
    SimulatedPlayer player{[this]{ return now; }};
    std::vector<PlaybackSnapshot> reports;
    SnapshotReporter reporter{player, [this](const PlaybackSnapshot &s){ reports.push_back(s); }};

    void SetUp() override {
        player.on_event([this](PlayerEvent event){ reporter.on_player_event(event); });
    }
};

TEST_F(SnapshotReporterTest, InactiveReporterStaysSilent) {
    player.load(track("X"), {});
    player.play();
    reporter.on_heartbeat();
    reporter.on_playback_requested();
    EXPECT_TRUE(reports.empty());
}

TEST_F(SnapshotReporterTest, PlayerEventsProduceReports) {
    reporter.set_active(true);
    player.load(track("X"), {});
    player.seek(30);
    player.play();
    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(reports.back().song_id, "X");
    EXPECT_DOUBLE_EQ(reports.back().position_seconds, 30);
    EXPECT_TRUE(reports.back().is_playing);
    EXPECT_EQ(reports.back().hls_url, "/streams/netease/X/playlist.m3u8");

    now = 4;
    player.pause();
    EXPECT_FALSE(reports.back().is_playing);
    EXPECT_DOUBLE_EQ(reports.back().position_seconds, 34);
}

TEST_F(SnapshotReporterTest, HeartbeatOnlyWhilePlaying) {
    reporter.set_active(true);
    player.load(track("X"), {});
    auto count = reports.size();
    reporter.on_heartbeat();
    EXPECT_EQ(reports.size(), count);

    player.play();
    now = 5;
    reporter.on_heartbeat();
    EXPECT_EQ(reports.size(), count + 2);
    EXPECT_DOUBLE_EQ(reports.back().position_seconds, 5);
}

TEST_F(SnapshotReporterTest, SongSwitchReportsPositionZero) {
    reporter.set_active(true);
    player.load(track("X"), {});
    player.seek(120);
    player.play();
    now = 10;
    reporter.on_heartbeat();
    EXPECT_DOUBLE_EQ(reports.back().position_seconds, 130);

    player.load(track("Y"), [this]{ player.play(); });
    // First report after the switch is the new song from the top.
    auto it = std::find_if(reports.begin(), reports.end(), [](const PlaybackSnapshot &s){ return s.song_id == "Y"; });
    ASSERT_NE(it, reports.end());
    EXPECT_DOUBLE_EQ(it->position_seconds, 0);
    EXPECT_EQ(reports.back().song_id, "Y");
    EXPECT_TRUE(reports.back().is_playing);
}

TEST_F(SnapshotReporterTest, ActivationMidSongReportsCurrentPosition) {
    player.load(track("X"), {});
    player.seek(60);
    player.pause();
    ASSERT_TRUE(reports.empty());

    reporter.set_active(true);
    reporter.on_playback_requested();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].song_id, "X");
    EXPECT_DOUBLE_EQ(reports[0].position_seconds, 60);
    EXPECT_FALSE(reports[0].is_playing);
}

TEST_F(SnapshotReporterTest, ReactivationForgetsEarlierSong) {
    reporter.set_active(true);
    player.load(track("X"), {});
    reporter.set_active(false);

    player.load(track("Y"), {});
    player.seek(45);
    reporter.set_active(true);
    reporter.on_playback_requested();
    EXPECT_EQ(reports.back().song_id, "Y");
    EXPECT_DOUBLE_EQ(reports.back().position_seconds, 45);
}

TEST_F(SnapshotReporterTest, RequestGetsImmediateReport) {
    reporter.set_active(true);
    player.load(track("X"), {});
    player.pause();
    reports.clear();
    reporter.on_playback_requested();
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].song_id, "X");
    EXPECT_FALSE(reports[0].is_playing);
}
