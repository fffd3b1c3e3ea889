#pragma once
#include "client/player.hpp"
#include "model/types.hpp"

// Master side of the playback protocol. Every trigger funnels into emit().
class SnapshotReporter {
public:
    using Sink = std::function<void(const PlaybackSnapshot &)>;

    SnapshotReporter(Player &player, Sink sink);

    // Only an active reporter (the local user is master) sends anything.
    void set_active(bool active);
    bool is_active() const;

    void on_player_event(PlayerEvent event);
    void on_heartbeat();
    void on_playback_requested();

    const std::optional<PlaybackSnapshot> &last_report() const;

private:
    void emit(bool track_changed = false);

    Player &m_player;
    Sink m_sink;
    bool m_active = false;
    std::optional<PlaybackSnapshot> m_last;
};
