#pragma once
#include "client/player.hpp"
#include "model/types.hpp"

enum class SyncState { Idle, Syncing, Synced };

// Drives the local player toward the master's snapshots.
class FollowerSync {
public:
    static constexpr double default_drift_threshold = 2.0;

    explicit FollowerSync(Player &player, double drift_threshold = default_drift_threshold);

    // Entering listen mode starts following; leaving it returns to Idle.
    void set_following(bool following);
    // The owner never reconciles against snapshots.
    void set_owner(bool owner);

    void apply(const PlaybackSnapshot &snapshot);

    SyncState state() const;
    double drift_threshold() const;

private:
    void start_load(const PlaybackSnapshot &snapshot);
    void on_loaded(std::uint64_t generation);
    void align(const PlaybackSnapshot &snapshot);

    Player &m_player;
    double m_drift_threshold;
    bool m_following = false;
    bool m_owner = false;
    SyncState m_state = SyncState::Idle;
    std::uint64_t m_generation{};
    std::optional<std::string> m_loading_song;
    std::optional<PlaybackSnapshot> m_target;
};
