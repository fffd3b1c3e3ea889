#include "client/follower_sync.hpp"
#include <cmath>
#include <stdexcept>

FollowerSync::FollowerSync(Player &player, double drift_threshold)
    : m_player(player), m_drift_threshold(drift_threshold){
    if(!(drift_threshold > 0)){
        throw std::invalid_argument("drift threshold must be positive");
    }
}

void FollowerSync::set_following(bool following){
    m_following = following;
    if(!following){
        m_state = SyncState::Idle;
        m_loading_song.reset();
        m_target.reset();
        ++m_generation;
    }
}

void FollowerSync::set_owner(bool owner){
    m_owner = owner;
    if(owner){
        set_following(false);
    }
}

SyncState FollowerSync::state() const {
    return m_state;
}

double FollowerSync::drift_threshold() const {
    return m_drift_threshold;
}

void FollowerSync::apply(const PlaybackSnapshot &snapshot){
    if(m_owner || !m_following || snapshot.song_id.empty()) return;

    if(m_loading_song){
        m_target = snapshot;
        if(*m_loading_song != snapshot.song_id){
            start_load(snapshot);
        }
        return;
    }
    auto track = m_player.current_track();
    if(!track || track->song_id != snapshot.song_id){
        m_target = snapshot;
        start_load(snapshot);
        return;
    }
    align(snapshot);
}

void FollowerSync::start_load(const PlaybackSnapshot &snapshot){
    m_state = SyncState::Syncing;
    m_loading_song = snapshot.song_id;
    auto generation = ++m_generation;
    Track track{
        .song_id = snapshot.song_id,
        .name = snapshot.song_name,
        .artist = snapshot.artist,
        .cover = snapshot.cover,
        .hls_url = snapshot.hls_url,
        .duration_ms = snapshot.duration_ms,
    };
    m_player.load(track, [this, generation]{ on_loaded(generation); });
}

void FollowerSync::on_loaded(std::uint64_t generation){
    // Superseded by a newer load or by leaving listen mode.
    if(generation != m_generation || !m_target) return;
    m_loading_song.reset();
    auto target = *m_target;
    m_player.seek(target.position_seconds);
    if(target.is_playing) m_player.play();
    else m_player.pause();
    m_state = SyncState::Synced;
}

void FollowerSync::align(const PlaybackSnapshot &snapshot){
    m_state = SyncState::Syncing;
    if(snapshot.is_playing && !m_player.is_playing()){
        m_player.play();
    } else if(!snapshot.is_playing && m_player.is_playing()){
        m_player.pause();
    }
    if(std::abs(m_player.position() - snapshot.position_seconds) > m_drift_threshold){
        m_player.seek(snapshot.position_seconds);
    }
    m_state = SyncState::Synced;
}
