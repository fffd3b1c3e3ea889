#include "client/snapshot_reporter.hpp"

SnapshotReporter::SnapshotReporter(Player &player, Sink sink)
    : m_player(player), m_sink(std::move(sink)){
}

void SnapshotReporter::set_active(bool active){
    if(m_active != active){
        m_last.reset();
    }
    m_active = active;
}

bool SnapshotReporter::is_active() const {
    return m_active;
}

void SnapshotReporter::on_player_event(PlayerEvent event){
    switch(event){
    case PlayerEvent::TrackChanged:
        emit(true);
        break;
    case PlayerEvent::Started:
    case PlayerEvent::Paused:
    case PlayerEvent::Seeked:
    case PlayerEvent::Ended:
        emit();
        break;
    }
}

void SnapshotReporter::on_heartbeat(){
    if(m_player.is_playing()){
        emit();
    }
}

void SnapshotReporter::on_playback_requested(){
    emit();
}

const std::optional<PlaybackSnapshot> &SnapshotReporter::last_report() const {
    return m_last;
}

void SnapshotReporter::emit(bool track_changed){
    if(!m_active) return;
    auto track = m_player.current_track();
    if(!track) return;
    PlaybackSnapshot snapshot{
        .song_id = track->song_id,
        .song_name = track->name,
        .artist = track->artist,
        .cover = track->cover,
        .duration_ms = track->duration_ms,
        .position_seconds = m_player.position(),
        .is_playing = m_player.is_playing(),
        .hls_url = track->hls_url,
    };
    // A song switched to while reporting starts from the top for followers.
    // The first report of a reporting period carries the real position.
    if(track_changed || (m_last && m_last->song_id != snapshot.song_id)){
        snapshot.position_seconds = 0;
    }
    m_last = snapshot;
    m_sink(snapshot);
}
