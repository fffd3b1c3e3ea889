#include "client/simulated_player.hpp"
#include <algorithm>
#include <chrono>

double SimulatedPlayer::steady_seconds(){
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

SimulatedPlayer::SimulatedPlayer(Clock clock, bool deferred_loads)
    : m_clock(std::move(clock)), m_deferred(deferred_loads){
}

std::optional<Track> SimulatedPlayer::current_track() const {
    return m_track;
}

double SimulatedPlayer::clamp(double seconds) const {
    seconds = std::max(seconds, 0.0);
    if(m_track && m_track->duration_ms > 0){
        seconds = std::min(seconds, m_track->duration_ms / 1000.0);
    }
    return seconds;
}

double SimulatedPlayer::position() const {
    if(!m_playing) return m_base_position;
    return clamp(m_base_position + (m_clock() - m_base_time));
}

bool SimulatedPlayer::is_playing() const {
    return m_playing;
}

void SimulatedPlayer::load(const Track &track, std::function<void()> on_loaded){
    m_pending.emplace_back(track, std::move(on_loaded));
    if(!m_deferred){
        finish_loads();
    }
}

void SimulatedPlayer::finish_loads(){
    auto pending = std::move(m_pending);
    m_pending.clear();
    for(auto &[track, on_loaded] : pending){
        m_track = track;
        m_playing = false;
        m_base_position = 0;
        emit(PlayerEvent::TrackChanged);
        if(on_loaded) on_loaded();
    }
}

std::size_t SimulatedPlayer::pending_loads() const {
    return m_pending.size();
}

int SimulatedPlayer::seek_count() const {
    return m_seeks;
}

void SimulatedPlayer::seek(double seconds){
    if(!m_track) return;
    m_base_position = clamp(seconds);
    m_base_time = m_clock();
    ++m_seeks;
    emit(PlayerEvent::Seeked);
}

void SimulatedPlayer::play(){
    if(!m_track || m_playing) return;
    m_base_time = m_clock();
    m_playing = true;
    emit(PlayerEvent::Started);
}

void SimulatedPlayer::pause(){
    if(!m_playing) return;
    m_base_position = position();
    m_playing = false;
    emit(PlayerEvent::Paused);
}

void SimulatedPlayer::update(){
    if(!m_playing || !m_track || m_track->duration_ms <= 0) return;
    if(position() >= m_track->duration_ms / 1000.0){
        m_base_position = m_track->duration_ms / 1000.0;
        m_playing = false;
        emit(PlayerEvent::Ended);
    }
}
