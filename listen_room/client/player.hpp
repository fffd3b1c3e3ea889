#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct Track {
    std::string song_id;
    std::string name;
    std::string artist;
    std::string cover;
    std::string hls_url;
    std::int64_t duration_ms{};
};

enum class PlayerEvent { Started, Paused, Seeked, TrackChanged, Ended };

// Local audio output. Followers only ever command their own player.
class Player {
public:
    using EventHandler = std::function<void(PlayerEvent)>;

    virtual ~Player() = default;

    virtual std::optional<Track> current_track() const = 0;
    virtual double position() const = 0;
    virtual bool is_playing() const = 0;

    // on_loaded runs once the track is ready; the player is paused at 0 by then.
    virtual void load(const Track &track, std::function<void()> on_loaded) = 0;
    virtual void seek(double seconds) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    // Lets clock driven players notice the end of a track.
    virtual void update() {}

    void on_event(EventHandler handler) { m_on_event = std::move(handler); }

protected:
    void emit(PlayerEvent event) {
        if(m_on_event) m_on_event(event);
    }

private:
    EventHandler m_on_event;
};
