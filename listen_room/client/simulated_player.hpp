#pragma once
#include "client/player.hpp"
#include <vector>

// Player without audio output. Position follows the supplied clock while playing.
// With deferred loads, completions wait for finish_loads().
class SimulatedPlayer : public Player {
public:
    using Clock = std::function<double()>;

    explicit SimulatedPlayer(Clock clock = steady_seconds, bool deferred_loads = false);

    std::optional<Track> current_track() const override;
    double position() const override;
    bool is_playing() const override;

    void load(const Track &track, std::function<void()> on_loaded) override;
    void seek(double seconds) override;
    void play() override;
    void pause() override;
    void update() override;

    void finish_loads();
    std::size_t pending_loads() const;
    int seek_count() const;

    static double steady_seconds();

private:
    double clamp(double seconds) const;

    Clock m_clock;
    bool m_deferred;
    std::optional<Track> m_track;
    bool m_playing = false;
    double m_base_position{};
    double m_base_time{};
    int m_seeks{};
    std::vector<std::pair<Track, std::function<void()>>> m_pending;
};
