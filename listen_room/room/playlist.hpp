#pragma once
#include "model/types.hpp"
#include <optional>
#include <vector>

// Ordered song list of one room. Positions are always 0..size()-1.
class Playlist {
public:
    const PlaylistItem &add(PlaylistItem item);
    PlaylistItem remove(int position);
    void reorder(int from, int to);

    const std::vector<PlaylistItem> &items() const { return m_items; }
    std::size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }

    std::optional<PlaylistItem> find(const std::string &song_id) const;
    std::optional<PlaylistItem> next_after(const std::string &song_id) const;
    std::optional<PlaylistItem> prev_before(const std::string &song_id) const;
private:
    void check_index(int position, const char *what) const;
    void renumber(std::size_t first, std::size_t last);

    std::vector<PlaylistItem> m_items;
};
