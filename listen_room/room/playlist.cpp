#include "playlist.hpp"
#include "errors.hpp"
#include <algorithm>
#include <format>

const PlaylistItem &Playlist::add(PlaylistItem item){
    if(item.song_id.empty()){
        throw RoomError(ErrorCode::ValidationError, "song id is empty");
    }
    if(find(item.song_id)){
        throw RoomError(ErrorCode::ValidationError, std::format("song {} is already in the playlist", item.song_id));
    }
    item.position = static_cast<int>(m_items.size());
    return m_items.emplace_back(std::move(item));
}

PlaylistItem Playlist::remove(int position){
    check_index(position, "remove");
    auto it = m_items.begin() + position;
    PlaylistItem removed = std::move(*it);
    m_items.erase(it);
    renumber(position, m_items.size());
    return removed;
}

void Playlist::reorder(int from, int to){
    check_index(from, "move from");
    check_index(to, "move to");
    if(from == to) return;
    auto first = m_items.begin();
    if(from < to){
        std::rotate(first + from, first + from + 1, first + to + 1);
        renumber(from, to + 1);
    } else {
        std::rotate(first + to, first + from, first + from + 1);
        renumber(to, from + 1);
    }
}

std::optional<PlaylistItem> Playlist::find(const std::string &song_id) const {
    auto it = std::find_if(m_items.begin(), m_items.end(),
        [&](const PlaylistItem &item){ return item.song_id == song_id; });
    if(it == m_items.end()) return std::nullopt;
    return *it;
}

std::optional<PlaylistItem> Playlist::next_after(const std::string &song_id) const {
    if(m_items.empty()) return std::nullopt;
    auto current = find(song_id);
    if(!current) return m_items.front();
    if(current->position + 1 >= static_cast<int>(m_items.size())) return std::nullopt;
    return m_items[current->position + 1];
}

std::optional<PlaylistItem> Playlist::prev_before(const std::string &song_id) const {
    if(m_items.empty()) return std::nullopt;
    auto current = find(song_id);
    if(!current) return m_items.front();
    if(current->position == 0) return std::nullopt;
    return m_items[current->position - 1];
}

void Playlist::check_index(int position, const char *what) const {
    if(position < 0 || position >= static_cast<int>(m_items.size())){
        throw RoomError(ErrorCode::OutOfRange,
            std::format("{}: position {} outside [0, {})", what, position, m_items.size()));
    }
}

void Playlist::renumber(std::size_t first, std::size_t last){
    for(auto i = first; i < last; ++i){
        m_items[i].position = static_cast<int>(i);
    }
}
