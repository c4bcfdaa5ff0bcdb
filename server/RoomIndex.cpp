/**
 * @file server/RoomIndex.cpp
 * @brief Locking for the shared room index.
 */

#include "RoomIndex.h"
#include <algorithm>
#include <mutex>

namespace mud {

std::optional<ActorHandle> RoomIndex::findLive(const RoomId& id) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _entries.find(id);
    if (it == _entries.end() || !it->second.alive())
        return std::nullopt;
    return it->second;
}

void RoomIndex::put(const RoomId& id, const ActorHandle& handle) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _entries[id] = handle;
}

std::size_t RoomIndex::prune() {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    std::size_t removed = 0;
    for (auto it = _entries.begin(); it != _entries.end();) {
        if (!it->second.alive()) {
            it = _entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t RoomIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _entries.size();
}

std::vector<RoomId> RoomIndex::ids() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    std::vector<RoomId> result;
    result.reserve(_entries.size());
    for (const auto& entry : _entries)
        result.push_back(entry.first);
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace mud
