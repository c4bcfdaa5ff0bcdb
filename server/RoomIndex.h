/**
 * @file server/RoomIndex.h
 * @brief Shared room-id -> room-handle cache.
 *
 * @details
 * The index is readable from every core. Only the room manager writes to it;
 * everybody else calls `findLive()`, which re-validates the cached handle
 * with a liveness check before returning it. A dead entry is never handed
 * out: callers fall back to a request to the manager, which repairs it.
 *
 * Readers take a shared lock, the manager takes an exclusive one.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "../shared/ActorHandle.h"
#include "../shared/Types.h"

namespace mud {

class RoomIndex {
    mutable std::shared_mutex _mutex;
    std::unordered_map<RoomId, ActorHandle> _entries;

public:
    /// Lookup that only returns handles whose room is still running.
    std::optional<ActorHandle> findLive(const RoomId& id) const;

    /// Inserts or overwrites the entry for @p id.
    void put(const RoomId& id, const ActorHandle& handle);

    /// Removes entries whose room has terminated; returns how many.
    std::size_t prune();

    std::size_t size() const;
    /// Sorted ids of every entry, dead ones included.
    std::vector<RoomId> ids() const;
};

} // namespace mud
