/**
 * @file server/RoomManagerActor.h
 * @brief Single coordinator for room creation and index repair.
 *
 * @details
 * Every write to the `RoomIndex` goes through this actor, so there is at most
 * one load in flight per room id. Callers only get here when their own
 * `RoomIndex::findLive()` lookup missed (see `RoomDirectory`).
 *
 * `GetRoomRequest`:
 * 1. Re-check the index; a live entry is returned as is.
 * 2. Load the record from the `RoomStore`; failure replies `NotFound`.
 * 3. Spawn a `RoomActor` on this core, overwrite the index entry, reply `Ok`.
 *
 * `NewRoomRequest` replies `AlreadyExists` if a live room is indexed or the id
 * is loadable (the disk room is spawned as a side effect). Otherwise a default
 * room is spawned and indexed.
 *
 * At start the manager prunes dead index entries and preloads rooms.
 *
 * With a positive `reset_interval` the manager sends every live room a
 * `ResetRoomEvent` each `reset_interval` seconds, which puts taken reset
 * objects back.
 */

#pragma once

#include <qb/actor.h>
#include <memory>
#include <vector>
#include "../shared/ActorHandle.h"
#include "../shared/Events.h"
#include "RoomIndex.h"
#include "RoomStore.h"

namespace mud {

constexpr const char* DEFAULT_ROOM_TITLE = "A non-descript room";
constexpr const char* DEFAULT_ROOM_BRIEF = "This is a rather boring room, someone should fix that.";

class RoomManagerActor : public qb::Actor {
    std::shared_ptr<RoomIndex> _index;
    std::shared_ptr<const RoomStore> _store;
    std::vector<RoomId> _preload;
    double _reset_interval;
    std::shared_ptr<const Lifeline> _lifeline = std::make_shared<const Lifeline>();

    std::size_t _loads = 0;
    std::size_t _failures = 0;
    std::size_t _spawned = 0;

public:
    RoomManagerActor(std::shared_ptr<RoomIndex> index,
                     std::shared_ptr<const RoomStore> store,
                     std::vector<RoomId> preload = {},
                     double reset_interval = 0);

    bool onInit() override;

    void on(GetRoomRequest& request);
    void on(NewRoomRequest& request);
    void on(RoomStatsRequest& request);
    void on(qb::KillEvent& event);

private:
    /// Index lookup, then disk load. Never creates a default room.
    std::pair<RoomStatus, ActorHandle> resolve(const RoomId& id);
    ActorHandle loadAndSpawn(const RoomId& id);
    void scheduleReset();
    void resetRooms();
    void sendReply(const RefEvent& request, const RoomId& id, RoomStatus status, const ActorHandle& handle);
};

} // namespace mud
