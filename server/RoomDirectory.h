/**
 * @file server/RoomDirectory.h
 * @brief Room lookups from inside any actor.
 *
 * @details
 * `getRoom()` first consults the shared `RoomIndex`. A cached handle whose room
 * is still alive is returned synchronously, without involving the room
 * manager. Missing or dead entries turn into a `GetRoomRequest` to the
 * manager; the reply is routed back through `on(RoomReply&)`, which the
 * owning actor must forward to.
 *
 * `newRoom()` always goes through the manager, since creation must be
 * serialized.
 */

#pragma once

#include <qb/actor.h>
#include <functional>
#include <memory>
#include "../shared/Events.h"
#include "PendingReplies.h"
#include "RoomIndex.h"

namespace mud {

class RoomDirectory {
public:
    using Callback = std::function<void(RoomStatus, const ActorHandle&)>;

private:
    qb::Actor& _owner;
    std::shared_ptr<const RoomIndex> _index;
    qb::ActorId _manager;
    PendingReplies<RoomReply> _pending;

public:
    RoomDirectory(qb::Actor& owner, std::shared_ptr<const RoomIndex> index, qb::ActorId manager);

    void getRoom(const RoomId& id, Callback callback);
    void newRoom(const RoomId& id, Callback callback);

    /// @return false if the reply was not for this directory
    bool on(RoomReply& reply);

};

} // namespace mud
