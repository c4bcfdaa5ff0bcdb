/**
 * @file server/RoomDirectory.cpp
 * @brief Index-first room lookups with the manager as fallback.
 */

#include "RoomDirectory.h"

namespace mud {

RoomDirectory::RoomDirectory(qb::Actor& owner, std::shared_ptr<const RoomIndex> index, qb::ActorId manager)
    : _owner(owner), _index(std::move(index)), _manager(manager) {}

void RoomDirectory::getRoom(const RoomId& id, Callback callback) {
    if (!isValidRoomId(id)) {
        callback(RoomStatus::NotFound, ActorHandle{});
        return;
    }
    if (auto cached = _index->findLive(id)) {
        callback(RoomStatus::Ok, *cached);
        return;
    }

    auto ref = _pending.expect([callback = std::move(callback)](RoomReply& reply) {
        callback(reply.status, reply.handle);
    });
    auto& request = _owner.push<GetRoomRequest>(_manager);
    request.ref = ref;
    request.room = id;
}

void RoomDirectory::newRoom(const RoomId& id, Callback callback) {
    if (!isValidRoomId(id)) {
        callback(RoomStatus::NotFound, ActorHandle{});
        return;
    }

    auto ref = _pending.expect([callback = std::move(callback)](RoomReply& reply) {
        callback(reply.status, reply.handle);
    });
    auto& request = _owner.push<NewRoomRequest>(_manager);
    request.ref = ref;
    request.room = id;
}

bool RoomDirectory::on(RoomReply& reply) {
    return _pending.resolve(reply);
}

} // namespace mud
