/**
 * @file server/RoomManagerActor.cpp
 * @brief Serialized room loading, creation and index repair.
 */

#include "RoomManagerActor.h"
#include "RoomActor.h"

#include <qb/io/async.h>

namespace mud {

RoomManagerActor::RoomManagerActor(std::shared_ptr<RoomIndex> index,
                                   std::shared_ptr<const RoomStore> store,
                                   std::vector<RoomId> preload,
                                   double reset_interval)
    : _index(std::move(index))
    , _store(std::move(store))
    , _preload(std::move(preload))
    , _reset_interval(reset_interval) {}

bool RoomManagerActor::onInit() {
    if (!_index || !_store) {
        qb::io::cerr() << "[RoomManager] missing room index or store" << std::endl;
        return false;
    }

    registerEvent<GetRoomRequest>(*this);
    registerEvent<NewRoomRequest>(*this);
    registerEvent<RoomStatsRequest>(*this);
    registerEvent<qb::KillEvent>(*this);

    const auto pruned = _index->prune();
    qb::io::cout() << "[RoomManager] initialized with ID " << id() << " on core " << id().index()
                   << ", adopted " << _index->size() << " room(s), pruned " << pruned << std::endl;

    for (const auto& room : _preload) {
        auto result = resolve(room);
        if (result.first != RoomStatus::Ok)
            qb::io::cerr() << "[RoomManager] could not preload room '" << room << "'" << std::endl;
    }
    if (_reset_interval > 0)
        scheduleReset();
    return true;
}

void RoomManagerActor::on(GetRoomRequest& request) {
    auto result = resolve(request.room);
    sendReply(request, request.room, result.first, result.second);
}

void RoomManagerActor::on(NewRoomRequest& request) {
    const auto& room = request.room;
    if (!isValidRoomId(room)) {
        sendReply(request, room, RoomStatus::NotFound, ActorHandle{});
        return;
    }
    if (auto live = _index->findLive(room)) {
        sendReply(request, room, RoomStatus::AlreadyExists, *live);
        return;
    }
    if (auto handle = loadAndSpawn(room); handle.valid()) {
        sendReply(request, room, RoomStatus::AlreadyExists, handle);
        return;
    }

    auto actor = addRefActor<RoomActor>(room, DEFAULT_ROOM_TITLE, DEFAULT_ROOM_BRIEF);
    if (!actor) {
        qb::io::cerr() << "[RoomManager] failed to start room '" << room << "'" << std::endl;
        sendReply(request, room, RoomStatus::NotFound, ActorHandle{});
        return;
    }
    ++_spawned;
    auto handle = actor->handle();
    _index->put(room, handle);
    qb::io::cout() << "[RoomManager] created room '" << room << "'" << std::endl;
    sendReply(request, room, RoomStatus::Ok, handle);
}

void RoomManagerActor::on(RoomStatsRequest& request) {
    auto& stats = push<RoomStatsReply>(request.getSource());
    stats.ref = request.ref;
    stats.loads = _loads;
    stats.failures = _failures;
    stats.spawned = _spawned;
    stats.indexed = _index->size();
}

void RoomManagerActor::on(qb::KillEvent&) {
    qb::io::cout() << "[RoomManager] shutting down, " << _spawned << " room(s) spawned" << std::endl;
    _lifeline.reset();
    kill();
}

std::pair<RoomStatus, ActorHandle> RoomManagerActor::resolve(const RoomId& id) {
    if (!isValidRoomId(id))
        return {RoomStatus::NotFound, ActorHandle{}};

    // another request may have repaired the entry since the caller looked
    if (auto live = _index->findLive(id))
        return {RoomStatus::Ok, *live};

    auto handle = loadAndSpawn(id);
    if (!handle.valid())
        return {RoomStatus::NotFound, ActorHandle{}};
    return {RoomStatus::Ok, handle};
}

ActorHandle RoomManagerActor::loadAndSpawn(const RoomId& id) {
    ++_loads;
    auto record = _store->load(id);
    if (!record) {
        ++_failures;
        return ActorHandle{};
    }

    auto actor = addRefActor<RoomActor>(*record);
    if (!actor) {
        ++_failures;
        qb::io::cerr() << "[RoomManager] failed to start room '" << id << "'" << std::endl;
        return ActorHandle{};
    }
    ++_spawned;
    auto handle = actor->handle();
    _index->put(id, handle);
    return handle;
}

void RoomManagerActor::scheduleReset() {
    std::weak_ptr<const Lifeline> alive = _lifeline;
    qb::io::async::callback([this, alive]() {
        if (alive.expired())
            return;
        resetRooms();
        scheduleReset();
    }, _reset_interval);
}

void RoomManagerActor::resetRooms() {
    std::size_t reset = 0;
    for (const auto& room : _index->ids()) {
        if (auto live = _index->findLive(room)) {
            push<ResetRoomEvent>(live->id());
            ++reset;
        }
    }
    qb::io::cout() << "[RoomManager] reset tick, " << reset << " room(s)" << std::endl;
}

void RoomManagerActor::sendReply(const RefEvent& request, const RoomId& id, RoomStatus status,
                                 const ActorHandle& handle) {
    auto& out = push<RoomReply>(request.getSource());
    out.ref = request.ref;
    out.room = id;
    out.status = status;
    out.handle = handle;
}

} // namespace mud
