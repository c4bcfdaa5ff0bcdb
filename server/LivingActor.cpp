/**
 * @file server/LivingActor.cpp
 * @brief Movement, object transfer and speech on behalf of one player.
 */

#include "LivingActor.h"

#include <algorithm>

namespace mud {

LivingActor::LivingActor(std::string name, ActorHandle user, qb::ActorId terminal, RoomId start_room,
                         WorldPtr world)
    : _name(std::move(name))
    , _user(std::move(user))
    , _terminal(terminal)
    , _start_room(std::move(start_room))
    , _world(std::move(world))
    , _rooms(*this, _world->rooms, _world->room_manager) {}

bool LivingActor::onInit() {
    registerEvent<LivingStateRequest>(*this);
    registerEvent<MoveLivingRequest>(*this);
    registerEvent<TakeObjectRequest>(*this);
    registerEvent<DropObjectRequest>(*this);
    registerEvent<SayRequest>(*this);
    registerEvent<RoomMessageEvent>(*this);
    registerEvent<RoomReply>(*this);
    registerEvent<EnterRoomReply>(*this);
    registerEvent<RoomTakeReply>(*this);
    registerEvent<RoomDropReply>(*this);
    registerEvent<RoomSayReply>(*this);

    placeIn(_start_room, _start_room != _world->config.start_room);
    return true;
}

void LivingActor::placeIn(const RoomId& room, bool fallback) {
    const auto placement = ++_placement;
    _rooms.getRoom(room, [this, room, fallback, placement](RoomStatus status, const ActorHandle& handle) {
        if (terminating() || placement != _placement)
            return;
        if (status != RoomStatus::Ok || !handle.alive()) {
            if (fallback) {
                placeIn(_world->config.start_room, false);
                return;
            }
            qb::io::cerr() << "[Living " << _name << "] no room to stand in ('" << room << "')" << std::endl;
            if (!_ready) {
                auto& ready = push<LivingReadyEvent>(_user.id());
                ready.ok = false;
                ready.room = room;
                ready.detail = "The world has nowhere to put you.";
            }
            terminate(ExitReason::Crashed, "no room");
            return;
        }

        enter(handle, [this](bool entered, const RoomView& view) {
            if (!entered)
                return;
            if (!_ready) {
                _ready = true;
                auto& ready = push<LivingReadyEvent>(_user.id());
                ready.ok = true;
                ready.room = view.id;
            }
            auto& moved = push<LivingMovedEvent>(_user.id());
            moved.room = view.id;
        });
    });
}

void LivingActor::enter(const ActorHandle& room, std::function<void(bool, const RoomView&)> callback) {
    const auto placement = ++_placement;
    _target = room.id();
    auto ref = _enters.expect([this, room, placement, callback = std::move(callback)](EnterRoomReply& reply) {
        if (terminating())
            return;
        if (placement != _placement) {
            // the room added us as an occupant, but we are headed elsewhere
            if (!(room.id() == _target)) {
                push<LeaveRoomEvent>(room.id());
                unlink(room.id());
            }
            callback(false, reply.view);
            return;
        }
        _room = room;
        _room_id = reply.view.id;
        callback(true, reply.view);
    });
    auto& request = push<EnterRoomRequest>(room.id());
    request.ref = ref;
    request.living = handle();
    request.name = _name;
}

void LivingActor::leaveCurrentRoom() {
    if (!_room.valid())
        return;
    push<LeaveRoomEvent>(_room.id());
    unlink(_room.id());
    _room = ActorHandle{};
}

void LivingActor::on(LivingStateRequest& request) {
    auto& reply = push<LivingStateReply>(request.getSource());
    reply.ref = request.ref;
    reply.state.current_room = _room_id;
    reply.state.inventory = _inventory;
    reply.state.display_name = _name;
}

void LivingActor::on(MoveLivingRequest& request) {
    const auto source = request.getSource();
    const auto ref = request.ref;

    if (!request.room.alive()) {
        auto& reply = push<MoveLivingReply>(source);
        reply.ref = ref;
        reply.moved = false;
        return;
    }
    if (request.room != _room)
        leaveCurrentRoom();

    enter(request.room, [this, source, ref](bool entered, const RoomView& view) {
        auto& reply = push<MoveLivingReply>(source);
        reply.ref = ref;
        reply.moved = entered;
        if (!entered)
            return;
        reply.view = view;

        auto& moved = push<LivingMovedEvent>(_user.id());
        moved.room = view.id;
    });
}

void LivingActor::on(TakeObjectRequest& request) {
    const auto source = request.getSource();
    const auto ref = request.ref;

    if (!_room.alive()) {
        auto& reply = push<ObjectTransferReply>(source);
        reply.ref = ref;
        reply.status = TransferStatus::NoRoom;
        return;
    }

    auto room_ref = _takes.expect([this, source, ref](RoomTakeReply& taken) {
        if (taken.status == TransferStatus::Ok)
            _inventory.push_back(taken.object);
        auto& reply = push<ObjectTransferReply>(source);
        reply.ref = ref;
        reply.status = taken.status;
        reply.object = taken.object;
    });
    auto& take = push<RoomTakeRequest>(_room.id());
    take.ref = room_ref;
    take.name = request.name;
}

void LivingActor::on(DropObjectRequest& request) {
    const auto source = request.getSource();
    const auto ref = request.ref;

    auto it = std::find_if(_inventory.begin(), _inventory.end(),
                           [&](const ObjectRecord& o) { return o.name == request.name; });
    if (it == _inventory.end() || !_room.alive()) {
        auto& reply = push<ObjectTransferReply>(source);
        reply.ref = ref;
        reply.status = it == _inventory.end() ? TransferStatus::NotFound : TransferStatus::NoRoom;
        return;
    }

    ObjectRecord object = *it;
    _inventory.erase(it);

    auto room_ref = _drops.expect([this, source, ref, object](RoomDropReply&) {
        auto& reply = push<ObjectTransferReply>(source);
        reply.ref = ref;
        reply.status = TransferStatus::Ok;
        reply.object = object;
    });
    auto& drop = push<RoomDropRequest>(_room.id());
    drop.ref = room_ref;
    drop.object = object;
}

void LivingActor::on(SayRequest& request) {
    const auto source = request.getSource();
    const auto ref = request.ref;

    if (!_room.alive()) {
        auto& reply = push<SayReply>(source);
        reply.ref = ref;
        return;
    }
    auto room_ref = _says.expect([this, source, ref](RoomSayReply&) {
        auto& reply = push<SayReply>(source);
        reply.ref = ref;
    });
    auto& say = push<RoomSayRequest>(_room.id());
    say.ref = room_ref;
    say.speaker = _name;
    say.text = request.text;
}

void LivingActor::on(RoomMessageEvent& event) {
    tell(event.text);
}

void LivingActor::onPeerDown(qb::ActorId peer, ExitReason reason, const std::string&) {
    if (!(peer == _room.id()))
        return;
    qb::io::cout() << "[Living " << _name << "] room " << _room_id << " went down (" << toString(reason)
                   << ")" << std::endl;
    _room = ActorHandle{};
    // pending replies from the dead room will never arrive
    _takes.clear();
    _drops.clear();
    _says.clear();
    if (reason == ExitReason::Shutdown)
        return;
    tell("The world flickers around you.");
    placeIn(_room_id, true);
}

void LivingActor::onTerminate(ExitReason reason) {
    if (reason == ExitReason::Normal)
        leaveCurrentRoom();
    qb::io::cout() << "[Living " << _name << "] terminating (" << toString(reason) << ")" << std::endl;
}

void LivingActor::tell(const std::string& text) {
    auto& out = push<TerminalOutputEvent>(_terminal);
    out.text = text;
}

} // namespace mud
