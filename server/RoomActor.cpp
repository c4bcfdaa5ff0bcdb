/**
 * @file server/RoomActor.cpp
 * @brief Room state, object transfer and occupant bookkeeping.
 */

#include "RoomActor.h"

#include <algorithm>

namespace mud {

RoomActor::RoomActor(const RoomRecord& record)
    : _id(record.id)
    , _title(record.title)
    , _brief(record.brief)
    , _long(record.long_description)
    , _exits(record.exits)
    , _objects(record.objects)
    , _resets(record.resets) {}

RoomActor::RoomActor(RoomId id, std::string title, std::string brief)
    : _id(std::move(id)), _title(std::move(title)), _brief(std::move(brief)) {}

bool RoomActor::onInit() {
    registerEvent<AddExitEvent>(*this);
    registerEvent<AddObjectEvent>(*this);
    registerEvent<AddResetEvent>(*this);
    registerEvent<SetLongEvent>(*this);
    registerEvent<ResetRoomEvent>(*this);
    registerEvent<EnterRoomRequest>(*this);
    registerEvent<LeaveRoomEvent>(*this);
    registerEvent<DescribeRoomRequest>(*this);
    registerEvent<RoomNameRequest>(*this);
    registerEvent<RoomTakeRequest>(*this);
    registerEvent<RoomDropRequest>(*this);
    registerEvent<RoomSayRequest>(*this);

    qb::io::cout() << "[Room " << _id << "] up with ID " << id() << ", " << _exits.size() << " exit(s), "
                   << _objects.size() << " object(s)" << std::endl;
    return true;
}

void RoomActor::addExit(const Exit& exit) {
    auto it = std::find_if(_exits.begin(), _exits.end(),
                           [&](const Exit& e) { return e.direction == exit.direction; });
    if (it != _exits.end())
        it->destination = exit.destination;
    else
        _exits.push_back(exit);
}

void RoomActor::addObject(const ObjectRecord& object) {
    _objects.push_back(object);
}

void RoomActor::addReset(const ResetSpec& reset) {
    if (reset.count > MAX_RESET_COUNT) {
        qb::io::cerr() << "[Room " << _id << "] refusing reset of " << reset.count << " " << reset.name << std::endl;
        return;
    }
    _resets.push_back(reset);
    for (auto& object : loadObjects({reset}))
        _objects.push_back(std::move(object));
}

void RoomActor::setLong(std::optional<std::string> text) {
    _long = std::move(text);
}

void RoomActor::reset() {
    for (const auto& spec : _resets) {
        if (spec.name.empty() || spec.count <= 0)
            continue;
        auto present = std::count_if(_objects.begin(), _objects.end(),
                                     [&](const ObjectRecord& o) { return o.name == spec.name; });
        for (auto i = present; i < spec.count; ++i)
            _objects.push_back(ObjectRecord{spec.name, spec.description, spec.attached});
    }
}

RoomView RoomActor::view(qb::ActorId viewer) const {
    RoomView v;
    v.id = _id;
    v.title = _title;
    v.brief = _brief;
    v.long_description = _long;
    v.exits = _exits;
    v.objects = _objects;
    for (const auto& occupant : _occupants) {
        if (!(occupant.living.id() == viewer))
            v.occupants.push_back(occupant.name);
    }
    return v;
}

void RoomActor::on(AddExitEvent& evt) {
    addExit(evt.exit);
}

void RoomActor::on(AddObjectEvent& evt) {
    addObject(evt.object);
}

void RoomActor::on(AddResetEvent& evt) {
    addReset(evt.reset);
}

void RoomActor::on(SetLongEvent& evt) {
    setLong(evt.text);
}

void RoomActor::on(ResetRoomEvent&) {
    reset();
}

void RoomActor::on(EnterRoomRequest& evt) {
    dropDeadOccupants();
    const auto living = evt.living.id();
    if (findOccupant(living) == _occupants.end()) {
        _occupants.push_back(Occupant{evt.living, evt.name});
        link(evt.living, LinkPolicy::Absorb, LinkPolicy::Absorb);
        announce(evt.name + " arrives.", living);
    }

    auto& reply = push<EnterRoomReply>(evt.getSource());
    reply.ref = evt.ref;
    reply.view = view(living);
}

void RoomActor::on(LeaveRoomEvent& evt) {
    auto it = findOccupant(evt.getSource());
    if (it == _occupants.end())
        return;
    const auto name = it->name;
    _occupants.erase(it);
    unlink(evt.getSource());
    announce(name + " leaves.");
}

void RoomActor::on(DescribeRoomRequest& evt) {
    dropDeadOccupants();
    auto& reply = push<DescribeRoomReply>(evt.getSource());
    reply.ref = evt.ref;
    reply.view = view(evt.getSource());
}

void RoomActor::on(RoomNameRequest& evt) {
    auto& reply = push<RoomNameReply>(evt.getSource());
    reply.ref = evt.ref;
    reply.name = _id;
}

void RoomActor::on(RoomTakeRequest& evt) {
    auto& reply = push<RoomTakeReply>(evt.getSource());
    reply.ref = evt.ref;

    auto it = std::find_if(_objects.begin(), _objects.end(),
                           [&](const ObjectRecord& o) { return o.name == evt.name; });
    if (it == _objects.end()) {
        reply.status = TransferStatus::NotFound;
        return;
    }
    reply.object = *it;
    if (it->attached) {
        reply.status = TransferStatus::Attached;
        return;
    }
    _objects.erase(it);
    reply.status = TransferStatus::Ok;
}

void RoomActor::on(RoomDropRequest& evt) {
    _objects.push_back(evt.object);
    auto& reply = push<RoomDropReply>(evt.getSource());
    reply.ref = evt.ref;
}

void RoomActor::on(RoomSayRequest& evt) {
    dropDeadOccupants();
    announce(evt.speaker + " says: " + evt.text, evt.getSource());
    auto& reply = push<RoomSayReply>(evt.getSource());
    reply.ref = evt.ref;
}

void RoomActor::onPeerDown(qb::ActorId peer, ExitReason reason, const std::string&) {
    auto it = findOccupant(peer);
    if (it == _occupants.end())
        return;
    const auto name = it->name;
    _occupants.erase(it);
    qb::io::cout() << "[Room " << _id << "] occupant " << name << " went down (" << toString(reason) << ")"
                   << std::endl;
    announce(name + " disappears.");
}

void RoomActor::onTerminate(ExitReason reason) {
    qb::io::cout() << "[Room " << _id << "] terminating (" << toString(reason) << ")" << std::endl;
}

std::vector<RoomActor::Occupant>::iterator RoomActor::findOccupant(qb::ActorId living) {
    return std::find_if(_occupants.begin(), _occupants.end(),
                        [&](const Occupant& o) { return o.living.id() == living; });
}

void RoomActor::dropDeadOccupants() {
    pruneDeadLinks();
    std::vector<std::string> gone;
    for (auto it = _occupants.begin(); it != _occupants.end();) {
        if (it->living.alive()) {
            ++it;
            continue;
        }
        gone.push_back(it->name);
        it = _occupants.erase(it);
    }
    for (const auto& name : gone) {
        qb::io::cout() << "[Room " << _id << "] occupant " << name << " is gone" << std::endl;
        announce(name + " disappears.");
    }
}

void RoomActor::announce(const std::string& text, qb::ActorId except) {
    for (const auto& occupant : _occupants) {
        if (occupant.living.id() == except)
            continue;
        auto& msg = push<RoomMessageEvent>(occupant.living.id());
        msg.text = text;
    }
}

} // namespace mud
