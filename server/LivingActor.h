/**
 * @file server/LivingActor.h
 * @brief In-game body of a player: location and inventory.
 *
 * @details
 * Spawned by its `UserActor` and linked to it. On start the living looks up
 * its first room through the `RoomDirectory`, enters it and reports
 * `LivingReadyEvent` to the user. Every later change of room is reported as
 * `LivingMovedEvent`, which is how the user knows where to respawn it.
 *
 * Rooms and livings absorb each other's exit. When the current room crashes
 * the living looks the room up again, which loads a fresh instance, and falls
 * back to the start room if that fails.
 *
 * Only the latest placement counts: a move issued while a re-placement is
 * still in flight supersedes it. A room that answers a superseded enter is
 * left again, so a living is an occupant of one room at most.
 */

#pragma once

#include <string>
#include <vector>
#include "../shared/Events.h"
#include "LinkedActor.h"
#include "PendingReplies.h"
#include "RoomDirectory.h"
#include "World.h"

namespace mud {

class LivingActor : public LinkedActor {
    std::string _name;
    ActorHandle _user;
    qb::ActorId _terminal;
    RoomId _start_room;
    WorldPtr _world;
    RoomDirectory _rooms;

    RoomId _room_id;
    ActorHandle _room;
    std::vector<ObjectRecord> _inventory;
    bool _ready = false;
    uint64_t _placement = 0;
    qb::ActorId _target;

    PendingReplies<EnterRoomReply> _enters;
    PendingReplies<RoomTakeReply> _takes;
    PendingReplies<RoomDropReply> _drops;
    PendingReplies<RoomSayReply> _says;

public:
    LivingActor(std::string name, ActorHandle user, qb::ActorId terminal, RoomId start_room, WorldPtr world);

    bool onInit() override;

    void on(LivingStateRequest& request);
    void on(MoveLivingRequest& request);
    void on(TakeObjectRequest& request);
    void on(DropObjectRequest& request);
    void on(SayRequest& request);
    void on(RoomMessageEvent& event);

    void on(RoomReply& reply) { _rooms.on(reply); }
    void on(EnterRoomReply& reply) { _enters.resolve(reply); }
    void on(RoomTakeReply& reply) { _takes.resolve(reply); }
    void on(RoomDropReply& reply) { _drops.resolve(reply); }
    void on(RoomSayReply& reply) { _says.resolve(reply); }

protected:
    void onPeerDown(qb::ActorId peer, ExitReason reason, const std::string& detail) override;
    void onTerminate(ExitReason reason) override;

private:
    /// Looks @p room up and enters it; falls back to the start room once.
    void placeIn(const RoomId& room, bool fallback);
    /// @p callback gets false when a later placement superseded this one.
    void enter(const ActorHandle& room, std::function<void(bool, const RoomView&)> callback);
    void leaveCurrentRoom();
    void tell(const std::string& text);
};

} // namespace mud
