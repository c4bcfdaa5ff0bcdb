/**
 * @file server/RoomActor.h
 * @brief One running room: exits, objects and the livings standing in it.
 *
 * @details
 * A `RoomActor` is created by the `RoomManagerActor` from a `RoomRecord` and
 * runs until it crashes or the engine shuts down. Its mutable state (who is
 * here, what was dropped) lives only in the actor and is lost when it dies;
 * the next lookup re-reads the room file.
 *
 * Occupants are linked with `LinkPolicy::Absorb` on both sides: a living that
 * dies is removed from the occupant list and the remaining occupants are
 * told, while the room keeps running. Likewise a living survives its room
 * crashing and re-enters a fresh instance.
 *
 * A living that terminates while the room's `LinkEvent` is still on its way
 * never sends the room a `DownEvent`. Occupants are therefore re-checked
 * through their handles before the room shows or tells them anything.
 */

#pragma once

#include <string>
#include <vector>
#include "../shared/RoomRecord.h"
#include "LinkedActor.h"

namespace mud {

class RoomActor : public LinkedActor {
public:
    struct Occupant {
        ActorHandle living;
        std::string name;
    };

private:
    RoomId _id;
    std::string _title;
    std::string _brief;
    std::optional<std::string> _long;
    std::vector<Exit> _exits;
    std::vector<ObjectRecord> _objects;
    std::vector<ResetSpec> _resets;
    std::vector<Occupant> _occupants;

public:
    explicit RoomActor(const RoomRecord& record);
    RoomActor(RoomId id, std::string title, std::string brief);

    bool onInit() override;

    /// Adds an exit, replacing any existing exit in the same direction.
    void addExit(const Exit& exit);
    void addObject(const ObjectRecord& object);
    /// Records the reset and instantiates its objects.
    void addReset(const ResetSpec& reset);
    void setLong(std::optional<std::string> text);
    void reset();

    const RoomId& name() const { return _id; }
    RoomView view(qb::ActorId viewer = qb::ActorId{}) const;

    void on(AddExitEvent& evt);
    void on(AddObjectEvent& evt);
    void on(AddResetEvent& evt);
    void on(SetLongEvent& evt);
    void on(ResetRoomEvent& evt);
    void on(EnterRoomRequest& evt);
    void on(LeaveRoomEvent& evt);
    void on(DescribeRoomRequest& evt);
    void on(RoomNameRequest& evt);
    void on(RoomTakeRequest& evt);
    void on(RoomDropRequest& evt);
    void on(RoomSayRequest& evt);

protected:
    void onPeerDown(qb::ActorId peer, ExitReason reason, const std::string& detail) override;
    void onTerminate(ExitReason reason) override;

private:
    std::vector<Occupant>::iterator findOccupant(qb::ActorId living);
    void dropDeadOccupants();
    /// Sends @p text to every occupant except @p except.
    void announce(const std::string& text, qb::ActorId except = qb::ActorId{});
};

} // namespace mud
