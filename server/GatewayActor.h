/**
 * @file server/GatewayActor.h
 * @brief Turns accepted sockets into `ConnectionActor`s on its core.
 *
 * @details
 * The `AcceptActor` spreads new sockets over the gateways round-robin. A
 * gateway only spawns connections and keeps count of them: it links each one
 * with `Absorb` on both sides, so neither a dropped player nor a gateway
 * shutdown takes the other down.
 */

#pragma once

#include "LinkedActor.h"
#include "World.h"

namespace mud {

class GatewayActor : public LinkedActor {
    WorldPtr _world;
    std::size_t _accepted = 0;

public:
    explicit GatewayActor(WorldPtr world);

    bool onInit() override;

    void on(NewConnectionEvent& event);

    std::size_t active() const { return links().size(); }

protected:
    void onPeerDown(qb::ActorId peer, ExitReason reason, const std::string& detail) override;
};

} // namespace mud
