/**
 * @file server/GatewayActor.cpp
 * @brief Connection actors for the sockets handed over by the acceptor.
 */

#include "GatewayActor.h"
#include "ConnectionActor.h"

namespace mud {

GatewayActor::GatewayActor(WorldPtr world)
    : _world(std::move(world)) {}

bool GatewayActor::onInit() {
    registerEvent<NewConnectionEvent>(*this);
    qb::io::cout() << "[Gateway] initialized with ID " << id() << " on core " << id().index() << std::endl;
    return true;
}

void GatewayActor::on(NewConnectionEvent& event) {
    auto connection = addRefActor<ConnectionActor>(std::move(event.socket), _world);
    if (!connection) {
        qb::io::cerr() << "[Gateway] failed to start a connection" << std::endl;
        return;
    }
    link(connection->handle(), LinkPolicy::Absorb, LinkPolicy::Absorb);
    ++_accepted;
    qb::io::cout() << "[Gateway " << id() << "] connection #" << _accepted << " (" << active() << " active)"
                   << std::endl;
}

void GatewayActor::onPeerDown(qb::ActorId, ExitReason, const std::string&) {
    qb::io::cout() << "[Gateway " << id() << "] connection closed (" << active() << " active)" << std::endl;
}

} // namespace mud
