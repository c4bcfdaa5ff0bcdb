/**
 * @file server/AcceptActor.cpp
 * @brief Listening socket and round-robin hand-off of new players.
 */

#include "AcceptActor.h"
#include "../shared/Events.h"

namespace mud {

AcceptActor::AcceptActor(qb::io::uri listen_at, qb::ActorIdList gateways)
    : _listen_at(std::move(listen_at)), _gateways(std::move(gateways)) {}

bool AcceptActor::onInit() {
    if (_gateways.empty()) {
        qb::io::cerr() << "[Accept] no gateway to hand connections to" << std::endl;
        return false;
    }
    if (transport().listen(_listen_at)) {
        qb::io::cerr() << "[Accept] cannot listen on " << _listen_at.source() << std::endl;
        return false;
    }

    registerEvent<qb::KillEvent>(*this);
    qb::io::cout() << "[Accept] listening on " << _listen_at.source() << " for " << _gateways.size()
                   << " gateway(s)" << std::endl;
    start();
    return true;
}

void AcceptActor::on(accepted_socket_type&& socket) {
    const auto gateway = _gateways[_accepted++ % _gateways.size()];
    qb::io::cout() << "[Accept] player #" << _accepted << " handed to gateway " << gateway << std::endl;
    auto& evt = push<NewConnectionEvent>(gateway);
    evt.socket = std::move(socket);
}

void AcceptActor::on(qb::io::async::event::disconnected const&) {
    qb::io::cerr() << "[Accept] listener closed, shutting down" << std::endl;
    broadcast<qb::KillEvent>();
}

void AcceptActor::on(qb::KillEvent&) {
    qb::io::cout() << "[Accept] closing after " << _accepted << " player(s)" << std::endl;
    kill();
}

} // namespace mud
