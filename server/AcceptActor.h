/**
 * @file server/AcceptActor.h
 * @brief TCP listener distributing new players over the gateways.
 *
 * @details
 * Players are handed round-robin to the `GatewayActor`s, which own the
 * connection actors. On shutdown the acceptor reports how many players it
 * let in.
 */

#pragma once

#include <qb/actor.h>
#include <qb/io/async.h>
#include <qb/io/uri.h>

namespace mud {

class AcceptActor : public qb::Actor,
                    public qb::io::use<AcceptActor>::tcp::acceptor {
    const qb::io::uri _listen_at;
    const qb::ActorIdList _gateways;
    std::size_t _accepted{0};

public:
    AcceptActor(qb::io::uri listen_at, qb::ActorIdList gateways);

    bool onInit() override;

    void on(accepted_socket_type&& socket);
    void on(qb::io::async::event::disconnected const&);
    void on(qb::KillEvent&);
};

} // namespace mud
