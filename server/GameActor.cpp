/**
 * @file server/GameActor.cpp
 * @brief Registration, who-is-online and game-wide messages.
 */

#include "GameActor.h"

namespace mud {

bool GameActor::onInit() {
    registerEvent<RegisterUserRequest>(*this);
    registerEvent<WhoRequest>(*this);
    registerEvent<BroadcastEvent>(*this);
    qb::io::cout() << "[Game] initialized with ID " << id() << " on core " << id().index() << std::endl;
    return true;
}

void GameActor::on(RegisterUserRequest& request) {
    const bool ok = request.user.alive() && _registry.registerUser(request.username, request.user);

    auto& reply = push<RegisterUserReply>(request.getSource());
    reply.ref = request.ref;
    reply.ok = ok;

    if (!ok) {
        qb::io::cout() << "[Game] refused '" << request.username << "', name in use" << std::endl;
        return;
    }
    link(request.user, LinkPolicy::Absorb, LinkPolicy::Absorb);
    qb::io::cout() << "[Game] " << request.username << " logged on (" << _registry.size() << " online)"
                   << std::endl;
    broadcast(request.username + " has entered the game.", request.user.id());
}

void GameActor::on(WhoRequest& request) {
    auto& reply = push<WhoReply>(request.getSource());
    reply.ref = request.ref;
    reply.names = _registry.names();
}

void GameActor::on(BroadcastEvent& event) {
    broadcast(event.text, event.except);
}

void GameActor::onPeerDown(qb::ActorId peer, ExitReason reason, const std::string&) {
    auto name = _registry.unregisterById(peer);
    if (!name)
        return;
    qb::io::cout() << "[Game] " << *name << " logged off (" << toString(reason) << ")" << std::endl;
    broadcast(*name + " has left the game.");
}

void GameActor::broadcast(const std::string& text, qb::ActorId except) {
    for (const auto& user : _registry.users()) {
        if (user.id() == except)
            continue;
        auto& msg = push<UserMessageEvent>(user.id());
        msg.text = text;
    }
}

} // namespace mud
