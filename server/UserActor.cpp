/**
 * @file server/UserActor.cpp
 * @brief Login sequence, living supervision and logout.
 */

#include "UserActor.h"
#include "LivingActor.h"

namespace mud {

UserActor::UserActor(std::string username, LoginTicket ticket, WorldPtr world)
    : _username(std::move(username)), _ticket(std::move(ticket)), _world(std::move(world)) {}

bool UserActor::onInit() {
    registerEvent<RegisterUserReply>(*this);
    registerEvent<LivingReadyEvent>(*this);
    registerEvent<LivingMovedEvent>(*this);
    registerEvent<LogoutRequest>(*this);
    registerEvent<UserMessageEvent>(*this);

    auto ref = _registrations.expect([this](RegisterUserReply& reply) {
        if (terminating())
            return;
        if (!reply.ok) {
            loginFailed("That name is already in use.");
            return;
        }
        if (!spawnLiving(_world->config.start_room))
            loginFailed("The world could not make room for you.");
    });
    auto& request = push<RegisterUserRequest>(_world->game);
    request.ref = ref;
    request.username = _username;
    request.user = handle();

    qb::io::cout() << "[User " << _username << "] started with ID " << id() << std::endl;
    return true;
}

bool UserActor::spawnLiving(const RoomId& room) {
    auto living = addRefActor<LivingActor>(_username, handle(), _ticket.terminal, room, _world);
    if (!living)
        return false;
    _living = living->handle();
    link(_living, selective() ? LinkPolicy::Absorb : LinkPolicy::Propagate, LinkPolicy::Propagate);
    return true;
}

void UserActor::on(LivingReadyEvent& event) {
    if (!(event.getSource() == _living.id()) || terminating())
        return;

    if (!event.ok) {
        if (!_logged_in) {
            loginFailed(event.detail);
        } else {
            terminate(ExitReason::Crashed, "living could not be placed");
        }
        return;
    }

    _last_room = event.room;
    if (_logged_in) {
        auto& rebind = push<RebindLivingEvent>(_ticket.session.id());
        rebind.living = _living;
        auto& out = push<TerminalOutputEvent>(_ticket.terminal);
        out.text = "You feel yourself pulled back together.";
        return;
    }

    if (!_ticket.requester.alive()) {
        qb::io::cout() << "[User " << _username << "] login request is gone, giving up" << std::endl;
        terminate(ExitReason::Normal, "login abandoned");
        return;
    }

    _logged_in = true;
    link(_ticket.session, LinkPolicy::Propagate, selective() ? LinkPolicy::Absorb : LinkPolicy::Propagate);

    auto& reply = push<LoginReply>(_ticket.requester.id());
    reply.ref = _ticket.ref;
    reply.result.ok = true;
    reply.result.args.username = _username;
    reply.result.args.user = handle();
    reply.result.args.living = _living;
    reply.result.room = _last_room;
}

void UserActor::on(LivingMovedEvent& event) {
    if (event.getSource() == _living.id())
        _last_room = event.room;
}

void UserActor::on(LogoutRequest& request) {
    // the session outlives a logout
    unlink(_ticket.session.id());
    auto& reply = push<LogoutReply>(request.getSource());
    reply.ref = request.ref;
    terminate(ExitReason::Normal, "logout");
}

void UserActor::on(UserMessageEvent& event) {
    auto& out = push<TerminalOutputEvent>(_ticket.terminal);
    out.text = event.text;
}

void UserActor::onPeerDown(qb::ActorId peer, ExitReason reason, const std::string&) {
    if (reason == ExitReason::Shutdown) {
        terminate(reason, "shutdown");
        return;
    }
    if (!(peer == _living.id()))
        return;

    qb::io::cout() << "[User " << _username << "] living went down (" << toString(reason) << ")" << std::endl;
    _living = ActorHandle{};
    if (!_logged_in) {
        loginFailed("Your body could not be created.");
        return;
    }
    if (_respawns >= _world->config.max_living_respawns) {
        terminate(ExitReason::Crashed, "living respawn limit reached");
        return;
    }
    ++_respawns;
    if (!spawnLiving(_last_room.empty() ? _world->config.start_room : _last_room))
        terminate(ExitReason::Crashed, "living respawn failed");
}

void UserActor::onTerminate(ExitReason reason) {
    qb::io::cout() << "[User " << _username << "] terminating (" << toString(reason) << ")" << std::endl;
}

void UserActor::loginFailed(const std::string& reason) {
    auto& reply = push<LoginReply>(_ticket.requester.id());
    reply.ref = _ticket.ref;
    reply.result.ok = false;
    reply.result.reason = reason;
    terminate(ExitReason::Normal, "login failed");
}

} // namespace mud
