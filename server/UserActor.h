/**
 * @file server/UserActor.h
 * @brief Logged-in account: registers with the game and supervises the living.
 *
 * @details
 * Created by the login request through `RequestContext::startUser()`.
 * Login sequence:
 * 1. `onInit()` sends `RegisterUserRequest` to the game. A refusal ends the
 *    login with "name in use".
 * 2. The user spawns its `LivingActor` in the start room and links it.
 * 3. Once the living reports `LivingReadyEvent`, the user links the session
 *    and answers the login request with a `LoginReply`. If the request is
 *    gone by then (cancelled by the session watchdog or crashed), nobody
 *    will install the game frame, so the user exits normally instead.
 *
 * Link policies:
 * | peer    | user's policy                         | peer's policy                          |
 * |---------|---------------------------------------|----------------------------------------|
 * | game    | Absorb                                | Absorb                                 |
 * | living  | Propagate (Absorb when selective)     | Propagate                              |
 * | session | Propagate                             | Propagate (Absorb when selective)      |
 *
 * With `selective_recovery`, a dead living is respawned in the last room it
 * reported, at most `max_living_respawns` times, and the session is told
 * about the replacement through `RebindLivingEvent`.
 */

#pragma once

#include <string>
#include "LinkedActor.h"
#include "PendingReplies.h"
#include "World.h"

namespace mud {

/// Who asked for the login and where the player sits.
struct LoginTicket {
    ActorHandle requester;
    uint64_t ref = 0;
    ActorHandle session;
    qb::ActorId terminal;
};

class UserActor : public LinkedActor {
    std::string _username;
    LoginTicket _ticket;
    WorldPtr _world;

    ActorHandle _living;
    RoomId _last_room;
    std::size_t _respawns = 0;
    bool _logged_in = false;

    PendingReplies<RegisterUserReply> _registrations;

public:
    UserActor(std::string username, LoginTicket ticket, WorldPtr world);

    bool onInit() override;

    void on(RegisterUserReply& reply) { _registrations.resolve(reply); }
    void on(LivingReadyEvent& event);
    void on(LivingMovedEvent& event);
    void on(LogoutRequest& request);
    void on(UserMessageEvent& event);

protected:
    void onPeerDown(qb::ActorId peer, ExitReason reason, const std::string& detail) override;
    void onTerminate(ExitReason reason) override;

private:
    bool selective() const { return _world->config.selective_recovery; }
    bool spawnLiving(const RoomId& room);
    void loginFailed(const std::string& reason);
};

} // namespace mud
