/**
 * @file server/GameActor.h
 * @brief Actor owning the game registry: who is online, and broadcasts.
 *
 * @details
 * A user registers itself right after it starts. The game links every
 * registered user with `LinkPolicy::Absorb` on both sides, so a user going
 * down (logout, disconnect or crash) only removes its own entry and a
 * departure notice goes to the others. The game never terminates because a
 * user did.
 */

#pragma once

#include "GameRegistry.h"
#include "LinkedActor.h"

namespace mud {

class GameActor : public LinkedActor {
    GameRegistry _registry;

public:
    GameActor() = default;

    bool onInit() override;

    void on(RegisterUserRequest& request);
    void on(WhoRequest& request);
    void on(BroadcastEvent& event);

protected:
    void onPeerDown(qb::ActorId peer, ExitReason reason, const std::string& detail) override;

private:
    void broadcast(const std::string& text, qb::ActorId except = qb::ActorId{});
};

} // namespace mud
