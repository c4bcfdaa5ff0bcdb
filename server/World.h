/**
 * @file server/World.h
 * @brief Process-wide services shared by every actor.
 *
 * @details
 * Built once in `main()` (or by a test fixture) before the engine starts and
 * handed to actors as `std::shared_ptr<const World>`. The room index is the
 * only mutable member; it synchronizes itself.
 */

#pragma once

#include <qb/actor.h>
#include <memory>
#include "../shared/Config.h"
#include "AccountStore.h"
#include "RoomIndex.h"

namespace mud {

struct World {
    ServerConfig config;
    std::shared_ptr<RoomIndex> rooms;
    std::shared_ptr<const AccountStore> accounts;
    qb::ActorId room_manager{};
    qb::ActorId game{};
};

using WorldPtr = std::shared_ptr<const World>;

} // namespace mud
