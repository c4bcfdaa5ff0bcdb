/**
 * @file server/main.cpp
 * @brief mudcore server entry point.
 *
 * @details
 * Actor layout:
 * - `world_core`: `RoomManagerActor` (and every room it spawns), `GameActor`.
 * - `gateway_core`: `config.gateways` x `GatewayActor`; connections, sessions,
 *   requests, users and livings live next to the gateway that accepted them.
 * - `accept_core`: `AcceptActor` listening on `config.listen`.
 *
 * The `World` (config, room index, account store, coordinator ids) is built
 * here once and shared by every actor.
 */

#include <qb/main.h>
#include <algorithm>
#include "../shared/Config.h"
#include "AcceptActor.h"
#include "GameActor.h"
#include "GatewayActor.h"
#include "RoomManagerActor.h"
#include "World.h"

int main(int argc, char* argv[]) {
    using namespace mud;

    try {
        const auto command_line = CommandLine::parse(argc, argv);
        if (command_line.help) {
            printUsage(argv[0]);
            return 0;
        }
        const auto config = command_line.resolve();

        auto preload = config.preload_rooms;
        if (std::find(preload.begin(), preload.end(), config.start_room) == preload.end())
            preload.insert(preload.begin(), config.start_room);

        qb::Main engine;

        auto world = std::make_shared<World>();
        world->config = config;
        world->rooms = std::make_shared<RoomIndex>();
        if (config.accounts.empty())
            world->accounts = std::make_shared<OpenAccountStore>();
        else
            world->accounts = std::make_shared<FixedAccountStore>(config.accounts);

        auto store = std::make_shared<FileRoomStore>(config.data_dir);
        world->room_manager = engine.addActor<RoomManagerActor>(config.world_core, world->rooms, store, preload,
                                                               config.room_reset_interval);
        world->game = engine.addActor<GameActor>(config.world_core);

        WorldPtr shared_world = world;
        qb::ActorIdList gateways;
        for (std::size_t i = 0; i < config.gateways; ++i)
            gateways.push_back(engine.addActor<GatewayActor>(config.gateway_core, shared_world));

        engine.addActor<AcceptActor>(config.accept_core, qb::io::uri{config.listen.c_str()}, gateways);

        qb::io::cout() << "mudcore: data in '" << config.data_dir << "', start room '" << config.start_room
                       << "', " << config.gateways << " gateway(s)" << std::endl;

        engine.start();
        engine.join();

        if (engine.hasError()) {
            qb::io::cerr() << "mudcore: engine stopped with errors" << std::endl;
            return 1;
        }
    } catch (const std::exception& e) {
        qb::io::cerr() << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
