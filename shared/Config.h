/**
 * @file shared/Config.h
 * @brief Server configuration: JSON file plus command line overrides.
 *
 * @details
 * Example `mud.json`:
 * @code
 * {
 *   "listen": "tcp://0.0.0.0:4000",
 *   "data_dir": "data",
 *   "start_room": "square",
 *   "preload_rooms": ["market"],
 *   "gateways": 2,
 *   "request_timeout": 5.0,
 *   "room_reset_interval": 300.0,
 *   "selective_recovery": false,
 *   "accounts": {"wizard": "secret"}
 * }
 * @endcode
 * Unknown keys are ignored. A key present with the wrong type or an out of
 * range value throws `std::runtime_error`.
 */

#pragma once

#include <qb/json.h>
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "Types.h"

namespace mud {

struct ServerConfig {
    std::string listen = "tcp://0.0.0.0:4000";
    std::string data_dir = "data";
    RoomId start_room = "square";
    std::vector<RoomId> preload_rooms;

    std::size_t gateways = 2;     ///< connection actors are spread over this many gateways
    std::size_t accept_core = 0;
    std::size_t gateway_core = 1;
    std::size_t world_core = 0;   ///< room manager, rooms and game registry

    double request_timeout = 5.0; ///< seconds before a stuck request is cancelled
    double idle_timeout = 600.0;  ///< seconds of silence before a connection is closed
    std::size_t max_pending_lines = 32;
    double room_reset_interval = 300.0; ///< seconds between room resets, 0 disables them

    bool selective_recovery = false;
    std::size_t max_living_respawns = 3;

    /// username -> password; empty means anyone may log in under any free name
    std::map<std::string, std::string> accounts;

    static ServerConfig fromJson(const qb::json& doc);
    static ServerConfig load(const std::string& path);
};

/**
 * @brief Parsed command line
 *
 * `--config PATH`, `--listen URI`, `--data DIR`, `--start-room ID`, `--help`.
 */
struct CommandLine {
    std::string config_path;
    std::string listen;
    std::string data_dir;
    std::string start_room;
    bool help = false;

    static CommandLine parse(int argc, char* argv[]);

    /// Loads the config file (if any) and applies the overrides.
    ServerConfig resolve() const;
};

void printUsage(const char* program);

} // namespace mud
