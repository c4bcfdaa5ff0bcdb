/**
 * @file shared/Types.h
 * @brief Value types shared by every mudcore actor: room ids, objects, exits,
 * room snapshots, living state and the status/exit-reason enums.
 *
 * @details
 * Everything in here is a plain value type. Actors copy these into events and
 * never share them by reference across cores.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mud {

/// Room identifier, derived from the room file name without its extension.
using RoomId = std::string;

/// Normalised direction name ("north", "up", ...). Free-form in room files.
using Direction = std::string;

/**
 * @brief Result of a room lookup or creation
 *
 * `NotFound` covers both a missing file and a file that fails to parse;
 * callers cannot tell the two apart.
 */
enum class RoomStatus : uint8_t {
    Ok = 0,
    NotFound,
    AlreadyExists
};

/**
 * @brief Why an actor terminated
 *
 * Carried by `DownEvent` to every linked peer.
 */
enum class ExitReason : uint8_t {
    Normal = 0,  ///< finished its work, disconnected or logged out
    Shutdown,    ///< engine shutdown (qb::KillEvent)
    Crashed      ///< abnormal termination
};

/**
 * @brief What an actor does when a linked peer goes down
 */
enum class LinkPolicy : uint8_t {
    Propagate = 0,  ///< terminate as well (fate-sharing)
    Absorb          ///< keep running and clean up bookkeeping
};

/// Outcome of moving an object between a room and a living.
enum class TransferStatus : uint8_t {
    Ok = 0,
    NotFound,   ///< no such object here / not carried
    Attached,   ///< fixed to the room
    NoRoom      ///< the living is not standing in a live room
};

struct ObjectRecord {
    std::string name;
    std::string description;
    bool attached = false;

    bool operator==(const ObjectRecord& other) const {
        return name == other.name && description == other.description && attached == other.attached;
    }
};

/// Object reset entry of a room file, expanded by the object loader.
struct ResetSpec {
    std::string name;
    std::string description;
    bool attached = false;
    int count = 1;
};

struct Exit {
    Direction direction;
    RoomId destination;
};

/**
 * @brief Snapshot of a room as seen by a visitor
 */
struct RoomView {
    RoomId id;
    std::string title;
    std::string brief;
    std::optional<std::string> long_description;
    std::vector<Exit> exits;
    std::vector<ObjectRecord> objects;
    std::vector<std::string> occupants;

    std::optional<RoomId> exitTo(const Direction& direction) const;
};

struct LivingState {
    RoomId current_room;
    std::vector<ObjectRecord> inventory;
    std::string display_name;
};

const char* toString(RoomStatus status);
const char* toString(ExitReason reason);
const char* toString(LinkPolicy policy);

/// Room ids are limited to [A-Za-z0-9_-] so they can never escape the rooms directory.
bool isValidRoomId(const std::string& id);

/**
 * @brief Expands direction abbreviations ("n" -> "north")
 * @return the full direction, or nullopt if @p word is not a direction
 */
std::optional<Direction> normalizeDirection(const std::string& word);

} // namespace mud
