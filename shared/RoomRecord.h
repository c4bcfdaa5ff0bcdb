/**
 * @file shared/RoomRecord.h
 * @brief Schema and validating parser for room files.
 *
 * @details
 * A room file is a JSON document stored as `<data_dir>/rooms/<id>.dat`:
 *
 * @code
 * {
 *   "title": "Town Square",
 *   "desc":  "A square.",
 *   "long":  "Cobblestones stretch out in every direction.",
 *   "exits": [ {"dir": "north", "to": "market"} ],
 *   "objects": [ {"name": "fountain", "desc": "An old fountain.", "attached": true} ]
 * }
 * @endcode
 *
 * `title`, `desc` and `exits` are required. `exits` may also be written as a
 * list of `["north", "market"]` pairs. Parsing fails closed: any missing or
 * mistyped required field yields `std::nullopt`, which the room manager
 * reports as `RoomStatus::NotFound`.
 */

#pragma once

#include <qb/json.h>
#include <optional>
#include <string>
#include <vector>
#include "Types.h"

namespace mud {

/// File extension of room files.
constexpr const char* ROOM_FILE_EXTENSION = ".dat";

/// Subdirectory of the data directory holding room files.
constexpr const char* ROOM_DIRECTORY = "rooms";

struct RoomRecord {
    RoomId id;
    std::string title;
    std::string brief;
    std::optional<std::string> long_description;
    std::vector<Exit> exits;
    std::vector<ObjectRecord> objects;  ///< expanded from `resets`
    std::vector<ResetSpec> resets;
};

/**
 * @brief Validates a parsed room document
 * @param doc   JSON document of the room file
 * @param id    id the record will carry
 * @param error receives a human readable reason on failure
 * @return the record, or nullopt if a required field is missing or mistyped
 */
std::optional<RoomRecord> parseRoomRecord(const qb::json& doc, const RoomId& id, std::string& error);

/**
 * @brief Parses raw room file text
 *
 * Never throws; malformed JSON is reported through @p error like any other
 * validation failure.
 */
std::optional<RoomRecord> parseRoomRecord(const std::string& text, const RoomId& id, std::string& error);

/// `<data_dir>/rooms/<id>.dat`
std::string roomPath(const std::string& data_dir, const RoomId& id);

/// Basename of @p path with the `.dat` extension stripped.
RoomId roomIdFromPath(const std::string& path);

/// Most copies one reset spec may ask for.
constexpr int MAX_RESET_COUNT = 100;

/**
 * @brief Object loader: expands reset specs into object records
 *
 * Each spec yields `count` copies, at most `MAX_RESET_COUNT`. Specs with an
 * empty name or a non-positive count yield nothing.
 */
std::vector<ObjectRecord> loadObjects(const std::vector<ResetSpec>& resets);

} // namespace mud
