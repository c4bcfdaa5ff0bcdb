/**
 * @file shared/Types.cpp
 * @brief String conversions and id/direction helpers for the shared types.
 */

#include "Types.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace mud {

std::optional<RoomId> RoomView::exitTo(const Direction& direction) const {
    for (const auto& exit : exits) {
        if (exit.direction == direction)
            return exit.destination;
    }
    return std::nullopt;
}

const char* toString(RoomStatus status) {
    switch (status) {
        case RoomStatus::Ok:            return "ok";
        case RoomStatus::NotFound:      return "not_found";
        case RoomStatus::AlreadyExists: return "already_exists";
    }
    return "unknown";
}

const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::Normal:   return "normal";
        case ExitReason::Shutdown: return "shutdown";
        case ExitReason::Crashed:  return "crashed";
    }
    return "unknown";
}

const char* toString(LinkPolicy policy) {
    switch (policy) {
        case LinkPolicy::Propagate: return "propagate";
        case LinkPolicy::Absorb:    return "absorb";
    }
    return "unknown";
}

bool isValidRoomId(const std::string& id) {
    if (id.empty())
        return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

std::optional<Direction> normalizeDirection(const std::string& word) {
    static const std::array<std::pair<const char*, const char*>, 10> directions{{
        {"n", "north"}, {"s", "south"}, {"e", "east"}, {"w", "west"}, {"u", "up"},
        {"d", "down"}, {"ne", "northeast"}, {"nw", "northwest"}, {"se", "southeast"},
        {"sw", "southwest"}
    }};

    for (const auto& [abbrev, full] : directions) {
        if (word == abbrev || word == full)
            return Direction{full};
    }
    return std::nullopt;
}

} // namespace mud
