/**
 * @file server/GameRegistry.h
 * @brief Username -> user table owned by the `GameActor`.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../shared/ActorHandle.h"

namespace mud {

class GameRegistry {
    std::map<std::string, ActorHandle> _users;

public:
    /**
     * @brief Registers @p user under @p username
     * @return false if a live user already holds the name. A dead holder is
     * replaced.
     */
    bool registerUser(const std::string& username, const ActorHandle& user);

    /// Removes the entry held by @p user; returns the freed username.
    std::optional<std::string> unregisterById(qb::ActorId user);

    /// Sorted names of the registered users.
    std::vector<std::string> names() const;
    std::vector<ActorHandle> users() const;

    std::size_t size() const { return _users.size(); }
};

} // namespace mud
