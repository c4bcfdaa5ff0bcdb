/**
 * @file server/GameRegistry.cpp
 * @brief Username table with dead-holder replacement.
 */

#include "GameRegistry.h"

namespace mud {

bool GameRegistry::registerUser(const std::string& username, const ActorHandle& user) {
    auto it = _users.find(username);
    if (it != _users.end() && it->second.alive() && it->second != user)
        return false;
    _users[username] = user;
    return true;
}

std::optional<std::string> GameRegistry::unregisterById(qb::ActorId user) {
    for (auto it = _users.begin(); it != _users.end(); ++it) {
        if (it->second.id() == user) {
            auto name = it->first;
            _users.erase(it);
            return name;
        }
    }
    return std::nullopt;
}

std::vector<std::string> GameRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(_users.size());
    for (const auto& entry : _users)
        result.push_back(entry.first);
    return result;
}

std::vector<ActorHandle> GameRegistry::users() const {
    std::vector<ActorHandle> result;
    result.reserve(_users.size());
    for (const auto& entry : _users)
        result.push_back(entry.second);
    return result;
}

} // namespace mud
