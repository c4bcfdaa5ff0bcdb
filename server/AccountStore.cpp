/**
 * @file server/AccountStore.cpp
 * @brief Account checks for the login frames.
 */

#include "AccountStore.h"

namespace mud {

bool FixedAccountStore::verify(const std::string& username, const std::string& password) const {
    auto it = _accounts.find(username);
    return it != _accounts.end() && it->second == password;
}

} // namespace mud
