/**
 * @file server/AccountStore.h
 * @brief Credential check used by the login handlers.
 */

#pragma once

#include <map>
#include <string>

namespace mud {

class AccountStore {
public:
    virtual ~AccountStore() = default;

    /// True if the login flow must ask for a password.
    virtual bool requiresPassword() const = 0;

    virtual bool verify(const std::string& username, const std::string& password) const = 0;
};

/// Anyone may log in under any free name.
class OpenAccountStore : public AccountStore {
public:
    bool requiresPassword() const override { return false; }
    bool verify(const std::string&, const std::string&) const override { return true; }
};

/// Fixed username -> password table, typically from the `accounts` config key.
class FixedAccountStore : public AccountStore {
    std::map<std::string, std::string> _accounts;

public:
    explicit FixedAccountStore(std::map<std::string, std::string> accounts)
        : _accounts(std::move(accounts)) {}

    bool requiresPassword() const override { return true; }
    bool verify(const std::string& username, const std::string& password) const override;
};

} // namespace mud
