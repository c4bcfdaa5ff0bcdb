/**
 * @file server/LoginHandler.h
 * @brief Base frame of every session: asks for a name, then a password.
 */

#pragma once

#include <memory>
#include <string>
#include "../shared/Handler.h"

namespace mud {

/// 2 to 16 characters, letters only.
bool isValidUsername(const std::string& name);

class LoginHandler : public Handler {
public:
    const char* name() const override { return "login"; }
    void handle(RequestContext& ctx, const std::string& line) const override;
    std::string prompt(const HandlerArgs&) const override { return "By what name are you known?"; }
};

/// Pushed above the login frame when the account store wants a password.
class PasswordHandler : public Handler {
public:
    const char* name() const override { return "password"; }
    void handle(RequestContext& ctx, const std::string& line) const override;
    std::string prompt(const HandlerArgs&) const override { return "Password:"; }
};

/// Starts the user and replaces the top frame with the game frame on success.
void enterGame(RequestContext& ctx, const std::string& username);

std::shared_ptr<const Handler> loginHandler();
std::shared_ptr<const Handler> passwordHandler();

} // namespace mud
