/**
 * @file server/LoginHandler.cpp
 * @brief Name and password prompts, and entering the game.
 */

#include "LoginHandler.h"

#include <cctype>
#include "GameHandler.h"
#include "World.h"

namespace mud {

bool isValidUsername(const std::string& name) {
    if (name.size() < 2 || name.size() > 16)
        return false;
    for (unsigned char c : name) {
        if (!std::isalpha(c))
            return false;
    }
    return true;
}

void LoginHandler::handle(RequestContext& ctx, const std::string& line) const {
    const auto username = trim(line);
    if (username.empty()) {
        ctx.done();
        return;
    }
    if (!isValidUsername(username)) {
        ctx.send("Names are 2 to 16 letters, nothing else.");
        ctx.done();
        return;
    }

    const auto& accounts = ctx.world().accounts;
    if (accounts && accounts->requiresPassword()) {
        HandlerFrame frame;
        frame.handler = passwordHandler();
        frame.args.username = username;
        ctx.pushHandler(std::move(frame));
        ctx.done();
        return;
    }
    enterGame(ctx, username);
}

void PasswordHandler::handle(RequestContext& ctx, const std::string& line) const {
    const auto& username = ctx.args().username;
    const auto& accounts = ctx.world().accounts;
    if (!accounts || !accounts->verify(username, line)) {
        ctx.send("Wrong password.");
        ctx.popHandler();
        ctx.done();
        return;
    }
    enterGame(ctx, username);
}

void enterGame(RequestContext& ctx, const std::string& username) {
    ctx.startUser(username, [&ctx, username](const LoginResult& result) {
        if (!result.ok) {
            ctx.send(result.reason);
            // back to the name prompt from the password frame
            if (ctx.args().username == username)
                ctx.popHandler();
            ctx.done();
            return;
        }

        HandlerFrame frame;
        frame.handler = gameHandler();
        frame.args = result.args;
        ctx.replaceHandler(std::move(frame));
        ctx.send("Welcome, " + username + ".");

        ctx.lookRoom(result.room, [&ctx](RoomStatus status, const RoomView& view) {
            if (status == RoomStatus::Ok)
                ctx.send(renderRoom(view));
            ctx.done();
        });
    });
}

std::shared_ptr<const Handler> loginHandler() {
    static const auto handler = std::make_shared<const LoginHandler>();
    return handler;
}

std::shared_ptr<const Handler> passwordHandler() {
    static const auto handler = std::make_shared<const PasswordHandler>();
    return handler;
}

} // namespace mud
