/**
 * @file shared/Handler.h
 * @brief Command handler interface and the request context handlers run in.
 *
 * @details
 * A session keeps a stack of `HandlerFrame`s. For every input line it spawns a
 * `RequestActor` that calls `Handler::handle()` of the top frame with the raw
 * line. Handlers are stateless shared objects; per-player data lives in the
 * frame's `HandlerArgs`.
 *
 * Everything a handler may do goes through `RequestContext`: talking to the
 * player, changing the session's handler stack, and asynchronous queries
 * against rooms, the player's living, the user and the game registry. Each
 * query takes a callback invoked later from the request actor's own event
 * loop. A handler must call `done()` exactly once when the command has been
 * fully applied; the session dispatches the next line only after that.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "ActorHandle.h"
#include "Types.h"

namespace mud {

struct World;
class RequestContext;

/// Per-frame arguments. Empty for the login frame.
struct HandlerArgs {
    std::string username;
    ActorHandle user;
    ActorHandle living;
};

class Handler {
public:
    virtual ~Handler() = default;

    virtual const char* name() const = 0;

    /// Executes one input line. Must eventually call `ctx.done()`.
    virtual void handle(RequestContext& ctx, const std::string& line) const = 0;

    /// Prompt sent after each command while this handler is on top; may be empty.
    virtual std::string prompt(const HandlerArgs&) const { return {}; }
};

struct HandlerFrame {
    std::shared_ptr<const Handler> handler;
    HandlerArgs args;
};

struct MoveResult {
    RoomStatus status = RoomStatus::NotFound;  ///< lookup status of the destination
    bool moved = false;
    RoomView view;                             ///< destination, when moved
};

struct LoginResult {
    bool ok = false;
    std::string reason;
    HandlerArgs args;  ///< user and living of the new player on success
    RoomId room;       ///< where the living was placed
};

class RequestContext {
public:
    virtual ~RequestContext() = default;

    virtual const HandlerArgs& args() const = 0;
    virtual const World& world() const = 0;

    /// Sends one line of text to the player.
    virtual void send(const std::string& text) = 0;

    virtual void pushHandler(HandlerFrame frame) = 0;
    virtual void popHandler() = 0;
    virtual void replaceHandler(HandlerFrame frame) = 0;

    virtual void getRoom(const RoomId& id, std::function<void(RoomStatus, const ActorHandle&)> cb) = 0;
    virtual void newRoom(const RoomId& id, std::function<void(RoomStatus, const ActorHandle&)> cb) = 0;
    virtual void lookRoom(const RoomId& id, std::function<void(RoomStatus, const RoomView&)> cb) = 0;

    virtual void queryLiving(std::function<void(const LivingState&)> cb) = 0;
    virtual void moveLiving(const RoomId& destination, std::function<void(const MoveResult&)> cb) = 0;
    virtual void takeObject(const std::string& name, std::function<void(TransferStatus, const ObjectRecord&)> cb) = 0;
    virtual void dropObject(const std::string& name, std::function<void(TransferStatus, const ObjectRecord&)> cb) = 0;
    virtual void say(const std::string& text, std::function<void()> cb) = 0;

    virtual void who(std::function<void(const std::vector<std::string>&)> cb) = 0;
    /// Tells every other player online. Nothing comes back.
    virtual void shout(const std::string& text) = 0;
    virtual void startUser(const std::string& username, std::function<void(const LoginResult&)> cb) = 0;
    virtual void logout(std::function<void()> cb) = 0;

    /// Closes the player's connection after pending output is flushed.
    virtual void disconnect() = 0;

    /// Finishes the request.
    virtual void done() = 0;
};

} // namespace mud
