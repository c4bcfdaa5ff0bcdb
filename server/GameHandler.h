/**
 * @file server/GameHandler.h
 * @brief In-game command interpreter.
 *
 * @details
 * Understands movement (`north`, `n`, `go north`, ...), `look`, `get`,
 * `drop`, `inventory`, `say`, `shout`, `who`, `logout`, `quit` and `help`. Every
 * command is carried out through the `RequestContext`; the handler itself
 * holds no state.
 */

#pragma once

#include <memory>
#include <string>
#include "../shared/Handler.h"

namespace mud {

struct Command {
    std::string verb;  ///< lower-cased first word
    std::string rest;  ///< remainder, trimmed
};

std::string trim(const std::string& text);
Command parseCommand(const std::string& line);

/// Multi-line text shown for a room.
std::string renderRoom(const RoomView& view);

class GameHandler : public Handler {
public:
    const char* name() const override { return "game"; }
    void handle(RequestContext& ctx, const std::string& line) const override;
    std::string prompt(const HandlerArgs&) const override { return ">"; }

private:
    static void look(RequestContext& ctx);
    static void move(RequestContext& ctx, const Direction& direction);
    static void take(RequestContext& ctx, const std::string& object);
    static void drop(RequestContext& ctx, const std::string& object);
    static void inventory(RequestContext& ctx);
    static void say(RequestContext& ctx, const std::string& text);
    static void who(RequestContext& ctx);
    static void shout(RequestContext& ctx, const std::string& text);
    static void logout(RequestContext& ctx);
    static void quit(RequestContext& ctx);
    static void help(RequestContext& ctx);
};

std::shared_ptr<const Handler> gameHandler();

} // namespace mud
