/**
 * @file server/GameHandler.cpp
 * @brief In-game command parsing and execution.
 */

#include "GameHandler.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mud {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

Command parseCommand(const std::string& line) {
    Command command;
    const auto text = trim(line);
    const auto space = text.find_first_of(" \t");
    command.verb = text.substr(0, space);
    std::transform(command.verb.begin(), command.verb.end(), command.verb.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (space != std::string::npos)
        command.rest = trim(text.substr(space));
    return command;
}

std::string renderRoom(const RoomView& view) {
    std::ostringstream out;
    out << view.title << "\n" << view.long_description.value_or(view.brief);

    if (view.exits.empty()) {
        out << "\nThere are no obvious exits.";
    } else {
        out << "\nExits:";
        for (const auto& exit : view.exits)
            out << " " << exit.direction;
    }
    if (!view.objects.empty()) {
        out << "\nYou see:";
        for (std::size_t i = 0; i < view.objects.size(); ++i)
            out << (i ? ", " : " ") << view.objects[i].name;
    }
    for (const auto& occupant : view.occupants)
        out << "\n" << occupant << " is here.";
    return out.str();
}

void GameHandler::handle(RequestContext& ctx, const std::string& line) const {
    const auto command = parseCommand(line);
    const auto& verb = command.verb;

    if (verb.empty()) {
        ctx.done();
    } else if (verb == "look" || verb == "l") {
        look(ctx);
    } else if (verb == "go") {
        auto direction = normalizeDirection(command.rest);
        if (!direction) {
            ctx.send("Go where?");
            ctx.done();
            return;
        }
        move(ctx, *direction);
    } else if (auto direction = normalizeDirection(verb)) {
        move(ctx, *direction);
    } else if (verb == "get" || verb == "take") {
        take(ctx, command.rest);
    } else if (verb == "drop") {
        drop(ctx, command.rest);
    } else if (verb == "inventory" || verb == "inv" || verb == "i") {
        inventory(ctx);
    } else if (verb == "say") {
        say(ctx, command.rest);
    } else if (verb == "shout") {
        shout(ctx, command.rest);
    } else if (verb == "who") {
        who(ctx);
    } else if (verb == "logout") {
        logout(ctx);
    } else if (verb == "quit") {
        quit(ctx);
    } else if (verb == "help") {
        help(ctx);
    } else {
        ctx.send("Huh? Type 'help' for a list of commands.");
        ctx.done();
    }
}

void GameHandler::look(RequestContext& ctx) {
    ctx.queryLiving([&ctx](const LivingState& state) {
        if (state.current_room.empty()) {
            ctx.send("You are nowhere.");
            ctx.done();
            return;
        }
        ctx.lookRoom(state.current_room, [&ctx](RoomStatus status, const RoomView& view) {
            ctx.send(status == RoomStatus::Ok ? renderRoom(view) : "You are nowhere.");
            ctx.done();
        });
    });
}

void GameHandler::move(RequestContext& ctx, const Direction& direction) {
    ctx.queryLiving([&ctx, direction](const LivingState& state) {
        if (state.current_room.empty()) {
            ctx.send("You are nowhere.");
            ctx.done();
            return;
        }
        ctx.lookRoom(state.current_room, [&ctx, direction](RoomStatus status, const RoomView& here) {
            std::optional<RoomId> destination;
            if (status == RoomStatus::Ok)
                destination = here.exitTo(direction);
            if (!destination) {
                ctx.send("You can't go that way.");
                ctx.done();
                return;
            }
            ctx.moveLiving(*destination, [&ctx](const MoveResult& result) {
                if (result.status == RoomStatus::NotFound)
                    ctx.send("No such room.");
                else if (!result.moved)
                    ctx.send("You can't go there right now.");
                else
                    ctx.send(renderRoom(result.view));
                ctx.done();
            });
        });
    });
}

void GameHandler::take(RequestContext& ctx, const std::string& object) {
    if (object.empty()) {
        ctx.send("Get what?");
        ctx.done();
        return;
    }
    ctx.takeObject(object, [&ctx, object](TransferStatus status, const ObjectRecord&) {
        switch (status) {
        case TransferStatus::Ok:
            ctx.send("You take the " + object + ".");
            break;
        case TransferStatus::Attached:
            ctx.send("The " + object + " will not budge.");
            break;
        case TransferStatus::NotFound:
            ctx.send("There is no " + object + " here.");
            break;
        case TransferStatus::NoRoom:
            ctx.send("You are nowhere.");
            break;
        }
        ctx.done();
    });
}

void GameHandler::drop(RequestContext& ctx, const std::string& object) {
    if (object.empty()) {
        ctx.send("Drop what?");
        ctx.done();
        return;
    }
    ctx.dropObject(object, [&ctx, object](TransferStatus status, const ObjectRecord&) {
        if (status == TransferStatus::Ok)
            ctx.send("You drop the " + object + ".");
        else if (status == TransferStatus::NotFound)
            ctx.send("You are not carrying " + object + ".");
        else
            ctx.send("You are nowhere.");
        ctx.done();
    });
}

void GameHandler::inventory(RequestContext& ctx) {
    ctx.queryLiving([&ctx](const LivingState& state) {
        if (state.inventory.empty()) {
            ctx.send("You are carrying nothing.");
        } else {
            std::string text = "You are carrying:";
            for (const auto& object : state.inventory)
                text += "\n  " + object.name;
            ctx.send(text);
        }
        ctx.done();
    });
}

void GameHandler::say(RequestContext& ctx, const std::string& text) {
    if (text.empty()) {
        ctx.send("Say what?");
        ctx.done();
        return;
    }
    ctx.say(text, [&ctx, text] {
        ctx.send("You say: " + text);
        ctx.done();
    });
}

void GameHandler::who(RequestContext& ctx) {
    ctx.who([&ctx](const std::vector<std::string>& names) {
        std::string text = "Players online:";
        for (std::size_t i = 0; i < names.size(); ++i)
            text += (i ? ", " : " ") + names[i];
        ctx.send(text);
        ctx.done();
    });
}

void GameHandler::shout(RequestContext& ctx, const std::string& text) {
    if (text.empty()) {
        ctx.send("Shout what?");
    } else {
        ctx.shout(text);
        ctx.send("You shout: " + text);
    }
    ctx.done();
}

void GameHandler::logout(RequestContext& ctx) {
    ctx.logout([&ctx] {
        ctx.popHandler();
        ctx.send("You have logged out.");
        ctx.done();
    });
}

void GameHandler::quit(RequestContext& ctx) {
    ctx.send("Goodbye.");
    ctx.disconnect();
    ctx.done();
}

void GameHandler::help(RequestContext& ctx) {
    ctx.send("Commands: look, north/south/east/west/up/down (or go <dir>), get <obj>, drop <obj>,\n"
             "inventory, say <text>, shout <text>, who, logout, quit");
    ctx.done();
}

std::shared_ptr<const Handler> gameHandler() {
    static const auto handler = std::make_shared<const GameHandler>();
    return handler;
}

} // namespace mud
