/**
 * @file server/ConnectionActor.h
 * @brief Actor owning one player socket and its line framing.
 *
 * @details
 * Created by a `GatewayActor` with a freshly accepted socket. The connection
 * speaks newline-delimited text (`qb::protocol::text::command`), strips a
 * trailing `\r` from every line and forwards it to its `SessionActor` as an
 * `InputLineEvent`. Output arrives as `TerminalOutputEvent` from the session,
 * the request, the user and the living, and is written one line per event.
 *
 * The connection spawns the session and links it with `Propagate` on both
 * sides: a closed socket ends the session, a dead session closes the socket.
 * Input silence longer than `idle_timeout` closes the connection.
 */

#pragma once

#include <qb/io/async.h>
#include <qb/io/protocol/text.h>
#include <qb/io/tcp/socket.h>
#include "LinkedActor.h"
#include "World.h"

namespace mud {

class ConnectionActor : public LinkedActor,
                        public qb::io::use<ConnectionActor>::tcp::client<>,
                        public qb::io::use<ConnectionActor>::timeout {
public:
    using Protocol = qb::protocol::text::command<ConnectionActor>;

private:
    WorldPtr _world;
    ActorHandle _session;
    bool _closed = false;

public:
    ConnectionActor(qb::io::tcp::socket&& socket, WorldPtr world);

    bool onInit() override;

    void on(Protocol::message&& msg);
    void on(qb::io::async::event::disconnected const&);
    void on(qb::io::async::event::timer const&);

    void on(TerminalOutputEvent& event);
    void on(CloseTerminalEvent& event);

protected:
    void onTerminate(ExitReason reason) override;

private:
    void close();
};

} // namespace mud
