/**
 * @file server/ConnectionActor.cpp
 * @brief Socket I/O, idle timeout and the session link.
 */

#include "ConnectionActor.h"
#include "LoginHandler.h"
#include "SessionActor.h"

namespace mud {

ConnectionActor::ConnectionActor(qb::io::tcp::socket&& socket, WorldPtr world)
    : _world(std::move(world)) {
    this->transport() = std::move(socket);
}

bool ConnectionActor::onInit() {
    registerEvent<TerminalOutputEvent>(*this);
    registerEvent<CloseTerminalEvent>(*this);

    this->template switch_protocol<Protocol>(*this);
    this->start();
    this->setTimeout(_world->config.idle_timeout);

    HandlerFrame base;
    base.handler = loginHandler();
    auto session = addRefActor<SessionActor>(handle(), _world, base);
    if (!session) {
        qb::io::cerr() << "[Connection] could not start a session" << std::endl;
        return false;
    }
    _session = session->handle();
    link(_session, LinkPolicy::Propagate, LinkPolicy::Propagate);

    qb::io::cout() << "[Connection " << qb::Actor::id() << "] player connected" << std::endl;
    return true;
}

void ConnectionActor::on(Protocol::message&& msg) {
    if (terminating())
        return;
    this->updateTimeout();

    std::string line = std::move(msg.text);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    auto& input = push<InputLineEvent>(_session.id());
    input.text = std::move(line);
}

void ConnectionActor::on(qb::io::async::event::disconnected const&) {
    _closed = true;
    qb::io::cout() << "[Connection " << qb::Actor::id() << "] player disconnected" << std::endl;
    terminate(ExitReason::Normal, "disconnected");
}

void ConnectionActor::on(qb::io::async::event::timer const&) {
    qb::io::cout() << "[Connection " << qb::Actor::id() << "] idle timeout" << std::endl;
    *this << "You have been idle too long." << Protocol::end;
    close();
}

void ConnectionActor::on(TerminalOutputEvent& event) {
    if (!_closed)
        *this << event.text << Protocol::end;
}

void ConnectionActor::on(CloseTerminalEvent&) {
    close();
}

void ConnectionActor::onTerminate(ExitReason reason) {
    if (reason != ExitReason::Normal)
        qb::io::cout() << "[Connection " << qb::Actor::id() << "] closing (" << toString(reason) << ")"
                       << std::endl;
    close();
}

void ConnectionActor::close() {
    if (_closed)
        return;
    _closed = true;
    this->disconnect();
}

} // namespace mud
