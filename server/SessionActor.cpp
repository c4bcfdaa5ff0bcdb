/**
 * @file server/SessionActor.cpp
 * @brief Line queue, request dispatch and the request watchdog.
 */

#include "SessionActor.h"
#include "RequestActor.h"

#include <qb/io/async.h>

namespace mud {

SessionActor::SessionActor(ActorHandle terminal, WorldPtr world, HandlerFrame base)
    : _terminal(std::move(terminal)), _world(std::move(world)), _stack(std::move(base)) {}

bool SessionActor::onInit() {
    if (!_stack.top().handler) {
        qb::io::cerr() << "[Session] no login handler" << std::endl;
        return false;
    }
    registerEvent<InputLineEvent>(*this);
    registerEvent<HandlerStackEvent>(*this);
    registerEvent<RebindLivingEvent>(*this);

    tell("Welcome to mudcore.");
    prompt();
    return true;
}

void SessionActor::on(InputLineEvent& event) {
    if (terminating())
        return;
    if (!_busy) {
        dispatch(std::move(event.text));
        return;
    }
    if (_queue.size() >= _world->config.max_pending_lines) {
        tell("Too many commands pending, ignoring: " + event.text);
        return;
    }
    _queue.push_back(std::move(event.text));
}

void SessionActor::on(HandlerStackEvent& event) {
    // a request cancelled by the watchdog has lost its say
    if (!(event.getSource() == _inflight))
        return;
    switch (event.op) {
    case StackOp::Push:
        _stack.push(std::move(event.frame));
        break;
    case StackOp::Pop:
        _stack.pop();
        break;
    case StackOp::Replace:
        _stack.replace(std::move(event.frame));
        break;
    case StackOp::Reset:
        _stack.reset();
        break;
    }
}

void SessionActor::on(RebindLivingEvent& event) {
    _stack.rebindLiving(event.getSource(), event.living);
}

void SessionActor::onTimeout(uint64_t dispatch) {
    if (terminating() || !_busy || dispatch != _dispatches)
        return;

    qb::io::cout() << "[Session " << id() << "] request " << _inflight << " timed out" << std::endl;
    auto& crash = push<CrashEvent>(_inflight);
    crash.reason = "request timed out";
    unlink(_inflight);
    tell("That command took too long and was cancelled.");
    finishRequest();
}

void SessionActor::onPeerDown(qb::ActorId peer, ExitReason reason, const std::string&) {
    // nothing new may be spawned once the engine is going down
    if (reason == ExitReason::Shutdown) {
        terminate(reason, "shutdown");
        return;
    }
    if (_busy && peer == _inflight) {
        if (reason == ExitReason::Crashed)
            tell("Something went wrong with that command.");
        finishRequest();
        return;
    }

    if (_stack.references(peer)) {
        qb::io::cout() << "[Session " << id() << "] lost its user (" << toString(reason) << ")" << std::endl;
        _stack.reset();
        tell("Your character has been lost. Please log in again.");
        if (!_busy)
            prompt();
    }
}

void SessionActor::onTerminate(ExitReason reason) {
    _queue.clear();
    qb::io::cout() << "[Session " << id() << "] terminating (" << toString(reason) << ")" << std::endl;
}

void SessionActor::dispatch(std::string line) {
    auto request = addRefActor<RequestActor>(_stack.top(), std::move(line), handle(), _terminal.id(), _world);
    if (!request) {
        tell("Something went wrong with that command.");
        next();
        return;
    }
    _inflight = request->id();
    _busy = true;
    ++_dispatches;
    armWatchdog();
}

void SessionActor::finishRequest() {
    _busy = false;
    _inflight = qb::ActorId{};
    next();
}

void SessionActor::next() {
    if (terminating())
        return;
    prompt();
    if (_queue.empty())
        return;
    auto line = std::move(_queue.front());
    _queue.pop_front();
    dispatch(std::move(line));
}

void SessionActor::prompt() {
    const auto& top = _stack.top();
    auto text = top.handler->prompt(top.args);
    if (!text.empty())
        tell(text);
}

void SessionActor::tell(const std::string& text) {
    auto& out = push<TerminalOutputEvent>(_terminal.id());
    out.text = text;
}

void SessionActor::armWatchdog() {
    const auto self = handle();
    const auto dispatch = _dispatches;
    qb::io::async::callback([this, self, dispatch]() {
        if (self.alive())
            onTimeout(dispatch);
    }, _world->config.request_timeout);
}

} // namespace mud
