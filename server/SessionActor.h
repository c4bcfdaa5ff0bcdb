/**
 * @file server/SessionActor.h
 * @brief Per-connection handler stack and strict FIFO command dispatch.
 *
 * @details
 * The session never interprets input. Each `InputLineEvent` from the
 * connection is handed, together with the top `HandlerFrame`, to a fresh
 * `RequestActor`. At most one request is in flight; lines arriving meanwhile
 * wait in a bounded queue. The request's `DownEvent` is the signal to send
 * the prompt and dispatch the next line.
 *
 * Watchdog: every dispatch arms a one-shot `qb::io::async::callback` for
 * `request_timeout` seconds. If that request is still the one in flight when
 * it fires, it is sent a `CrashEvent`, unlinked, and the session moves on.
 * The callback holds the session's handle and does nothing once the session
 * has terminated.
 *
 * Selective recovery: when the session absorbs the death of its user it
 * resets the stack to the login frame and asks the player to log in again.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include "HandlerStack.h"
#include "LinkedActor.h"
#include "World.h"

namespace mud {

class SessionActor : public LinkedActor {
    ActorHandle _terminal;
    WorldPtr _world;
    HandlerStack _stack;

    std::deque<std::string> _queue;
    qb::ActorId _inflight{};
    bool _busy = false;
    uint64_t _dispatches = 0;

public:
    SessionActor(ActorHandle terminal, WorldPtr world, HandlerFrame base);

    bool onInit() override;

    void on(InputLineEvent& event);
    void on(HandlerStackEvent& event);
    void on(RebindLivingEvent& event);

protected:
    void onPeerDown(qb::ActorId peer, ExitReason reason, const std::string& detail) override;
    void onTerminate(ExitReason reason) override;

private:
    void dispatch(std::string line);
    void finishRequest();
    void next();
    void prompt();
    void tell(const std::string& text);
    void armWatchdog();
    void onTimeout(uint64_t dispatch);
};

} // namespace mud
