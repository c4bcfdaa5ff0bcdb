/**
 * @file server/RequestActor.h
 * @brief One-shot actor running a single input line through a handler.
 *
 * @details
 * The session spawns one `RequestActor` per input line. In `onInit()` the
 * request links itself to the session (session absorbs, request propagates)
 * and calls `Handler::handle()` of the frame it was given. It then lives only
 * as long as the handler has queries outstanding; `done()` terminates it
 * normally, which is the session's signal to move on to the next line.
 *
 * Any `std::exception` escaping the handler or one of its callbacks
 * terminates the request with `ExitReason::Crashed`. The session absorbs that
 * and tells the player.
 */

#pragma once

#include <string>
#include "../shared/Handler.h"
#include "LinkedActor.h"
#include "PendingReplies.h"
#include "RoomDirectory.h"
#include "World.h"

namespace mud {

class RequestActor : public LinkedActor, public RequestContext {
    HandlerFrame _frame;
    std::string _line;
    ActorHandle _session;
    qb::ActorId _terminal;
    WorldPtr _world;
    RoomDirectory _rooms;

    PendingReplies<DescribeRoomReply> _describes;
    PendingReplies<LivingStateReply> _states;
    PendingReplies<MoveLivingReply> _moves;
    PendingReplies<ObjectTransferReply> _transfers;
    PendingReplies<SayReply> _says;
    PendingReplies<WhoReply> _whos;
    PendingReplies<LoginReply> _logins;
    PendingReplies<LogoutReply> _logouts;

public:
    RequestActor(HandlerFrame frame, std::string line, ActorHandle session, qb::ActorId terminal, WorldPtr world);

    bool onInit() override;

    void on(RoomReply& reply);
    void on(DescribeRoomReply& reply);
    void on(LivingStateReply& reply);
    void on(MoveLivingReply& reply);
    void on(ObjectTransferReply& reply);
    void on(SayReply& reply);
    void on(WhoReply& reply);
    void on(LoginReply& reply);
    void on(LogoutReply& reply);

    // RequestContext
    const HandlerArgs& args() const override { return _frame.args; }
    const World& world() const override { return *_world; }

    void send(const std::string& text) override;

    void pushHandler(HandlerFrame frame) override;
    void popHandler() override;
    void replaceHandler(HandlerFrame frame) override;

    void getRoom(const RoomId& id, std::function<void(RoomStatus, const ActorHandle&)> cb) override;
    void newRoom(const RoomId& id, std::function<void(RoomStatus, const ActorHandle&)> cb) override;
    void lookRoom(const RoomId& id, std::function<void(RoomStatus, const RoomView&)> cb) override;

    void queryLiving(std::function<void(const LivingState&)> cb) override;
    void moveLiving(const RoomId& destination, std::function<void(const MoveResult&)> cb) override;
    void takeObject(const std::string& name, std::function<void(TransferStatus, const ObjectRecord&)> cb) override;
    void dropObject(const std::string& name, std::function<void(TransferStatus, const ObjectRecord&)> cb) override;
    void say(const std::string& text, std::function<void()> cb) override;

    void who(std::function<void(const std::vector<std::string>&)> cb) override;
    void shout(const std::string& text) override;
    void startUser(const std::string& username, std::function<void(const LoginResult&)> cb) override;
    void logout(std::function<void()> cb) override;

    void disconnect() override;
    void done() override;

protected:
    void onTerminate(ExitReason reason) override;

private:
    /// Runs @p fn, turning an escaping exception into a crash of this request.
    template <typename Fn>
    void guarded(Fn&& fn) {
        if (terminating())
            return;
        try {
            fn();
        } catch (const std::exception& e) {
            qb::io::cerr() << "[Request] handler " << handlerName() << " failed on '" << _line
                           << "': " << e.what() << std::endl;
            terminate(ExitReason::Crashed, e.what());
        }
    }

    const char* handlerName() const;
    void stackOp(StackOp op, HandlerFrame frame);
};

} // namespace mud
