/**
 * @file server/RequestActor.cpp
 * @brief Handler execution and the asynchronous queries handlers issue.
 */

#include "RequestActor.h"
#include "UserActor.h"

namespace mud {

RequestActor::RequestActor(HandlerFrame frame, std::string line, ActorHandle session, qb::ActorId terminal,
                           WorldPtr world)
    : _frame(std::move(frame))
    , _line(std::move(line))
    , _session(std::move(session))
    , _terminal(terminal)
    , _world(std::move(world))
    , _rooms(*this, _world->rooms, _world->room_manager) {}

bool RequestActor::onInit() {
    registerEvent<RoomReply>(*this);
    registerEvent<DescribeRoomReply>(*this);
    registerEvent<LivingStateReply>(*this);
    registerEvent<MoveLivingReply>(*this);
    registerEvent<ObjectTransferReply>(*this);
    registerEvent<SayReply>(*this);
    registerEvent<WhoReply>(*this);
    registerEvent<LoginReply>(*this);
    registerEvent<LogoutReply>(*this);

    // linked before the handler runs, so even a synchronous crash reaches the session
    link(_session, LinkPolicy::Propagate, LinkPolicy::Absorb);

    if (!_frame.handler) {
        terminate(ExitReason::Crashed, "no handler");
        return true;
    }
    guarded([this] { _frame.handler->handle(*this, _line); });
    return true;
}

const char* RequestActor::handlerName() const {
    return _frame.handler ? _frame.handler->name() : "<none>";
}

void RequestActor::on(RoomReply& reply) {
    guarded([&] { _rooms.on(reply); });
}

void RequestActor::on(DescribeRoomReply& reply) {
    guarded([&] { _describes.resolve(reply); });
}

void RequestActor::on(LivingStateReply& reply) {
    guarded([&] { _states.resolve(reply); });
}

void RequestActor::on(MoveLivingReply& reply) {
    guarded([&] { _moves.resolve(reply); });
}

void RequestActor::on(ObjectTransferReply& reply) {
    guarded([&] { _transfers.resolve(reply); });
}

void RequestActor::on(SayReply& reply) {
    guarded([&] { _says.resolve(reply); });
}

void RequestActor::on(WhoReply& reply) {
    guarded([&] { _whos.resolve(reply); });
}

void RequestActor::on(LoginReply& reply) {
    guarded([&] { _logins.resolve(reply); });
}

void RequestActor::on(LogoutReply& reply) {
    guarded([&] { _logouts.resolve(reply); });
}

void RequestActor::send(const std::string& text) {
    auto& out = push<TerminalOutputEvent>(_terminal);
    out.text = text;
}

void RequestActor::stackOp(StackOp op, HandlerFrame frame) {
    auto& evt = push<HandlerStackEvent>(_session.id());
    evt.op = op;
    evt.frame = std::move(frame);
}

void RequestActor::pushHandler(HandlerFrame frame) {
    stackOp(StackOp::Push, std::move(frame));
}

void RequestActor::popHandler() {
    stackOp(StackOp::Pop, HandlerFrame{});
}

void RequestActor::replaceHandler(HandlerFrame frame) {
    stackOp(StackOp::Replace, std::move(frame));
}

void RequestActor::getRoom(const RoomId& id, std::function<void(RoomStatus, const ActorHandle&)> cb) {
    _rooms.getRoom(id, std::move(cb));
}

void RequestActor::newRoom(const RoomId& id, std::function<void(RoomStatus, const ActorHandle&)> cb) {
    _rooms.newRoom(id, std::move(cb));
}

void RequestActor::lookRoom(const RoomId& id, std::function<void(RoomStatus, const RoomView&)> cb) {
    _rooms.getRoom(id, [this, cb = std::move(cb)](RoomStatus status, const ActorHandle& room) {
        if (status != RoomStatus::Ok) {
            cb(status, RoomView{});
            return;
        }
        auto ref = _describes.expect([cb](DescribeRoomReply& reply) { cb(RoomStatus::Ok, reply.view); });
        auto& request = push<DescribeRoomRequest>(room.id());
        request.ref = ref;
    });
}

void RequestActor::queryLiving(std::function<void(const LivingState&)> cb) {
    if (!args().living.alive()) {
        cb(LivingState{});
        return;
    }
    auto ref = _states.expect([cb = std::move(cb)](LivingStateReply& reply) { cb(reply.state); });
    auto& request = push<LivingStateRequest>(args().living.id());
    request.ref = ref;
}

void RequestActor::moveLiving(const RoomId& destination, std::function<void(const MoveResult&)> cb) {
    _rooms.getRoom(destination, [this, cb = std::move(cb)](RoomStatus status, const ActorHandle& room) {
        if (status != RoomStatus::Ok || !args().living.alive()) {
            MoveResult result;
            result.status = status;
            cb(result);
            return;
        }
        auto ref = _moves.expect([cb](MoveLivingReply& reply) {
            MoveResult result;
            result.status = RoomStatus::Ok;
            result.moved = reply.moved;
            result.view = reply.view;
            cb(result);
        });
        auto& request = push<MoveLivingRequest>(args().living.id());
        request.ref = ref;
        request.room = room;
    });
}

void RequestActor::takeObject(const std::string& name, std::function<void(TransferStatus, const ObjectRecord&)> cb) {
    if (!args().living.alive()) {
        cb(TransferStatus::NoRoom, ObjectRecord{});
        return;
    }
    auto ref = _transfers.expect([cb = std::move(cb)](ObjectTransferReply& reply) { cb(reply.status, reply.object); });
    auto& request = push<TakeObjectRequest>(args().living.id());
    request.ref = ref;
    request.name = name;
}

void RequestActor::dropObject(const std::string& name, std::function<void(TransferStatus, const ObjectRecord&)> cb) {
    if (!args().living.alive()) {
        cb(TransferStatus::NoRoom, ObjectRecord{});
        return;
    }
    auto ref = _transfers.expect([cb = std::move(cb)](ObjectTransferReply& reply) { cb(reply.status, reply.object); });
    auto& request = push<DropObjectRequest>(args().living.id());
    request.ref = ref;
    request.name = name;
}

void RequestActor::say(const std::string& text, std::function<void()> cb) {
    if (!args().living.alive()) {
        cb();
        return;
    }
    auto ref = _says.expect([cb = std::move(cb)](SayReply&) { cb(); });
    auto& request = push<SayRequest>(args().living.id());
    request.ref = ref;
    request.text = text;
}

void RequestActor::who(std::function<void(const std::vector<std::string>&)> cb) {
    auto ref = _whos.expect([cb = std::move(cb)](WhoReply& reply) { cb(reply.names); });
    auto& request = push<WhoRequest>(_world->game);
    request.ref = ref;
}

void RequestActor::shout(const std::string& text) {
    auto& event = push<BroadcastEvent>(_world->game);
    event.text = args().username + " shouts: " + text;
    event.except = args().user.id();
}

void RequestActor::startUser(const std::string& username, std::function<void(const LoginResult&)> cb) {
    auto ref = _logins.expect([cb](LoginReply& reply) { cb(reply.result); });

    LoginTicket ticket;
    ticket.requester = handle();
    ticket.ref = ref;
    ticket.session = _session;
    ticket.terminal = _terminal;
    if (!addRefActor<UserActor>(username, ticket, _world)) {
        _logins.clear();
        LoginResult failed;
        failed.reason = "The game could not start your account.";
        cb(failed);
    }
}

void RequestActor::logout(std::function<void()> cb) {
    if (!args().user.alive()) {
        cb();
        return;
    }
    auto ref = _logouts.expect([cb = std::move(cb)](LogoutReply&) { cb(); });
    auto& request = push<LogoutRequest>(args().user.id());
    request.ref = ref;
}

void RequestActor::disconnect() {
    push<CloseTerminalEvent>(_terminal);
}

void RequestActor::done() {
    terminate(ExitReason::Normal);
}

void RequestActor::onTerminate(ExitReason reason) {
    if (reason == ExitReason::Crashed)
        qb::io::cout() << "[Request] '" << _line << "' crashed" << std::endl;
}

} // namespace mud
