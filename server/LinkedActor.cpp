/**
 * @file server/LinkedActor.cpp
 * @brief Link bookkeeping and exit signalling for every mudcore actor.
 */

#include "LinkedActor.h"

namespace mud {

LinkedActor::LinkedActor()
    : _lifeline(std::make_shared<const Lifeline>()) {
    registerEvent<LinkEvent>(*this);
    registerEvent<UnlinkEvent>(*this);
    registerEvent<DownEvent>(*this);
    registerEvent<CrashEvent>(*this);
    registerEvent<qb::KillEvent>(*this);
}

ActorHandle LinkedActor::handle() const {
    return ActorHandle{id(), _lifeline};
}

void LinkedActor::link(const ActorHandle& peer, LinkPolicy mine, LinkPolicy theirs) {
    if (_terminating)
        return;
    if (!peer.alive()) {
        // the peer can no longer send us a DownEvent
        _links.add(peer, mine);
        handleDown(peer.id(), ExitReason::Normal, "noproc");
        return;
    }
    _links.add(peer, mine);
    auto& evt = push<LinkEvent>(peer.id());
    evt.peer = handle();
    evt.policy = theirs;
}

void LinkedActor::unlink(qb::ActorId peer) {
    if (_links.remove(peer))
        push<UnlinkEvent>(peer);
}

void LinkedActor::terminate(ExitReason reason, const std::string& detail) {
    if (_terminating)
        return;
    _terminating = true;

    onTerminate(reason);

    for (const auto& peer : _links.peers()) {
        auto& down = push<DownEvent>(peer.id());
        down.reason = reason;
        down.detail = detail;
    }
    _links.clear();
    _lifeline.reset();
    kill();
}

void LinkedActor::on(LinkEvent& evt) {
    if (_terminating) {
        // we are already gone as far as the peer is concerned
        auto& down = push<DownEvent>(evt.getSource());
        down.reason = ExitReason::Normal;
        down.detail = "noproc";
        return;
    }
    _links.add(evt.peer, evt.policy);
}

void LinkedActor::on(UnlinkEvent& evt) {
    _links.remove(evt.getSource());
}

void LinkedActor::on(DownEvent& evt) {
    handleDown(evt.getSource(), evt.reason, evt.detail);
}

void LinkedActor::on(CrashEvent& evt) {
    qb::io::cerr() << "[Supervision] actor " << id() << " crashed: " << evt.reason << std::endl;
    terminate(ExitReason::Crashed, evt.reason);
}

void LinkedActor::on(qb::KillEvent&) {
    terminate(ExitReason::Shutdown, "shutdown");
}

void LinkedActor::handleDown(qb::ActorId peer, ExitReason reason, const std::string& detail) {
    if (_terminating)
        return;
    auto record = _links.remove(peer);
    if (!record)
        return;

    auto reaction = reactToDown(record->policy, reason);
    if (reaction.terminate) {
        terminate(reaction.reason, detail);
        return;
    }
    onPeerDown(peer, reason, detail);
}

void LinkedActor::onPeerDown(qb::ActorId, ExitReason, const std::string&) {}

void LinkedActor::onTerminate(ExitReason) {}

} // namespace mud
