/**
 * @file server/LinkedActor.h
 * @brief Base class giving qb actors links, exit reasons and a liveness token.
 *
 * @details
 * `LinkedActor` is the supervision layer of mudcore. It registers the
 * supervision events in its constructor, so derived actors only register
 * their own events in `onInit()`.
 *
 * Lifecycle:
 * 1. The actor owns a `Lifeline`; `handle()` hands out weak references to it.
 * 2. `link(peer, mine, theirs)` records the peer locally with policy `mine`
 *    and asks the peer (via `LinkEvent`) to record us with policy `theirs`.
 *    Linking to a peer that is already gone behaves as if the peer had just
 *    exited normally.
 * 3. `terminate(reason)` runs `onTerminate()`, sends a `DownEvent` to every
 *    linked peer, drops the lifeline and kills the actor. It is idempotent.
 * 4. A `DownEvent` from a linked peer is dispatched through `reactToDown()`:
 *    absorbed downs call `onPeerDown()`, propagated downs terminate.
 *
 * `qb::KillEvent` terminates with `ExitReason::Shutdown`; `CrashEvent`
 * terminates with `ExitReason::Crashed`.
 */

#pragma once

#include <qb/actor.h>
#include <memory>
#include <string>
#include <vector>
#include "../shared/ActorHandle.h"
#include "../shared/Events.h"
#include "Supervision.h"

namespace mud {

class LinkedActor : public qb::Actor {
    SupervisionTable _links;
    std::shared_ptr<const Lifeline> _lifeline;
    bool _terminating = false;

public:
    LinkedActor();

    /// Handle to this actor; stops being alive once it terminates.
    ActorHandle handle() const;

    void on(LinkEvent& evt);
    void on(UnlinkEvent& evt);
    void on(DownEvent& evt);
    void on(CrashEvent& evt);
    void on(qb::KillEvent& evt);

protected:
    void link(const ActorHandle& peer, LinkPolicy mine, LinkPolicy theirs);
    void unlink(qb::ActorId peer);
    void terminate(ExitReason reason, const std::string& detail = {});

    bool terminating() const { return _terminating; }
    const SupervisionTable& links() const { return _links; }
    /// Forgets peers that died without their DownEvent reaching us.
    std::vector<qb::ActorId> pruneDeadLinks() { return _links.pruneDead(); }

    /// A linked peer with policy `Absorb` went down.
    virtual void onPeerDown(qb::ActorId peer, ExitReason reason, const std::string& detail);

    /// Called once, before peers are notified.
    virtual void onTerminate(ExitReason reason);

private:
    void handleDown(qb::ActorId peer, ExitReason reason, const std::string& detail);
};

} // namespace mud
