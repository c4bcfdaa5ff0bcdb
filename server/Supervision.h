/**
 * @file server/Supervision.h
 * @brief Explicit link records and the reaction to a linked peer going down.
 *
 * @details
 * qb actors have no built-in links or monitors. Every `LinkedActor` keeps a
 * `SupervisionTable`: one record per linked peer, tagged with the policy the
 * owner applies when that peer terminates. On a `DownEvent` the owner looks
 * the sender up and dispatches on the policy:
 * - `Propagate`: the owner terminates too, carrying the peer's exit reason.
 * - `Absorb`: the owner keeps running and repairs its own bookkeeping.
 *
 * Downs from peers that are not (or no longer) in the table are ignored.
 */

#pragma once

#include <optional>
#include <unordered_map>
#include <vector>
#include "../shared/ActorHandle.h"
#include "../shared/Types.h"

namespace mud {

struct LinkRecord {
    ActorHandle peer;
    LinkPolicy policy = LinkPolicy::Propagate;
};

class SupervisionTable {
    std::unordered_map<qb::ActorId, LinkRecord> _links;

public:
    /// Adds or re-tags the link to @p peer.
    void add(const ActorHandle& peer, LinkPolicy policy);

    /// @return the removed record, or nullopt if @p peer was not linked
    std::optional<LinkRecord> remove(qb::ActorId peer);

    std::size_t size() const { return _links.size(); }
    bool empty() const { return _links.empty(); }

    std::vector<ActorHandle> peers() const;

    /// Drops every record whose peer is no longer alive; returns their ids.
    std::vector<qb::ActorId> pruneDead();

    void clear() { _links.clear(); }
};

/**
 * @brief What the owner of a link does when the peer exits
 */
struct DownReaction {
    bool terminate = false;
    ExitReason reason = ExitReason::Normal;  ///< own exit reason when terminating
};

/**
 * @brief Maps a peer exit onto the owner's reaction
 *
 * `Absorb` never terminates. `Propagate` terminates with the peer's reason,
 * so a crash anywhere in a fate-sharing chain is reported as a crash by
 * every member while a clean disconnect stays clean.
 */
DownReaction reactToDown(LinkPolicy policy, ExitReason peer_reason);

} // namespace mud
