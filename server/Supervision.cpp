/**
 * @file server/Supervision.cpp
 * @brief Link table bookkeeping and the down reaction.
 */

#include "Supervision.h"

namespace mud {

void SupervisionTable::add(const ActorHandle& peer, LinkPolicy policy) {
    _links[peer.id()] = LinkRecord{peer, policy};
}

std::optional<LinkRecord> SupervisionTable::remove(qb::ActorId peer) {
    auto it = _links.find(peer);
    if (it == _links.end())
        return std::nullopt;
    LinkRecord record = it->second;
    _links.erase(it);
    return record;
}

std::vector<ActorHandle> SupervisionTable::peers() const {
    std::vector<ActorHandle> result;
    result.reserve(_links.size());
    for (const auto& [id, record] : _links)
        result.push_back(record.peer);
    return result;
}

std::vector<qb::ActorId> SupervisionTable::pruneDead() {
    std::vector<qb::ActorId> removed;
    for (auto it = _links.begin(); it != _links.end();) {
        if (!it->second.peer.alive()) {
            removed.push_back(it->first);
            it = _links.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

DownReaction reactToDown(LinkPolicy policy, ExitReason peer_reason) {
    if (policy == LinkPolicy::Absorb)
        return DownReaction{false, peer_reason};
    return DownReaction{true, peer_reason};
}

} // namespace mud
