/**
 * @file shared/ActorHandle.h
 * @brief Actor id paired with a liveness token.
 *
 * @details
 * A qb::ActorId alone cannot tell whether the actor behind it is still
 * running; events pushed to a dead id are silently dropped. Every mudcore
 * actor therefore owns a `Lifeline` and hands out `ActorHandle`s holding a
 * weak reference to it. The lifeline is released when the actor terminates,
 * so `ActorHandle::alive()` becomes false without any message round-trip.
 *
 * The check is a `std::weak_ptr::expired()` call: non-blocking and safe from
 * any core. It is what lets room lookups skip the room manager entirely when
 * the cached handle is still good.
 */

#pragma once

#include <qb/actor.h>
#include <memory>

namespace mud {

/// Owned by an actor for as long as it runs. Carries no data.
struct Lifeline {};

class ActorHandle {
    qb::ActorId _id{};
    std::weak_ptr<const Lifeline> _token;

public:
    ActorHandle() = default;
    ActorHandle(qb::ActorId id, std::weak_ptr<const Lifeline> token)
        : _id(id), _token(std::move(token)) {}

    qb::ActorId id() const { return _id; }

    /// True while the referenced actor has not terminated.
    bool alive() const { return !_token.expired(); }

    /// True if this handle was ever bound to an actor.
    bool valid() const { return !(_id == qb::ActorId{}); }

    bool operator==(const ActorHandle& other) const { return _id == other._id; }
    bool operator!=(const ActorHandle& other) const { return !(*this == other); }
};

} // namespace mud
