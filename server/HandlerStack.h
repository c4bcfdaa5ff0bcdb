/**
 * @file server/HandlerStack.h
 * @brief The session's stack of command handlers.
 *
 * @details
 * The bottom frame (the login handler) is fixed for the lifetime of the
 * session: `pop()` never removes it and `reset()` returns to it.
 */

#pragma once

#include <vector>
#include "../shared/Handler.h"

namespace mud {

class HandlerStack {
    std::vector<HandlerFrame> _frames;

public:
    explicit HandlerStack(HandlerFrame base);

    void push(HandlerFrame frame);
    /// @return false if only the base frame is left
    bool pop();
    /// Replaces the top frame; replacing the base frame pushes instead.
    void replace(HandlerFrame frame);
    /// Drops everything above the base frame.
    void reset();

    const HandlerFrame& top() const { return _frames.back(); }
    const HandlerFrame& base() const { return _frames.front(); }
    std::size_t size() const { return _frames.size(); }

    /// Points every frame belonging to @p user at @p living.
    std::size_t rebindLiving(qb::ActorId user, const ActorHandle& living);

    /// True if any frame belongs to @p user.
    bool references(qb::ActorId user) const;
};

} // namespace mud
