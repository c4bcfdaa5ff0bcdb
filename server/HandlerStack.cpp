/**
 * @file server/HandlerStack.cpp
 * @brief Handler frames of one session.
 */

#include "HandlerStack.h"

namespace mud {

HandlerStack::HandlerStack(HandlerFrame base) {
    _frames.push_back(std::move(base));
}

void HandlerStack::push(HandlerFrame frame) {
    _frames.push_back(std::move(frame));
}

bool HandlerStack::pop() {
    if (_frames.size() <= 1)
        return false;
    _frames.pop_back();
    return true;
}

void HandlerStack::replace(HandlerFrame frame) {
    if (_frames.size() <= 1) {
        push(std::move(frame));
        return;
    }
    _frames.back() = std::move(frame);
}

void HandlerStack::reset() {
    _frames.resize(1);
}

std::size_t HandlerStack::rebindLiving(qb::ActorId user, const ActorHandle& living) {
    std::size_t count = 0;
    for (auto& frame : _frames) {
        if (frame.args.user.valid() && frame.args.user.id() == user) {
            frame.args.living = living;
            ++count;
        }
    }
    return count;
}

bool HandlerStack::references(qb::ActorId user) const {
    for (const auto& frame : _frames) {
        if (frame.args.user.valid() && frame.args.user.id() == user)
            return true;
    }
    return false;
}

} // namespace mud
