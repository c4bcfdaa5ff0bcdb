/**
 * @file server/PendingReplies.h
 * @brief Correlates reply events with the callbacks waiting for them.
 *
 * @details
 * Requests carry a `ref` picked by the requester. `expect()` hands out a fresh
 * ref and stores the continuation; `resolve()` runs and forgets it when the
 * reply with that ref arrives. Replies with an unknown ref are ignored, which
 * covers late replies to an actor that already gave up on a query.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>

namespace mud {

template <typename Reply>
class PendingReplies {
    std::unordered_map<uint64_t, std::function<void(Reply&)>> _waiting;
    uint64_t _next_ref;

public:
    /// Actors holding several tables of the same reply type give each its own range.
    explicit PendingReplies(uint64_t first_ref = 1) : _next_ref(first_ref) {}

    uint64_t expect(std::function<void(Reply&)> callback) {
        const uint64_t ref = _next_ref++;
        _waiting.emplace(ref, std::move(callback));
        return ref;
    }

    /// @return false if nobody was waiting for @p reply
    bool resolve(Reply& reply) {
        auto it = _waiting.find(reply.ref);
        if (it == _waiting.end())
            return false;
        auto callback = std::move(it->second);
        _waiting.erase(it);
        callback(reply);
        return true;
    }

    std::size_t size() const { return _waiting.size(); }
    bool empty() const { return _waiting.empty(); }
    void clear() { _waiting.clear(); }
};

} // namespace mud
