/**
 * @file shared/Events.h
 * @brief Every `qb::Event` exchanged between mudcore actors.
 *
 * @details
 * Events are grouped by the actor that consumes them:
 * - Supervision (`LinkEvent`, `UnlinkEvent`, `DownEvent`, `CrashEvent`):
 *   handled by every `LinkedActor`.
 * - Room manager (`GetRoomRequest`, `NewRoomRequest`, `RoomStatsRequest`).
 * - Room (`AddExitEvent` ... `RoomSayRequest`).
 * - Living, User, Game registry, Session and Connection.
 *
 * Request/response pairs carry a `ref` chosen by the requester; the reply is
 * pushed back to `getSource()` with the same `ref`. Replies are matched with
 * `PendingReplies`.
 */

#pragma once

#include <qb/event.h>
#include <qb/io/tcp/socket.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ActorHandle.h"
#include "Handler.h"
#include "Types.h"

namespace mud {

/// Base of every request and reply event.
struct RefEvent : public qb::Event {
    uint64_t ref = 0;
};

// ---------------------------------------------------------------------------
// Supervision
// ---------------------------------------------------------------------------

/**
 * @brief Asks the receiver to record a link back to the sender
 *
 * `policy` is what the receiver applies when the sender goes down.
 */
struct LinkEvent : public qb::Event {
    ActorHandle peer;
    LinkPolicy policy = LinkPolicy::Propagate;
};

/// Removes the sender from the receiver's links.
struct UnlinkEvent : public qb::Event {};

/**
 * @brief Sent to every linked peer when an actor terminates
 *
 * The sender (`getSource()`) is the actor that went down.
 */
struct DownEvent : public qb::Event {
    ExitReason reason = ExitReason::Normal;
    std::string detail;
};

/// Forces the receiver to terminate abnormally (watchdog, fault injection).
struct CrashEvent : public qb::Event {
    std::string reason;
};

// ---------------------------------------------------------------------------
// Room manager
// ---------------------------------------------------------------------------

struct GetRoomRequest : public RefEvent {
    RoomId room;
};

struct NewRoomRequest : public RefEvent {
    RoomId room;
};

struct RoomReply : public RefEvent {
    RoomId room;
    RoomStatus status = RoomStatus::NotFound;
    ActorHandle handle;
};

struct RoomStatsRequest : public RefEvent {};

struct RoomStatsReply : public RefEvent {
    std::size_t loads = 0;     ///< disk loads attempted
    std::size_t failures = 0;  ///< disk loads that failed
    std::size_t spawned = 0;   ///< room actors created
    std::size_t indexed = 0;   ///< entries in the index
};

// ---------------------------------------------------------------------------
// Room
// ---------------------------------------------------------------------------

struct AddExitEvent : public qb::Event {
    Exit exit;
};

struct AddObjectEvent : public qb::Event {
    ObjectRecord object;
};

struct AddResetEvent : public qb::Event {
    ResetSpec reset;
};

struct SetLongEvent : public qb::Event {
    std::optional<std::string> text;
};

/// Re-creates reset objects that are no longer in the room.
struct ResetRoomEvent : public qb::Event {};

/**
 * @brief A living steps into the room
 *
 * The room links the living (both sides absorb) and replies with a view.
 */
struct EnterRoomRequest : public RefEvent {
    ActorHandle living;
    std::string name;
};

struct EnterRoomReply : public RefEvent {
    RoomView view;
};

/// The sender leaves the room.
struct LeaveRoomEvent : public qb::Event {};

struct DescribeRoomRequest : public RefEvent {};

struct DescribeRoomReply : public RefEvent {
    RoomView view;
};

struct RoomNameRequest : public RefEvent {};

struct RoomNameReply : public RefEvent {
    RoomId name;
};

struct RoomTakeRequest : public RefEvent {
    std::string name;
};

struct RoomTakeReply : public RefEvent {
    TransferStatus status = TransferStatus::NotFound;
    ObjectRecord object;
};

struct RoomDropRequest : public RefEvent {
    ObjectRecord object;
};

struct RoomDropReply : public RefEvent {};

struct RoomSayRequest : public RefEvent {
    std::string speaker;
    std::string text;
};

struct RoomSayReply : public RefEvent {};

/// Text the room shows its occupants (arrivals, departures, speech).
struct RoomMessageEvent : public qb::Event {
    std::string text;
};

// ---------------------------------------------------------------------------
// Living
// ---------------------------------------------------------------------------

struct LivingStateRequest : public RefEvent {};

struct LivingStateReply : public RefEvent {
    LivingState state;
};

struct MoveLivingRequest : public RefEvent {
    ActorHandle room;
};

struct MoveLivingReply : public RefEvent {
    bool moved = false;
    RoomView view;
};

struct TakeObjectRequest : public RefEvent {
    std::string name;
};

struct DropObjectRequest : public RefEvent {
    std::string name;
};

struct ObjectTransferReply : public RefEvent {
    TransferStatus status = TransferStatus::NotFound;
    ObjectRecord object;
};

struct SayRequest : public RefEvent {
    std::string text;
};

struct SayReply : public RefEvent {};

/// Living -> User: the living has (or failed to) set foot in its first room.
struct LivingReadyEvent : public qb::Event {
    bool ok = false;
    RoomId room;
    std::string detail;
};

/// Living -> User: the living now stands in `room`.
struct LivingMovedEvent : public qb::Event {
    RoomId room;
};

// ---------------------------------------------------------------------------
// User and game registry
// ---------------------------------------------------------------------------

struct RegisterUserRequest : public RefEvent {
    std::string username;
    ActorHandle user;
};

struct RegisterUserReply : public RefEvent {
    bool ok = false;
};

struct WhoRequest : public RefEvent {};

struct WhoReply : public RefEvent {
    std::vector<std::string> names;
};

/// Game -> every registered user except `except`.
struct BroadcastEvent : public qb::Event {
    std::string text;
    qb::ActorId except{};
};

/// Text for the player behind a user.
struct UserMessageEvent : public qb::Event {
    std::string text;
};

/// User -> request that spawned it: outcome of the login.
struct LoginReply : public RefEvent {
    LoginResult result;
};

struct LogoutRequest : public RefEvent {};

struct LogoutReply : public RefEvent {};

/// User -> session: the user's living has been replaced.
struct RebindLivingEvent : public qb::Event {
    ActorHandle living;
};

// ---------------------------------------------------------------------------
// Session and connection
// ---------------------------------------------------------------------------

/// Connection -> session: one decoded input line.
struct InputLineEvent : public qb::Event {
    std::string text;
};

/// Anyone -> connection: one line of output.
struct TerminalOutputEvent : public qb::Event {
    std::string text;
};

/// Asks the connection to close the socket.
struct CloseTerminalEvent : public qb::Event {};

enum class StackOp : uint8_t { Push, Pop, Replace, Reset };

/// Request -> session: handler stack manipulation.
struct HandlerStackEvent : public qb::Event {
    StackOp op = StackOp::Push;
    HandlerFrame frame;
};

/// Acceptor -> gateway: a freshly accepted socket.
struct NewConnectionEvent : public qb::Event {
    qb::io::tcp::socket socket;
};

} // namespace mud
