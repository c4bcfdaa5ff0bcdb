/**
 * @file tests/TestSupport.cpp
 * @brief Test fixtures and the scenario actor.
 */

#include "TestSupport.h"

#include <atomic>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

#include "../server/GameActor.h"
#include "../server/RoomManagerActor.h"

namespace mud::test {

TempDataDir::TempDataDir() {
    static std::atomic<int> counter{0};
    _root = std::filesystem::temp_directory_path() /
            ("mudcore-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(_root / ROOM_DIRECTORY);
}

TempDataDir::~TempDataDir() {
    std::error_code ec;
    std::filesystem::remove_all(_root, ec);
}

void TempDataDir::writeRoom(const RoomId& id, const std::string& json) const {
    writeFile(std::string(ROOM_DIRECTORY) + "/" + id + ROOM_FILE_EXTENSION, json);
}

void TempDataDir::writeFile(const std::string& relative, const std::string& content) const {
    std::ofstream out(_root / relative, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot write " + relative);
    out << content;
}

std::optional<RoomRecord> CountingRoomStore::load(const RoomId& id) const {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_loads[id];
    }
    return _inner.load(id);
}

int CountingRoomStore::loads(const RoomId& id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _loads.find(id);
    return it == _loads.end() ? 0 : it->second;
}

std::optional<RoomRecord> SlowRoomStore::load(const RoomId& id) const {
    std::this_thread::sleep_for(_delay);
    return _inner.load(id);
}

std::shared_ptr<World> makeWorld(ServerConfig config) {
    auto world = std::make_shared<World>();
    world->config = std::move(config);
    // resets only run in the tests that ask for them
    world->config.room_reset_interval = 0;
    world->rooms = std::make_shared<RoomIndex>();
    world->accounts = std::make_shared<OpenAccountStore>();
    return world;
}

void addWorldActors(qb::Main& engine, World& world, std::shared_ptr<const RoomStore> store,
                    std::vector<RoomId> preload, qb::CoreId core) {
    world.room_manager = engine.addActor<RoomManagerActor>(core, world.rooms, std::move(store), std::move(preload),
                                                           world.config.room_reset_interval);
    world.game = engine.addActor<GameActor>(core);
}

Scenario::Scenario(WorldPtr world, std::shared_ptr<Outcome> outcome, Script script, double timeout)
    : _world(std::move(world))
    , _outcome(std::move(outcome))
    , _script(std::move(script))
    , _deadline(std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(timeout))) {}

bool Scenario::onInit() {
    registerEvent<TerminalOutputEvent>(*this);
    registerEvent<CloseTerminalEvent>(*this);
    registerEvent<RoomReply>(*this);
    registerEvent<RoomStatsReply>(*this);
    registerEvent<DescribeRoomReply>(*this);
    registerEvent<WhoReply>(*this);
    registerEvent<LivingReadyEvent>(*this);
    registerEvent<LivingMovedEvent>(*this);
    registerEvent<MoveLivingReply>(*this);
    registerEvent<EnterRoomReply>(*this);
    registerEvent<RoomTakeReply>(*this);
    registerEvent<RoomMessageEvent>(*this);

    _rooms = std::make_unique<RoomDirectory>(*this, _world->rooms, _world->room_manager);
    _script(*this);
    registerCallback(*this);
    return true;
}

void Scenario::onCallback() {
    if (_finished)
        return;
    while (!_steps.empty() && _steps.front().ready()) {
        auto step = std::move(_steps.front());
        _steps.pop_front();
        step.action();
        if (_finished)
            return;
    }
    if (_steps.empty()) {
        finish(false);
        return;
    }
    if (std::chrono::steady_clock::now() > _deadline)
        finish(true);
}

void Scenario::then(std::function<void()> action) {
    _steps.push_back(Step{[] { return true; }, std::move(action)});
}

void Scenario::waitFor(std::function<bool()> condition) {
    _steps.push_back(Step{std::move(condition), [] {}});
}

void Scenario::waitSeconds(double seconds) {
    auto until = std::make_shared<std::chrono::steady_clock::time_point>();
    const auto delay = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
    then([until, delay] { *until = std::chrono::steady_clock::now() + delay; });
    waitFor([until] { return std::chrono::steady_clock::now() >= *until; });
}

void Scenario::on(TerminalOutputEvent& event) {
    _outcome->output.push_back(event.text);
}

bool Scenario::saw(const std::string& needle) const {
    return count(needle) > 0;
}

std::size_t Scenario::count(const std::string& needle) const {
    std::size_t n = 0;
    for (const auto& line : _outcome->output) {
        if (line.find(needle) != std::string::npos)
            ++n;
    }
    return n;
}

void Scenario::startSession(HandlerFrame base) {
    auto session = addRefActor<SessionActor>(handle(), _world, std::move(base));
    if (!session)
        throw std::runtime_error("session did not start");
    _session = session->handle();
    // the session shares our fate like it would a connection's; we only observe its exit
    link(_session, LinkPolicy::Absorb, LinkPolicy::Propagate);
}

void Scenario::sendLine(const std::string& text) {
    auto& input = push<InputLineEvent>(_session.id());
    input.text = text;
}

void Scenario::getRoom(const RoomId& id, RoomDirectory::Callback callback) {
    _rooms->getRoom(id, std::move(callback));
}

void Scenario::newRoom(const RoomId& id, RoomDirectory::Callback callback) {
    _rooms->newRoom(id, std::move(callback));
}

void Scenario::getRoomFromManager(const RoomId& id, RoomDirectory::Callback callback) {
    auto ref = _raw_rooms.expect([callback = std::move(callback)](RoomReply& reply) {
        callback(reply.status, reply.handle);
    });
    auto& request = push<GetRoomRequest>(_world->room_manager);
    request.ref = ref;
    request.room = id;
}

void Scenario::on(RoomReply& reply) {
    if (!_rooms->on(reply))
        _raw_rooms.resolve(reply);
}

void Scenario::describe(const ActorHandle& room, std::function<void(const RoomView&)> callback) {
    auto ref = _describes.expect([callback = std::move(callback)](DescribeRoomReply& reply) { callback(reply.view); });
    auto& request = push<DescribeRoomRequest>(room.id());
    request.ref = ref;
}

void Scenario::stats(std::function<void(const RoomStatsReply&)> callback) {
    auto ref = _stats.expect([callback = std::move(callback)](RoomStatsReply& reply) { callback(reply); });
    auto& request = push<RoomStatsRequest>(_world->room_manager);
    request.ref = ref;
}

void Scenario::who(std::function<void(const std::vector<std::string>&)> callback) {
    auto ref = _whos.expect([callback = std::move(callback)](WhoReply& reply) { callback(reply.names); });
    auto& request = push<WhoRequest>(_world->game);
    request.ref = ref;
}

void Scenario::enterAs(const ActorHandle& room, const ActorHandle& as, const std::string& name) {
    auto& request = push<EnterRoomRequest>(room.id());
    request.living = as;
    request.name = name;
}

void Scenario::move(qb::ActorId living, const ActorHandle& room,
                    std::function<void(const MoveLivingReply&)> callback) {
    auto ref = _living_moves.expect([callback = std::move(callback)](MoveLivingReply& reply) { callback(reply); });
    auto& request = push<MoveLivingRequest>(living);
    request.ref = ref;
    request.room = room;
}

void Scenario::crash(qb::ActorId target, const std::string& reason) {
    auto& evt = push<CrashEvent>(target);
    evt.reason = reason;
}

std::optional<ExitReason> Scenario::downReason(qb::ActorId peer) const {
    auto it = _downs.find(peer);
    if (it == _downs.end())
        return std::nullopt;
    return it->second;
}

std::optional<bool> Scenario::ready(qb::ActorId living) const {
    auto it = _ready.find(living);
    if (it == _ready.end())
        return std::nullopt;
    return it->second;
}

std::size_t Scenario::moves(qb::ActorId living) const {
    auto it = _moves.find(living);
    return it == _moves.end() ? 0 : it->second;
}

void Scenario::waitForWho(std::vector<std::string> names) {
    auto seen = std::make_shared<std::vector<std::string>>();
    auto asking = std::make_shared<bool>(false);
    waitFor([this, names = std::move(names), seen, asking] {
        if (*seen == names)
            return true;
        if (!*asking) {
            *asking = true;
            who([seen, asking](const std::vector<std::string>& current) {
                *seen = current;
                *asking = false;
            });
        }
        return false;
    });
}

void Scenario::onPeerDown(qb::ActorId peer, ExitReason reason, const std::string&) {
    _downs[peer] = reason;
}

void Scenario::onTerminate(ExitReason) {
    if (!_finished) {
        _finished = true;
        unregisterCallback(*this);
    }
}

void Scenario::finish(bool timed_out) {
    if (_finished)
        return;
    _finished = true;
    unregisterCallback(*this);
    _outcome->completed = !timed_out;
    _outcome->timed_out = timed_out;
    broadcast<qb::KillEvent>();
}

bool FakeUser::onInit() {
    registerEvent<RegisterUserReply>(*this);
    registerEvent<UserMessageEvent>(*this);

    auto& request = push<RegisterUserRequest>(_game);
    request.username = _name;
    request.user = handle();
    return true;
}

void FakeUser::on(RegisterUserReply& reply) {
    tell((reply.ok ? "registered " : "refused ") + _name);
    if (!reply.ok)
        terminate(ExitReason::Normal, "name in use");
}

void FakeUser::on(UserMessageEvent& event) {
    tell(_name + " heard: " + event.text);
}

void FakeUser::tell(const std::string& text) {
    auto& out = push<TerminalOutputEvent>(_terminal);
    out.text = text;
}

} // namespace mud::test
