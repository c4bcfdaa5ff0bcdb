#define BOOST_TEST_MODULE CrashContainmentTests
#include <boost/test/unit_test.hpp>

#include <algorithm>

#include "../server/LivingActor.h"
#include "TestSupport.h"

using namespace mud;
using test::Scenario;

namespace {

const char* SQUARE = R"({"title": "Town Square", "desc": "A square.",
    "exits": [{"dir": "east", "to": "chapel"}],
    "objects": [{"name": "pebble", "desc": "Grey."}]})";

const char* CHAPEL = R"({"title": "Chapel", "desc": "Quiet.", "exits": [["west", "square"]]})";

struct WorldFixture {
    test::TempDataDir data;
    std::shared_ptr<World> world = test::makeWorld();
    std::shared_ptr<Scenario::Outcome> outcome = std::make_shared<Scenario::Outcome>();
    qb::Main engine;

    WorldFixture() {
        data.writeRoom("square", SQUARE);
        data.writeRoom("chapel", CHAPEL);
    }

    void run(Scenario::Script script) {
        test::addWorldActors(engine, *world, std::make_shared<FileRoomStore>(data.path()));
        engine.addActor<Scenario>(0, world, outcome, std::move(script));
        test::run(engine);
        BOOST_REQUIRE(outcome->completed);
    }

    std::size_t count(const std::string& needle) const {
        return std::count_if(outcome->output.begin(), outcome->output.end(),
                             [&](const std::string& line) { return line.find(needle) != std::string::npos; });
    }
};

LivingActor* spawnLiving(Scenario& s, const std::string& name) {
    return s.spawn<LivingActor>(name, s.handle(), s.id(), RoomId{"square"}, s.worldPtr());
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(RoomOccupantTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestCrashedOccupantIsRemoved)
{
    ActorHandle alice;
    ActorHandle bob;
    ActorHandle room_before;
    ActorHandle room_after;
    RoomView view;
    std::optional<ExitReason> alice_down;

    run([&](Scenario& s) {
        s.then([&] {
            alice = spawnLiving(s, "alice")->handle();
            s.watch(alice);
        });
        s.waitFor([&] { return s.moves(alice.id()) == 1; });
        s.then([&] { bob = spawnLiving(s, "bob")->handle(); });
        s.waitFor([&] { return s.moves(bob.id()) == 1; });
        s.then([&] {
            room_before = *s.world().rooms->findLive("square");
            s.crash(alice.id());
        });
        s.waitFor([&] { return s.saw("alice disappears."); });
        s.then([&] {
            alice_down = s.downReason(alice.id());
            room_after = *s.world().rooms->findLive("square");
            s.describe(room_after, [&](const RoomView& described) { view = described; });
        });
        s.waitFor([&] { return !view.id.empty(); });
    });

    BOOST_REQUIRE(alice_down.has_value());
    BOOST_CHECK(*alice_down == ExitReason::Crashed);
    BOOST_CHECK(room_after == room_before);
    BOOST_CHECK((view.occupants == std::vector<std::string>{"bob"}));
    BOOST_CHECK_EQUAL(count("bob arrives."), 1u);
    BOOST_CHECK_EQUAL(count("alice disappears."), 1u);
}

BOOST_AUTO_TEST_CASE(TestOccupantGoneWithoutDownIsDropped)
{
    ActorHandle bob;
    RoomView view;
    auto lifeline = std::make_shared<const Lifeline>();

    run([&](Scenario& s) {
        s.then([&] { bob = spawnLiving(s, "bob")->handle(); });
        s.waitFor([&] { return s.moves(bob.id()) == 1; });
        s.then([&] { s.enterAs(*s.world().rooms->findLive("square"), ActorHandle{s.id(), lifeline}, "ghost"); });
        s.waitFor([&] { return s.saw("ghost arrives."); });
        // the ghost's token expires, but the room is never sent a DownEvent
        s.then([&] {
            lifeline.reset();
            s.describe(*s.world().rooms->findLive("square"), [&](const RoomView& described) { view = described; });
        });
        s.waitFor([&] { return !view.id.empty() && s.saw("ghost disappears."); });
    });

    BOOST_CHECK((view.occupants == std::vector<std::string>{"bob"}));
    BOOST_CHECK_EQUAL(count("ghost disappears."), 1u);
}

BOOST_AUTO_TEST_CASE(TestLivingSurvivesRoomCrash)
{
    ActorHandle alice;
    ActorHandle room_before;
    ActorHandle room_after;
    RoomView view;

    run([&](Scenario& s) {
        s.then([&] { alice = spawnLiving(s, "alice")->handle(); });
        s.waitFor([&] { return s.moves(alice.id()) == 1; });
        s.then([&] {
            room_before = *s.world().rooms->findLive("square");
            s.crash(room_before.id());
        });
        // the living re-enters a fresh instance of its room
        s.waitFor([&] { return s.moves(alice.id()) == 2; });
        s.then([&] {
            room_after = *s.world().rooms->findLive("square");
            s.describe(room_after, [&](const RoomView& described) { view = described; });
        });
        s.waitFor([&] { return !view.id.empty(); });
    });

    BOOST_CHECK(room_after != room_before);
    BOOST_CHECK(!room_before.alive());
    BOOST_CHECK_EQUAL(count("The world flickers around you."), 1u);
    BOOST_CHECK((view.occupants == std::vector<std::string>{"alice"}));
    BOOST_CHECK_EQUAL(view.objects.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestMoveDuringReplacementEndsInOneRoom)
{
    ActorHandle alice;
    ActorHandle chapel;
    std::optional<bool> moved;
    RoomId moved_to;
    RoomView square_view;
    RoomView chapel_view;

    run([&](Scenario& s) {
        s.then([&] {
            alice = spawnLiving(s, "alice")->handle();
            s.getRoom("chapel", [&](RoomStatus, const ActorHandle& room) { chapel = room; });
        });
        s.waitFor([&] { return s.moves(alice.id()) == 1 && chapel.valid(); });
        // the move races the living's own re-placement into a fresh square
        s.then([&] {
            s.crash(s.world().rooms->findLive("square")->id());
            s.move(alice.id(), chapel, [&](const MoveLivingReply& reply) {
                moved = reply.moved;
                moved_to = reply.view.id;
            });
        });
        s.waitFor([&] { return moved.has_value(); });
        s.waitSeconds(0.3);
        s.then([&] {
            s.getRoom("square", [&](RoomStatus, const ActorHandle& room) {
                s.describe(room, [&](const RoomView& described) { square_view = described; });
            });
            s.describe(chapel, [&](const RoomView& described) { chapel_view = described; });
        });
        s.waitFor([&] { return !square_view.id.empty() && !chapel_view.id.empty(); });
    });

    BOOST_REQUIRE(moved.has_value());
    BOOST_CHECK(*moved);
    BOOST_CHECK_EQUAL(moved_to, "chapel");
    BOOST_CHECK((chapel_view.occupants == std::vector<std::string>{"alice"}));
    BOOST_CHECK(square_view.occupants.empty());
}

BOOST_AUTO_TEST_CASE(TestLivingWithoutAnyRoomGivesUp)
{
    std::optional<bool> ready;
    ActorHandle ghost;

    world->config.start_room = "nowhere";
    run([&](Scenario& s) {
        s.then([&] {
            auto living = s.spawn<LivingActor>(std::string("ghost"), s.handle(), s.id(), RoomId{"nowhere"},
                                               s.worldPtr());
            ghost = living->handle();
            s.watch(ghost);
        });
        s.waitFor([&] { return s.ready(ghost.id()).has_value() && s.downReason(ghost.id()).has_value(); });
        s.then([&] { ready = s.ready(ghost.id()); });
    });

    BOOST_REQUIRE(ready.has_value());
    BOOST_CHECK(!*ready);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GameRegistryCrashTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestCrashedUserLeavesOnlyItsName)
{
    qb::ActorId bob;

    run([&](Scenario& s) {
        s.then([&] {
            const auto game = s.world().game;
            s.spawn<test::FakeUser>(std::string("alice"), game, s.id());
            bob = s.spawn<test::FakeUser>(std::string("bob"), game, s.id())->id();
            s.spawn<test::FakeUser>(std::string("carol"), game, s.id());
        });
        s.waitForWho({"alice", "bob", "carol"});
        s.then([&] { s.crash(bob); });
        s.waitForWho({"alice", "carol"});
        s.waitFor([&] { return s.count("has left the game.") == 2; });
    });

    BOOST_CHECK_EQUAL(count("alice heard: bob has left the game."), 1u);
    BOOST_CHECK_EQUAL(count("carol heard: bob has left the game."), 1u);
    BOOST_CHECK_EQUAL(count("bob heard: bob has left"), 0u);
}

BOOST_AUTO_TEST_CASE(TestNameInUseUntilHolderDies)
{
    qb::ActorId alice;

    run([&](Scenario& s) {
        s.then([&] { alice = s.spawn<test::FakeUser>(std::string("alice"), s.world().game, s.id())->id(); });
        s.waitFor([&] { return s.saw("registered alice"); });
        s.then([&] { s.spawn<test::FakeUser>(std::string("alice"), s.world().game, s.id()); });
        s.waitFor([&] { return s.saw("refused alice"); });
        s.then([&] { s.crash(alice); });
        s.waitForWho({});
        s.then([&] { s.spawn<test::FakeUser>(std::string("alice"), s.world().game, s.id()); });
        s.waitFor([&] { return s.count("registered alice") == 2; });
    });

    BOOST_CHECK_EQUAL(count("refused alice"), 1u);
    BOOST_CHECK_EQUAL(count("registered alice"), 2u);
}

BOOST_AUTO_TEST_SUITE_END()
