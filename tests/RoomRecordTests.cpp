#define BOOST_TEST_MODULE RoomRecordTests
#include <boost/test/unit_test.hpp>

#include "../server/RoomStore.h"
#include "../shared/RoomRecord.h"
#include "TestSupport.h"

using namespace mud;

namespace {

const char* SQUARE = R"({
    "title": "Town Square",
    "desc": "A square.",
    "exits": [{"dir": "north", "to": "market"}]
})";

std::optional<RoomRecord> parse(const std::string& text) {
    std::string error;
    return parseRoomRecord(text, "room", error);
}

} // namespace

BOOST_AUTO_TEST_SUITE(ParserTests)

BOOST_AUTO_TEST_CASE(TestMinimalRecord)
{
    auto record = parse(SQUARE);
    BOOST_REQUIRE(record.has_value());
    BOOST_CHECK_EQUAL(record->id, "room");
    BOOST_CHECK_EQUAL(record->title, "Town Square");
    BOOST_CHECK_EQUAL(record->brief, "A square.");
    BOOST_CHECK(!record->long_description.has_value());
    BOOST_REQUIRE_EQUAL(record->exits.size(), 1u);
    BOOST_CHECK_EQUAL(record->exits[0].direction, "north");
    BOOST_CHECK_EQUAL(record->exits[0].destination, "market");
    BOOST_CHECK(record->objects.empty());
}

BOOST_AUTO_TEST_CASE(TestPairExitsAndLongDescription)
{
    auto record = parse(R"({"title": "Chapel", "desc": "Quiet.", "long": "Very quiet.",
                            "exits": [["west", "square"], ["up", "belfry"]]})");
    BOOST_REQUIRE(record.has_value());
    BOOST_REQUIRE(record->long_description.has_value());
    BOOST_CHECK_EQUAL(*record->long_description, "Very quiet.");
    BOOST_REQUIRE_EQUAL(record->exits.size(), 2u);
    BOOST_CHECK_EQUAL(record->exits[1].direction, "up");
    BOOST_CHECK_EQUAL(record->exits[1].destination, "belfry");
}

BOOST_AUTO_TEST_CASE(TestEmptyExitListIsAccepted)
{
    auto record = parse(R"({"title": "Cell", "desc": "No way out.", "exits": []})");
    BOOST_REQUIRE(record.has_value());
    BOOST_CHECK(record->exits.empty());
}

BOOST_AUTO_TEST_CASE(TestEachMissingRequiredFieldFailsClosed)
{
    std::string error;
    BOOST_CHECK(!parseRoomRecord(std::string(R"({"desc": "d", "exits": []})"), "r", error));
    BOOST_CHECK_EQUAL(error, "missing title");
    BOOST_CHECK(!parseRoomRecord(std::string(R"({"title": "t", "exits": []})"), "r", error));
    BOOST_CHECK_EQUAL(error, "missing desc");
    BOOST_CHECK(!parseRoomRecord(std::string(R"({"title": "t", "desc": "d"})"), "r", error));
    BOOST_CHECK_EQUAL(error, "missing exits");
}

BOOST_AUTO_TEST_CASE(TestMistypedFieldsFailClosed)
{
    BOOST_CHECK(!parse(R"({"title": 3, "desc": "d", "exits": []})"));
    BOOST_CHECK(!parse(R"({"title": "t", "desc": ["d"], "exits": []})"));
    BOOST_CHECK(!parse(R"({"title": "t", "desc": "d", "exits": {"north": "x"}})"));
    BOOST_CHECK(!parse(R"({"title": "t", "desc": "d", "exits": [{"dir": "north"}]})"));
    BOOST_CHECK(!parse(R"({"title": "t", "desc": "d", "exits": [["north"]]})"));
    BOOST_CHECK(!parse(R"(["not", "an", "object"])"));
}

BOOST_AUTO_TEST_CASE(TestMalformedJsonFailsWithoutThrowing)
{
    std::string error;
    std::optional<RoomRecord> record;
    BOOST_CHECK_NO_THROW(record = parseRoomRecord(std::string("{\"title\": "), "r", error));
    BOOST_CHECK(!record.has_value());
    BOOST_CHECK(error.find("malformed json") == 0);
}

BOOST_AUTO_TEST_CASE(TestObjectSpecsExpandAndMalformedOnesAreSkipped)
{
    auto record = parse(R"({"title": "t", "desc": "d", "exits": [],
        "objects": [
            {"name": "fountain", "desc": "Dry.", "attached": true},
            {"name": "pebble", "desc": "Grey.", "count": 3},
            {"desc": "nameless"},
            42
        ]})");
    BOOST_REQUIRE(record.has_value());
    BOOST_CHECK_EQUAL(record->resets.size(), 2u);
    BOOST_REQUIRE_EQUAL(record->objects.size(), 4u);
    BOOST_CHECK_EQUAL(record->objects[0].name, "fountain");
    BOOST_CHECK(record->objects[0].attached);
    for (std::size_t i = 1; i < 4; ++i) {
        BOOST_CHECK_EQUAL(record->objects[i].name, "pebble");
        BOOST_CHECK(!record->objects[i].attached);
    }
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeCountsAreSkipped)
{
    auto record = parse(R"({"title": "t", "desc": "d", "exits": [],
        "objects": [
            {"name": "grain", "count": 1000000000},
            {"name": "sand", "count": 9223372036854775807},
            {"name": "dust", "count": 0},
            {"name": "ash", "count": -1},
            {"name": "mist", "count": 1.5},
            {"name": "fog", "count": "3"},
            {"name": "coin", "count": 100}
        ]})");
    BOOST_REQUIRE(record.has_value());
    BOOST_REQUIRE_EQUAL(record->resets.size(), 1u);
    BOOST_CHECK_EQUAL(record->resets[0].name, "coin");
    BOOST_CHECK_EQUAL(record->objects.size(), 100u);
}

BOOST_AUTO_TEST_CASE(TestLoadObjectsCapsCopies)
{
    auto objects = loadObjects({{"coin", "Shiny.", false, 1000000}});
    BOOST_CHECK_EQUAL(objects.size(), static_cast<std::size_t>(MAX_RESET_COUNT));
}

BOOST_AUTO_TEST_CASE(TestLoadObjectsIgnoresNonPositiveCounts)
{
    std::vector<ResetSpec> resets{{"coin", "Shiny.", false, 0}, {"key", "Rusty.", false, -2}, {"map", "Old.", false, 1}};
    auto objects = loadObjects(resets);
    BOOST_REQUIRE_EQUAL(objects.size(), 1u);
    BOOST_CHECK_EQUAL(objects[0].name, "map");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PathTests)

BOOST_AUTO_TEST_CASE(TestRoomPathAndIdRoundTrip)
{
    BOOST_CHECK_EQUAL(roomPath("data", "square"), "data/rooms/square.dat");
    BOOST_CHECK_EQUAL(roomPath("/srv/mud/", "square"), "/srv/mud/rooms/square.dat");
    BOOST_CHECK_EQUAL(roomIdFromPath("/srv/mud/rooms/square.dat"), "square");
    BOOST_CHECK_EQUAL(roomIdFromPath("market.dat"), "market");
    BOOST_CHECK_EQUAL(roomIdFromPath("rooms/readme"), "readme");
}

BOOST_AUTO_TEST_CASE(TestRoomIdValidation)
{
    BOOST_CHECK(isValidRoomId("square"));
    BOOST_CHECK(isValidRoomId("dark_alley-2"));
    BOOST_CHECK(!isValidRoomId(""));
    BOOST_CHECK(!isValidRoomId("../etc/passwd"));
    BOOST_CHECK(!isValidRoomId("a/b"));
    BOOST_CHECK(!isValidRoomId("two words"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(FileRoomStoreTests)

BOOST_AUTO_TEST_CASE(TestLoadsFromRoomsDirectory)
{
    test::TempDataDir data;
    data.writeRoom("square", SQUARE);

    FileRoomStore store(data.path());
    auto record = store.load("square");
    BOOST_REQUIRE(record.has_value());
    BOOST_CHECK_EQUAL(record->title, "Town Square");
}

BOOST_AUTO_TEST_CASE(TestMissingInvalidAndBrokenRoomsAreAbsent)
{
    test::TempDataDir data;
    data.writeRoom("broken", R"({"title": "Broken", "exits": []})");
    data.writeFile("secret.dat", SQUARE);

    FileRoomStore store(data.path());
    BOOST_CHECK(!store.load("market"));
    BOOST_CHECK(!store.load("broken"));
    BOOST_CHECK(!store.load("../secret"));
}

BOOST_AUTO_TEST_SUITE_END()
