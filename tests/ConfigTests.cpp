#define BOOST_TEST_MODULE ConfigTests
#include <boost/test/unit_test.hpp>

#include <stdexcept>

#include "../server/AccountStore.h"
#include "../shared/Config.h"
#include "TestSupport.h"

using namespace mud;

namespace {

CommandLine parseArgs(std::vector<std::string> args) {
    args.insert(args.begin(), "mudcore-server");
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());
    return CommandLine::parse(static_cast<int>(argv.size()), argv.data());
}

} // namespace

BOOST_AUTO_TEST_SUITE(ServerConfigTests)

BOOST_AUTO_TEST_CASE(TestDefaults)
{
    auto config = ServerConfig::fromJson(qb::json::object());
    BOOST_CHECK_EQUAL(config.listen, "tcp://0.0.0.0:4000");
    BOOST_CHECK_EQUAL(config.start_room, "square");
    BOOST_CHECK_EQUAL(config.gateways, 2u);
    BOOST_CHECK(!config.selective_recovery);
    BOOST_CHECK_CLOSE(config.room_reset_interval, 300.0, 1e-9);
    BOOST_CHECK(config.accounts.empty());
}

BOOST_AUTO_TEST_CASE(TestAllKeys)
{
    auto config = ServerConfig::fromJson(qb::json::parse(R"({
        "listen": "tcp://127.0.0.1:5000",
        "data_dir": "/srv/mud",
        "start_room": "chapel",
        "preload_rooms": ["belfry", "square"],
        "gateways": 4,
        "request_timeout": 0.5,
        "idle_timeout": 30,
        "max_pending_lines": 8,
        "room_reset_interval": 0,
        "selective_recovery": true,
        "max_living_respawns": 1,
        "accounts": {"wizard": "secret"},
        "motd": "ignored"
    })"));
    BOOST_CHECK_EQUAL(config.listen, "tcp://127.0.0.1:5000");
    BOOST_CHECK_EQUAL(config.data_dir, "/srv/mud");
    BOOST_CHECK_EQUAL(config.start_room, "chapel");
    BOOST_CHECK_EQUAL(config.preload_rooms.size(), 2u);
    BOOST_CHECK_EQUAL(config.gateways, 4u);
    BOOST_CHECK_CLOSE(config.request_timeout, 0.5, 1e-9);
    BOOST_CHECK_EQUAL(config.max_pending_lines, 8u);
    BOOST_CHECK_EQUAL(config.room_reset_interval, 0.0);
    BOOST_CHECK(config.selective_recovery);
    BOOST_CHECK_EQUAL(config.max_living_respawns, 1u);
    BOOST_CHECK_EQUAL(config.accounts.at("wizard"), "secret");
}

BOOST_AUTO_TEST_CASE(TestBadValuesThrow)
{
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::array()), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"gateways": 0})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"gateways": "two"})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"request_timeout": 0})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"room_reset_interval": -1})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"selective_recovery": 1})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"start_room": "../x"})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"preload_rooms": "square"})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"accounts": {"bob": 1}})")), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(TestHugeNumbersAreRejected)
{
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"gateways": 1e30})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"world_core": 70000})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"max_pending_lines": 1e19})")), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::fromJson(qb::json::parse(R"({"request_timeout": 1e9})")), std::runtime_error);
    BOOST_CHECK_EQUAL(ServerConfig::fromJson(qb::json::parse(R"({"gateways": 1024})")).gateways, 1024u);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile)
{
    test::TempDataDir dir;
    dir.writeFile("mud.json", R"({"start_room": "belfry"})");
    dir.writeFile("broken.json", "{");

    BOOST_CHECK_EQUAL(ServerConfig::load(dir.path() + "/mud.json").start_room, "belfry");
    BOOST_CHECK_THROW(ServerConfig::load(dir.path() + "/broken.json"), std::runtime_error);
    BOOST_CHECK_THROW(ServerConfig::load(dir.path() + "/missing.json"), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CommandLineTests)

BOOST_AUTO_TEST_CASE(TestOverridesWinOverFile)
{
    test::TempDataDir dir;
    dir.writeFile("mud.json", R"({"start_room": "belfry", "data_dir": "/from/file"})");

    auto line = parseArgs({"--config", dir.path() + "/mud.json", "--start-room", "chapel",
                           "--listen", "tcp://127.0.0.1:4100"});
    BOOST_CHECK(!line.help);
    auto config = line.resolve();
    BOOST_CHECK_EQUAL(config.start_room, "chapel");
    BOOST_CHECK_EQUAL(config.data_dir, "/from/file");
    BOOST_CHECK_EQUAL(config.listen, "tcp://127.0.0.1:4100");
}

BOOST_AUTO_TEST_CASE(TestHelpAndErrors)
{
    BOOST_CHECK(parseArgs({"-h"}).help);
    BOOST_CHECK(parseArgs({"--help"}).help);
    BOOST_CHECK_THROW(parseArgs({"--verbose"}), std::runtime_error);
    BOOST_CHECK_THROW(parseArgs({"--data"}), std::runtime_error);
    BOOST_CHECK_THROW(parseArgs({"--start-room", "a b"}).resolve(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AccountStoreTests)

BOOST_AUTO_TEST_CASE(TestOpenAndFixedStores)
{
    OpenAccountStore open;
    BOOST_CHECK(!open.requiresPassword());
    BOOST_CHECK(open.verify("anyone", ""));

    FixedAccountStore fixed({{"wizard", "secret"}});
    BOOST_CHECK(fixed.requiresPassword());
    BOOST_CHECK(fixed.verify("wizard", "secret"));
    BOOST_CHECK(!fixed.verify("wizard", "guess"));
}

BOOST_AUTO_TEST_SUITE_END()
