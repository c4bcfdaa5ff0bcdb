/**
 * @file shared/Config.cpp
 * @brief JSON and command line parsing for `ServerConfig`.
 */

#include "Config.h"
#include "TextFile.h"

#include <iostream>
#include <stdexcept>

namespace mud {

namespace {

constexpr double MAX_GATEWAYS = 1024;
constexpr double MAX_CORE = 255;
constexpr double MAX_SECONDS = 86400;

/// Accepts values in [min, max]; NaN fails both comparisons and is rejected.
template <typename T>
void readNumber(const qb::json& doc, const char* key, T& out, double min, double max) {
    auto it = doc.find(key);
    if (it == doc.end())
        return;
    if (!it->is_number())
        throw std::runtime_error(std::string("config: '") + key + "' must be a number");
    double value = it->get<double>();
    if (!(value >= min && value <= max))
        throw std::runtime_error(std::string("config: '") + key + "' is out of range");
    out = static_cast<T>(value);
}

void readString(const qb::json& doc, const char* key, std::string& out) {
    auto it = doc.find(key);
    if (it == doc.end())
        return;
    if (!it->is_string())
        throw std::runtime_error(std::string("config: '") + key + "' must be a string");
    out = it->get<std::string>();
}

void readBool(const qb::json& doc, const char* key, bool& out) {
    auto it = doc.find(key);
    if (it == doc.end())
        return;
    if (!it->is_boolean())
        throw std::runtime_error(std::string("config: '") + key + "' must be a boolean");
    out = it->get<bool>();
}

} // namespace

ServerConfig ServerConfig::fromJson(const qb::json& doc) {
    if (!doc.is_object())
        throw std::runtime_error("config: document must be an object");

    ServerConfig config;
    readString(doc, "listen", config.listen);
    readString(doc, "data_dir", config.data_dir);
    readString(doc, "start_room", config.start_room);
    readNumber(doc, "gateways", config.gateways, 1, MAX_GATEWAYS);
    readNumber(doc, "accept_core", config.accept_core, 0, MAX_CORE);
    readNumber(doc, "gateway_core", config.gateway_core, 0, MAX_CORE);
    readNumber(doc, "world_core", config.world_core, 0, MAX_CORE);
    readNumber(doc, "request_timeout", config.request_timeout, 0.01, MAX_SECONDS);
    readNumber(doc, "idle_timeout", config.idle_timeout, 1, MAX_SECONDS);
    readNumber(doc, "max_pending_lines", config.max_pending_lines, 1, 10000);
    readNumber(doc, "room_reset_interval", config.room_reset_interval, 0, MAX_SECONDS);
    readBool(doc, "selective_recovery", config.selective_recovery);
    readNumber(doc, "max_living_respawns", config.max_living_respawns, 0, 1000);

    if (!isValidRoomId(config.start_room))
        throw std::runtime_error("config: invalid start_room '" + config.start_room + "'");

    if (auto it = doc.find("preload_rooms"); it != doc.end()) {
        if (!it->is_array())
            throw std::runtime_error("config: 'preload_rooms' must be an array");
        for (const auto& room : *it) {
            if (!room.is_string() || !isValidRoomId(room.get<std::string>()))
                throw std::runtime_error("config: invalid room id in 'preload_rooms'");
            config.preload_rooms.push_back(room.get<std::string>());
        }
    }

    if (auto it = doc.find("accounts"); it != doc.end()) {
        if (!it->is_object())
            throw std::runtime_error("config: 'accounts' must be an object");
        for (const auto& [name, password] : it->items()) {
            if (!password.is_string())
                throw std::runtime_error("config: password of '" + name + "' must be a string");
            config.accounts[name] = password.get<std::string>();
        }
    }
    return config;
}

ServerConfig ServerConfig::load(const std::string& path) {
    std::string text;
    std::string error;
    if (!readTextFile(path, text, error))
        throw std::runtime_error("config: " + path + ": " + error);

    qb::json doc;
    try {
        doc = qb::json::parse(text);
    } catch (const std::exception& e) {
        throw std::runtime_error("config: " + path + ": " + e.what());
    }
    return fromJson(doc);
}

CommandLine CommandLine::parse(int argc, char* argv[]) {
    CommandLine line;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc)
                throw std::runtime_error("missing value for " + arg);
            out = argv[++i];
        };

        if (arg == "--config")
            value(line.config_path);
        else if (arg == "--listen")
            value(line.listen);
        else if (arg == "--data")
            value(line.data_dir);
        else if (arg == "--start-room")
            value(line.start_room);
        else if (arg == "--help" || arg == "-h")
            line.help = true;
        else
            throw std::runtime_error("unknown option " + arg);
    }
    return line;
}

ServerConfig CommandLine::resolve() const {
    ServerConfig config = config_path.empty() ? ServerConfig{} : ServerConfig::load(config_path);
    if (!listen.empty())
        config.listen = listen;
    if (!data_dir.empty())
        config.data_dir = data_dir;
    if (!start_room.empty()) {
        if (!isValidRoomId(start_room))
            throw std::runtime_error("invalid start room '" + start_room + "'");
        config.start_room = start_room;
    }
    return config;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --config PATH      JSON configuration file\n";
    std::cout << "  --listen URI       Listen address (default: tcp://0.0.0.0:4000)\n";
    std::cout << "  --data DIR         Data directory holding rooms/ (default: data)\n";
    std::cout << "  --start-room ID    Room new players appear in (default: square)\n";
    std::cout << "  --help, -h         Show this help message\n";
}

} // namespace mud
