/**
 * @file shared/RoomRecord.cpp
 * @brief Room file validation, path resolution and the object loader.
 */

#include "RoomRecord.h"

#include <qb/io.h>
#include <algorithm>
#include <cstdint>

namespace mud {

namespace {

std::optional<std::string> stringField(const qb::json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

std::optional<Exit> parseExit(const qb::json& entry) {
    if (entry.is_object()) {
        auto dir = stringField(entry, "dir");
        auto to = stringField(entry, "to");
        if (!dir || !to)
            return std::nullopt;
        return Exit{*dir, *to};
    }
    if (entry.is_array() && entry.size() == 2 && entry[0].is_string() && entry[1].is_string())
        return Exit{entry[0].get<std::string>(), entry[1].get<std::string>()};
    return std::nullopt;
}

std::optional<ResetSpec> parseReset(const qb::json& entry) {
    if (!entry.is_object())
        return std::nullopt;
    auto name = stringField(entry, "name");
    if (!name || name->empty())
        return std::nullopt;

    ResetSpec spec;
    spec.name = *name;
    spec.description = stringField(entry, "desc").value_or("");
    if (auto it = entry.find("attached"); it != entry.end() && it->is_boolean())
        spec.attached = it->get<bool>();
    if (auto it = entry.find("count"); it != entry.end()) {
        if (!it->is_number_integer())
            return std::nullopt;
        const auto count = it->get<int64_t>();
        if (count < 1 || count > MAX_RESET_COUNT)
            return std::nullopt;
        spec.count = static_cast<int>(count);
    }
    return spec;
}

} // namespace

std::optional<RoomRecord> parseRoomRecord(const qb::json& doc, const RoomId& id, std::string& error) {
    if (!doc.is_object()) {
        error = "room document is not an object";
        return std::nullopt;
    }

    RoomRecord record;
    record.id = id;

    auto title = stringField(doc, "title");
    if (!title) {
        error = "missing title";
        return std::nullopt;
    }
    auto brief = stringField(doc, "desc");
    if (!brief) {
        error = "missing desc";
        return std::nullopt;
    }
    auto exits = doc.find("exits");
    if (exits == doc.end() || !exits->is_array()) {
        error = "missing exits";
        return std::nullopt;
    }

    record.title = *title;
    record.brief = *brief;
    record.long_description = stringField(doc, "long");

    for (const auto& entry : *exits) {
        auto exit = parseExit(entry);
        if (!exit) {
            error = "malformed exit";
            return std::nullopt;
        }
        record.exits.push_back(std::move(*exit));
    }

    if (auto objects = doc.find("objects"); objects != doc.end() && objects->is_array()) {
        for (const auto& entry : *objects) {
            if (auto spec = parseReset(entry))
                record.resets.push_back(std::move(*spec));
            else
                qb::io::cerr() << "[RoomRecord] " << id << ": skipping malformed object spec" << std::endl;
        }
    }
    record.objects = loadObjects(record.resets);
    return record;
}

std::optional<RoomRecord> parseRoomRecord(const std::string& text, const RoomId& id, std::string& error) {
    qb::json doc;
    try {
        doc = qb::json::parse(text);
    } catch (const std::exception& e) {
        error = std::string("malformed json: ") + e.what();
        return std::nullopt;
    }
    return parseRoomRecord(doc, id, error);
}

std::string roomPath(const std::string& data_dir, const RoomId& id) {
    std::string path = data_dir;
    if (!path.empty() && path.back() != '/')
        path += '/';
    path += ROOM_DIRECTORY;
    path += '/';
    path += id;
    path += ROOM_FILE_EXTENSION;
    return path;
}

RoomId roomIdFromPath(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string basename = slash == std::string::npos ? path : path.substr(slash + 1);

    const std::string extension{ROOM_FILE_EXTENSION};
    if (basename.size() >= extension.size() &&
        basename.compare(basename.size() - extension.size(), extension.size(), extension) == 0)
        basename.erase(basename.size() - extension.size());
    return basename;
}

std::vector<ObjectRecord> loadObjects(const std::vector<ResetSpec>& resets) {
    std::vector<ObjectRecord> objects;
    for (const auto& spec : resets) {
        if (spec.name.empty())
            continue;
        for (int i = 0; i < std::min(spec.count, MAX_RESET_COUNT); ++i)
            objects.push_back(ObjectRecord{spec.name, spec.description, spec.attached});
    }
    return objects;
}

} // namespace mud
