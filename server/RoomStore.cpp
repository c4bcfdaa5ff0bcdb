/**
 * @file server/RoomStore.cpp
 * @brief Room files on disk.
 */

#include "RoomStore.h"

#include <qb/io.h>
#include "../shared/TextFile.h"

namespace mud {

FileRoomStore::FileRoomStore(std::string data_dir)
    : _data_dir(std::move(data_dir)) {}

std::optional<RoomRecord> FileRoomStore::load(const RoomId& id) const {
    if (!isValidRoomId(id)) {
        qb::io::cerr() << "[RoomStore] rejected room id '" << id << "'" << std::endl;
        return std::nullopt;
    }

    const auto path = roomPath(_data_dir, id);
    qb::io::cout() << "[RoomStore] loading: " << path << std::endl;

    std::string content;
    std::string error;
    if (!readTextFile(path, content, error)) {
        qb::io::cout() << "[RoomStore] " << path << ": " << error << std::endl;
        return std::nullopt;
    }

    auto record = parseRoomRecord(content, id, error);
    if (!record)
        qb::io::cerr() << "[RoomStore] " << path << " is invalid: " << error << std::endl;
    return record;
}

} // namespace mud
