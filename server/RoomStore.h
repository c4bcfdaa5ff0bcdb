/**
 * @file server/RoomStore.h
 * @brief Source of room records for the room manager.
 */

#pragma once

#include <optional>
#include <string>
#include "../shared/RoomRecord.h"

namespace mud {

class RoomStore {
public:
    virtual ~RoomStore() = default;

    /**
     * @brief Loads the record of room @p id
     * @return nullopt if the room does not exist or cannot be parsed
     */
    virtual std::optional<RoomRecord> load(const RoomId& id) const = 0;
};

/**
 * @brief Reads `<data_dir>/rooms/<id>.dat`
 *
 * Ids that fail `isValidRoomId()` are rejected before touching the disk.
 */
class FileRoomStore : public RoomStore {
    std::string _data_dir;

public:
    explicit FileRoomStore(std::string data_dir);

    std::optional<RoomRecord> load(const RoomId& id) const override;
};

} // namespace mud
