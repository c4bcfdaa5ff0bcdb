/**
 * @file shared/TextFile.cpp
 * @brief Synchronous file read used by the room store and the config loader.
 */

#include "TextFile.h"

#include <qb/io/system/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace mud {

bool readTextFile(const std::string& path, std::string& content, std::string& error) {
    qb::io::sys::file file;
    if (file.open(path.c_str(), O_RDONLY) < 0) {
        error = std::string("unable to open file: ") + strerror(errno);
        return false;
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        error = std::string("unable to get file size: ") + strerror(errno);
        file.close();
        return false;
    }

    content.resize(static_cast<std::size_t>(st.st_size));
    ssize_t bytes_read = content.empty() ? 0 : file.read(content.data(), content.size());
    file.close();

    if (bytes_read < 0) {
        error = std::string("read error: ") + strerror(errno);
        return false;
    }
    content.resize(static_cast<std::size_t>(bytes_read));
    return true;
}

} // namespace mud
