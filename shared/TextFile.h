/**
 * @file shared/TextFile.h
 * @brief Whole-file reads through `qb::io::sys::file`.
 */

#pragma once

#include <string>

namespace mud {

/**
 * @brief Reads the whole file at @p path into @p content
 * @param error receives the reason (errno text) on failure
 * @return false if the file cannot be opened, sized or read
 */
bool readTextFile(const std::string& path, std::string& content, std::string& error);

} // namespace mud
