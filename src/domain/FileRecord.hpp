/**
 * @file FileRecord.hpp
 * @brief Snapshot of a source file captured before classification.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace tidyfile::domain {

/**
 * @struct FileRecord
 * @brief Immutable metadata of one file; re-derived per file, never persisted on its own.
 */
struct FileRecord {
    std::string path;      ///< Absolute source path.
    std::string name;      ///< Basename including extension.
    std::string extension; ///< Lowercase extension with leading dot, may be empty.
    std::uintmax_t sizeBytes = 0;
    std::chrono::system_clock::time_point created;
    std::chrono::system_clock::time_point modified;
};

} // namespace tidyfile::domain
