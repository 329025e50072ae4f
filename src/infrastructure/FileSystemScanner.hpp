/**
 * @file FileSystemScanner.hpp
 * @brief Recursive enumeration of source files into FileRecords.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/FileRecord.hpp"

namespace tidyfile::infrastructure {

/**
 * @class FileSystemScanner
 * @brief Infrastructure adapter that walks source directories.
 */
class FileSystemScanner {
public:
    /**
     * @brief Recursively lists regular files below the given directories.
     *
     * Hidden entries are skipped. Missing or unreadable directories are logged
     * and skipped. The result is sorted by path and free of duplicates.
     */
    std::vector<domain::FileRecord> scan(const std::vector<std::string>& directories) const;

    /**
     * @brief Captures the metadata of one file.
     * @return Record, or nullopt if the path is not a readable regular file.
     */
    static std::optional<domain::FileRecord> Capture(const std::string& path);

    /** @brief Immediate child directories of a directory, sorted by name, hidden ones excluded. */
    static std::vector<std::string> ListSubdirectories(const std::string& directory);
};

} // namespace tidyfile::infrastructure
