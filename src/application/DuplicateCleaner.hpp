/**
 * @file DuplicateCleaner.hpp
 * @brief Removes byte-identical files inside a folder, keeping the oldest copy.
 */

#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "infrastructure/TransferLog.hpp"

namespace tidyfile::application {

struct DuplicateGroup {
    std::string contentHash;
    std::uintmax_t sizeBytes = 0;
    std::string kept;                  ///< Earliest-created file of the group.
    std::vector<std::string> removed;  ///< Deleted, or to be deleted in a dry run.
};

struct DuplicateReport {
    int filesScanned = 0;
    int duplicatesFound = 0;
    int deleted = 0;
    std::uintmax_t bytesFreed = 0;
    bool dryRun = true;
    std::string sessionPath;  ///< Transfer session recording the deletions, empty in a dry run.
    std::vector<DuplicateGroup> groups;
    std::vector<std::string> errors;
};

/**
 * @class DuplicateCleaner
 * @brief Groups files by size, then by MD5; every deletion is a delete_duplicate operation.
 *
 * Each deletion is logged with the kept file as its target path, so restoring
 * the session copies the kept file back to the deleted location.
 */
class DuplicateCleaner {
public:
    explicit DuplicateCleaner(std::shared_ptr<infrastructure::TransferLog> log);

    /**
     * @throws domain::IOError if the folder does not exist.
     * @throws std::logic_error if a transfer session is already open.
     */
    DuplicateReport removeDuplicates(const std::string& folder, bool dryRun);

    /**
     * @brief Groups the folder's files by content without changing anything.
     * @throws domain::IOError if the folder does not exist.
     */
    DuplicateReport findDuplicates(const std::string& folder) const;

    /**
     * @brief Deletes one file of a group and records it in the open transfer session.
     *
     * The file is renamed aside first and deleted only after its record is
     * written. If the record cannot be written the file is renamed back.
     * Failures are appended to `errors`.
     * @return true if the file was deleted and logged.
     * @throws std::logic_error without an open transfer session.
     */
    bool removeDuplicate(const DuplicateGroup& group, const std::string& path, std::vector<std::string>& errors);

private:
    std::shared_ptr<infrastructure::TransferLog> m_log;
};

} // namespace tidyfile::application
