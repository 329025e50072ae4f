/**
 * @file ResultEntry.hpp
 * @brief Per-file outcome record kept by the result store.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "domain/ClassificationDecision.hpp"
#include "domain/Errors.hpp"

namespace tidyfile::domain {

/**
 * @enum OutcomeStatus
 * @brief Final processing status of one input file.
 */
enum class OutcomeStatus {
    Migrated,             ///< Classified and copied/moved.
    Planned,              ///< Dry run: classified, migration previewed only.
    ClassificationFailed, ///< No directory matched at the first level.
    MigrationFailed,      ///< Classified but the copy/move failed.
    TimedOut,
    Cancelled,
    Error                 ///< Unexpected failure while processing the file.
};

inline const char* OutcomeStatusToString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Migrated: return "migrated";
        case OutcomeStatus::Planned: return "planned";
        case OutcomeStatus::ClassificationFailed: return "classification_failed";
        case OutcomeStatus::MigrationFailed: return "migration_failed";
        case OutcomeStatus::TimedOut: return "timed_out";
        case OutcomeStatus::Cancelled: return "cancelled";
        case OutcomeStatus::Error: return "error";
    }
    return "error";
}

inline bool IsSuccessfulOutcome(OutcomeStatus status) {
    return status == OutcomeStatus::Migrated || status == OutcomeStatus::Planned;
}

/**
 * @struct ResultEntry
 * @brief Unique in the store by (fileName, finalTargetPath).
 */
struct ResultEntry {
    std::string processedAt;
    std::string fileName;
    std::string sourcePath;
    std::string summary;
    std::string targetFolder;     ///< Relative path under the target root, empty when unmatched.
    std::string finalTargetPath;  ///< Where the file landed, empty when not migrated.
    std::string operation;        ///< "copy", "move" or "preview".
    OutcomeStatus status = OutcomeStatus::Error;
    std::vector<std::string> levelTags;
    std::string reason;
    MatchDepth depth = MatchDepth::Unmatched;
    TimingInfo timing;
    std::string extension;
    std::uintmax_t sizeBytes = 0;
    std::string createdTime;
    std::string modifiedTime;
    ErrorKind errorKind = ErrorKind::None;
    std::string errorMessage;
};

struct ResultStatistics {
    int totalEntries = 0;
    int successCount = 0;
    int failureCount = 0;
    std::map<std::string, int> byStatus;
    std::map<std::string, int> byExtension;
    std::vector<ResultEntry> recentEntries;  ///< Last ten entries in store order.
};

} // namespace tidyfile::domain
