/**
 * @file TransferOperation.hpp
 * @brief Records of the write-ahead transfer log and the restore report.
 */

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tidyfile::domain {

/**
 * @enum OperationKind
 * @brief Filesystem mutation recorded by a TransferOperation.
 */
enum class OperationKind {
    Copy,
    Move,
    DeleteDuplicate
};

inline std::string OperationKindToString(OperationKind kind) {
    switch (kind) {
        case OperationKind::Copy: return "copy";
        case OperationKind::Move: return "move";
        case OperationKind::DeleteDuplicate: return "delete_duplicate";
    }
    return "copy";
}

inline std::optional<OperationKind> OperationKindFromString(const std::string& value) {
    if (value == "copy") return OperationKind::Copy;
    if (value == "move") return OperationKind::Move;
    if (value == "delete_duplicate") return OperationKind::DeleteDuplicate;
    return std::nullopt;
}

/**
 * @struct TransferOperation
 * @brief One attempted mutation. Written once, never modified.
 */
struct TransferOperation {
    std::int64_t id = 0;            ///< Assigned by the log on append.
    std::string timestamp;          ///< ISO-8601 local time, assigned on append.
    OperationKind kind = OperationKind::Copy;
    std::string sourcePath;
    std::string targetPath;
    std::string targetFolder;       ///< Label of the target directory.
    bool success = false;
    std::optional<std::string> errorMessage;
    std::uintmax_t fileSize = 0;
    std::optional<std::string> contentHash;  ///< Hex MD5 when known.
    std::optional<double> createdTime;       ///< Original creation time, seconds since epoch.
};

/** @brief Header of a session document. */
struct SessionInfo {
    std::string name;
    std::string startTime;
    std::optional<std::string> endTime;  ///< Empty while the session is open.
    int totalOperations = 0;
    int successfulOperations = 0;
    int failedOperations = 0;
};

struct TransferSession {
    SessionInfo info;
    std::vector<TransferOperation> operations;
};

/** @brief Aggregates of a closed or open session. */
struct SessionSummary {
    SessionInfo info;
    std::map<std::string, int> operationKinds;
    std::map<std::string, int> targetFolders;
    std::uintmax_t totalBytes = 0;
};

enum class RestoreOutcome {
    Restored,
    WouldRestore,   ///< Dry run: the inverse action would be performed.
    AlreadyIntact,  ///< Source still present, nothing to do.
    Skipped,        ///< Neither source nor target present.
    Failed
};

inline const char* RestoreOutcomeToString(RestoreOutcome outcome) {
    switch (outcome) {
        case RestoreOutcome::Restored: return "restored";
        case RestoreOutcome::WouldRestore: return "would_restore";
        case RestoreOutcome::AlreadyIntact: return "already_intact";
        case RestoreOutcome::Skipped: return "skipped";
        case RestoreOutcome::Failed: return "failed";
    }
    return "failed";
}

struct RestoreDetail {
    std::int64_t operationId = 0;
    std::string sourcePath;
    std::string targetPath;
    OperationKind kind = OperationKind::Copy;
    RestoreOutcome outcome = RestoreOutcome::Skipped;
    std::string message;
};

struct RestoreReport {
    int totalOperations = 0;
    int restored = 0;
    int alreadyIntact = 0;
    int skipped = 0;
    int failed = 0;
    bool dryRun = true;
    std::vector<RestoreDetail> details;
};

} // namespace tidyfile::domain
