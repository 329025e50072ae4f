/**
 * @file MigrationExecutor.hpp
 * @brief Performs the copy/move of classified files and records every attempt in the transfer log.
 */

#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "domain/Errors.hpp"
#include "domain/TransferOperation.hpp"
#include "infrastructure/TransferLog.hpp"

namespace tidyfile::application {

struct MigrationItem {
    std::string source;
    std::string targetDir;
    std::optional<domain::OperationKind> operation;
    std::string targetFolder;  ///< Label recorded in the log; defaults to the target directory name.
};

struct MigrationResult {
    std::string source;
    std::string target;  ///< Final path after collision resolution, empty if none was resolved.
    bool success = false;
    std::optional<std::string> error;
    domain::ErrorKind errorKind = domain::ErrorKind::None;
    std::optional<domain::OperationKind> operation;
    std::int64_t operationId = 0;  ///< Transfer log id, 0 when nothing was logged.
};

/**
 * @class MigrationExecutor
 * @brief Collision-safe copy/move with a transfer log record per attempt.
 *
 * Name resolution runs under the executor mutex and claims the name in the
 * caller's planned-name set, so workers sharing that set never claim the same
 * target. The copy or move itself runs outside the mutex. A taken name gets
 * the source modification time appended as _YYYYMMDD_HHMMSS, then a counter
 * _1.._999. A mutation whose log record cannot be written is undone. Dry runs
 * neither touch the filesystem nor the transfer log.
 */
class MigrationExecutor {
public:
    /** @param log Transfer log; a session must be open for non-dry runs. */
    explicit MigrationExecutor(std::shared_ptr<infrastructure::TransferLog> log);

    /**
     * @brief Executes the items in order, one result per item.
     * @throws std::logic_error for a non-dry run without an open transfer session.
     */
    std::vector<MigrationResult> executePlan(const std::vector<MigrationItem>& items, bool dryRun);

    /** @brief reserve() followed by perform() unless this is a dry run. */
    MigrationResult executeOne(const MigrationItem& item, bool dryRun, std::set<std::string>& planned);

    /**
     * @brief Resolves the target name and adds it to `planned`. Touches nothing on disk.
     *
     * A successful result carries the claimed target; this is the dry-run result.
     */
    MigrationResult reserve(const MigrationItem& item, std::set<std::string>& planned);

    /**
     * @brief Performs a reserved migration and appends its record.
     *
     * A failed reservation of a valid item is recorded as a failed attempt.
     * If the record cannot be appended the copy is removed, or the moved file
     * is put back, and the result reports a LogCorruption failure.
     */
    MigrationResult perform(const MigrationItem& item, MigrationResult reserved);

    /**
     * @brief First free name for the source inside the directory.
     * @throws domain::CollisionError when all candidates are taken.
     */
    static std::string ResolveTargetPath(const std::string& source, const std::string& targetDir,
                                         const std::set<std::string>& planned);

    static constexpr int kMaxCollisionCounter = 999;

private:
    static bool IsPlannable(const MigrationItem& item);
    domain::TransferOperation makeOperation(const MigrationItem& item, const MigrationResult& result) const;
    void recordFailure(const MigrationItem& item, MigrationResult& result);
    bool undo(const MigrationItem& item, const MigrationResult& result) const;

    std::shared_ptr<infrastructure::TransferLog> m_log;
    std::mutex m_mutex;
};

} // namespace tidyfile::application
