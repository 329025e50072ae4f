/**
 * @file OrganizerService.hpp
 * @brief Application service that drives scan, classify, organize and restore runs.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "application/MigrationExecutor.hpp"
#include "application/SmartClassifier.hpp"
#include "domain/ClassificationDecision.hpp"
#include "domain/FileRecord.hpp"
#include "domain/ResultEntry.hpp"
#include "domain/TransferOperation.hpp"
#include "infrastructure/ResultStore.hpp"
#include "infrastructure/TransferLog.hpp"

namespace tidyfile::application {

/** @brief Outcome of one input file of an organize run. */
struct FileOutcome {
    std::string sourcePath;
    domain::OutcomeStatus status = domain::OutcomeStatus::Error;
    domain::ClassificationDecision decision;
    std::string targetPath;  ///< Final (or planned) path, empty when nothing was migrated.
    domain::ErrorKind errorKind = domain::ErrorKind::None;
    std::string error;
};

struct OrganizeReport {
    bool dryRun = true;
    std::string sessionPath;  ///< Transfer session document, empty in a dry run.
    std::vector<FileOutcome> outcomes;  ///< One per input file, in input order.
    int migrated = 0;
    int planned = 0;
    int classificationFailed = 0;
    int migrationFailed = 0;
    int timedOut = 0;
    int cancelled = 0;
    int errors = 0;
    int storeAppended = 0;
    int storeDuplicates = 0;
    int storeFailures = 0;
};

struct OrganizeOptions {
    bool dryRun = true;
    domain::OperationKind operation = domain::OperationKind::Copy;
    std::optional<std::string> sessionName;
};

/**
 * @class OrganizerService
 * @brief Fans files across a worker pool and funnels outcomes to the result store.
 *
 * A non-dry run opens exactly one transfer session and closes it when every
 * file has an outcome. Classification and migration run on the workers;
 * target names are claimed in between, one file at a time in input order, so
 * a collision always suffixes the later file. Each file's classification runs on a detached task
 * bounded by the configured timeout; a file that exceeds it is reported
 * TimedOut and nothing is migrated for it.
 */
class OrganizerService {
public:
    struct Settings {
        int workers = 4;
        std::chrono::milliseconds classificationTimeout{180000};
    };

    OrganizerService(std::shared_ptr<SmartClassifier> classifier,
                     std::shared_ptr<MigrationExecutor> executor,
                     std::shared_ptr<infrastructure::TransferLog> transferLog,
                     std::shared_ptr<infrastructure::ResultStore> resultStore,
                     Settings settings);

    std::vector<domain::FileRecord> scan(const std::vector<std::string>& directories) const;

    /** @brief Classifies one file; a timeout yields an unsuccessful decision. */
    domain::ClassificationDecision classify(const domain::FileRecord& file, const std::string& targetRoot) const;

    /**
     * @brief Classifies and migrates the files.
     * @throws std::logic_error if a transfer session is already open.
     */
    OrganizeReport organize(const std::vector<domain::FileRecord>& files, const std::string& targetRoot,
                            const OrganizeOptions& options);

    domain::RestoreReport restore(const std::string& session,
                                  const std::optional<std::vector<std::int64_t>>& operationIds,
                                  bool dryRun);

    std::vector<std::string> listSessions() const { return m_transferLog->listSessions(); }
    domain::SessionSummary summarize(const std::string& session) const { return m_transferLog->summarize(session); }
    domain::ResultStatistics statistics() const { return m_resultStore->statistics(); }

    /** @brief Deletes closed session documents older than the given number of days. */
    int cleanupSessions(int days) { return m_transferLog->cleanupOlderThan(days); }

    /** @brief Files not yet started are reported Cancelled; files in flight finish or stop before mutating. */
    void requestStop() { m_stopRequested = true; }

    bool stopRequested() const { return m_stopRequested.load(); }

private:
    std::optional<domain::ClassificationDecision> classifyWithTimeout(const domain::FileRecord& file,
                                                                      const std::string& targetRoot,
                                                                      double metadataSeconds) const;
    FileOutcome classifyFile(const domain::FileRecord& file, const std::string& targetRoot,
                             const OrganizeOptions& options, std::optional<MigrationItem>& item);
    FileOutcome cancelledBeforeMigration(FileOutcome outcome) const;
    static void ApplyMigration(FileOutcome& outcome, const MigrationResult& migration, bool dryRun);
    static domain::ResultEntry ToResultEntry(const FileOutcome& outcome, const domain::FileRecord& file,
                                             const OrganizeOptions& options);

    std::shared_ptr<SmartClassifier> m_classifier;
    std::shared_ptr<MigrationExecutor> m_executor;
    std::shared_ptr<infrastructure::TransferLog> m_transferLog;
    std::shared_ptr<infrastructure::ResultStore> m_resultStore;
    Settings m_settings;
    std::atomic<bool> m_stopRequested{false};
};

} // namespace tidyfile::application
