/**
 * @file OrganizerService.cpp
 * @brief Implementation of the OrganizerService class.
 */

#include "application/OrganizerService.hpp"
#include "application/ResultAggregator.hpp"
#include "application/WorkerPool.hpp"
#include "infrastructure/FileSystemScanner.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <filesystem>
#include <future>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

namespace tidyfile::application {

OrganizerService::OrganizerService(std::shared_ptr<SmartClassifier> classifier,
                                   std::shared_ptr<MigrationExecutor> executor,
                                   std::shared_ptr<infrastructure::TransferLog> transferLog,
                                   std::shared_ptr<infrastructure::ResultStore> resultStore,
                                   Settings settings)
    : m_classifier(std::move(classifier)),
      m_executor(std::move(executor)),
      m_transferLog(std::move(transferLog)),
      m_resultStore(std::move(resultStore)),
      m_settings(settings) {}

std::vector<domain::FileRecord> OrganizerService::scan(const std::vector<std::string>& directories) const {
    infrastructure::FileSystemScanner scanner;
    return scanner.scan(directories);
}

std::optional<domain::ClassificationDecision> OrganizerService::classifyWithTimeout(const domain::FileRecord& file,
                                                                                    const std::string& targetRoot,
                                                                                    double metadataSeconds) const {
    // The task may outlive this call, so it shares ownership of everything it touches.
    auto promise = std::make_shared<std::promise<domain::ClassificationDecision>>();
    auto future = promise->get_future();
    auto classifier = m_classifier;
    auto ctx = std::make_shared<domain::ClassificationContext>(file);
    ctx->timing.metadataSeconds = metadataSeconds;

    std::thread([promise, classifier, ctx, targetRoot]() {
        try {
            promise->set_value(classifier->classify(*ctx, targetRoot));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(m_settings.classificationTimeout) != std::future_status::ready) {
        std::cerr << "[OrganizerService] Classification of " << file.name << " timed out after "
                  << m_settings.classificationTimeout.count() << " ms" << std::endl;
        return std::nullopt;
    }
    return future.get();
}

domain::ClassificationDecision OrganizerService::classify(const domain::FileRecord& file,
                                                          const std::string& targetRoot) const {
    auto decision = classifyWithTimeout(file, targetRoot, 0.0);
    if (!decision) {
        domain::ClassificationDecision timedOut;
        timedOut.reason = "timed out after " + std::to_string(m_settings.classificationTimeout.count()) + " ms";
        return timedOut;
    }
    return *decision;
}

FileOutcome OrganizerService::classifyFile(const domain::FileRecord& file, const std::string& targetRoot,
                                           const OrganizeOptions& options, std::optional<MigrationItem>& item) {
    FileOutcome outcome;
    outcome.sourcePath = file.path;

    if (m_stopRequested) {
        outcome.status = domain::OutcomeStatus::Cancelled;
        outcome.errorKind = domain::ErrorKind::Cancelled;
        outcome.error = "stop requested before start";
        return outcome;
    }

    auto metadataStart = std::chrono::steady_clock::now();
    auto current = infrastructure::FileSystemScanner::Capture(file.path);
    double metadataSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - metadataStart).count();
    if (!current) {
        outcome.status = domain::OutcomeStatus::Error;
        outcome.errorKind = domain::ErrorKind::IO;
        outcome.error = "source missing or unreadable";
        return outcome;
    }

    auto decision = classifyWithTimeout(*current, targetRoot, metadataSeconds);
    if (!decision) {
        outcome.status = domain::OutcomeStatus::TimedOut;
        outcome.errorKind = domain::ErrorKind::Timeout;
        outcome.error = "classification exceeded " + std::to_string(m_settings.classificationTimeout.count()) + " ms";
        return outcome;
    }
    outcome.decision = *decision;

    if (!outcome.decision.success) {
        outcome.status = domain::OutcomeStatus::ClassificationFailed;
        outcome.errorKind = domain::ErrorKind::ClassificationFailure;
        outcome.error = outcome.decision.reason;
        return outcome;
    }

    item = MigrationItem{current->path, (fs::path(targetRoot) / outcome.decision.relativePath).string(),
                         options.operation, outcome.decision.relativePath};
    return outcome;
}

FileOutcome OrganizerService::cancelledBeforeMigration(FileOutcome outcome) const {
    outcome.status = domain::OutcomeStatus::Cancelled;
    outcome.errorKind = domain::ErrorKind::Cancelled;
    outcome.error = "stop requested before migration";
    outcome.targetPath.clear();
    return outcome;
}

void OrganizerService::ApplyMigration(FileOutcome& outcome, const MigrationResult& migration, bool dryRun) {
    outcome.targetPath = migration.target;
    if (migration.success) {
        outcome.status = dryRun ? domain::OutcomeStatus::Planned : domain::OutcomeStatus::Migrated;
        return;
    }
    outcome.status = domain::OutcomeStatus::MigrationFailed;
    outcome.errorKind = migration.errorKind;
    outcome.error = migration.error.value_or("migration failed");
    if (migration.errorKind == domain::ErrorKind::Collision || migration.target.empty()) {
        outcome.targetPath.clear();
    }
}

domain::ResultEntry OrganizerService::ToResultEntry(const FileOutcome& outcome, const domain::FileRecord& file,
                                                    const OrganizeOptions& options) {
    domain::ResultEntry entry;
    entry.processedAt = infrastructure::TimeUtils::NowIso8601();
    entry.fileName = file.name;
    entry.sourcePath = file.path;
    entry.summary = outcome.decision.summary;
    entry.targetFolder = outcome.decision.relativePath;
    entry.finalTargetPath = outcome.status == domain::OutcomeStatus::Migrated ? outcome.targetPath : "";
    entry.operation = options.dryRun ? "preview" : domain::OperationKindToString(options.operation);
    entry.status = outcome.status;
    entry.levelTags = outcome.decision.levelTags;
    entry.reason = outcome.decision.reason;
    entry.depth = outcome.decision.depth;
    entry.timing = outcome.decision.timing;
    entry.extension = file.extension;
    entry.sizeBytes = file.sizeBytes;
    entry.createdTime = infrastructure::TimeUtils::ToIso8601(file.created);
    entry.modifiedTime = infrastructure::TimeUtils::ToIso8601(file.modified);
    entry.errorKind = outcome.errorKind;
    entry.errorMessage = outcome.error;
    return entry;
}

OrganizeReport OrganizerService::organize(const std::vector<domain::FileRecord>& files, const std::string& targetRoot,
                                          const OrganizeOptions& options) {
    m_stopRequested = false;

    OrganizeReport report;
    report.dryRun = options.dryRun;
    report.outcomes.resize(files.size());

    std::cout << "[OrganizerService] " << (options.dryRun ? "Previewing " : "Organizing ") << files.size()
              << " files into " << targetRoot << " with " << m_settings.workers << " workers" << std::endl;

    if (!options.dryRun) {
        report.sessionPath = m_transferLog->start(options.sessionName);
    }

    std::unique_ptr<ResultAggregator> aggregator;
    if (!options.dryRun && m_resultStore) {
        aggregator = std::make_unique<ResultAggregator>(m_resultStore);
    }

    auto failed = [&files, &report](std::size_t i, const std::exception& e) {
        report.outcomes[i].sourcePath = files[i].path;
        report.outcomes[i].status = domain::OutcomeStatus::Error;
        report.outcomes[i].errorKind = domain::ErrorKind::IO;
        report.outcomes[i].error = e.what();
        std::cerr << "[OrganizerService] Error processing " << files[i].path << ": " << e.what() << std::endl;
    };
    auto finish = [&files, &report, &options, &aggregator](std::size_t i) {
        if (aggregator) {
            aggregator->submit(ToResultEntry(report.outcomes[i], files[i], options));
        }
    };

    std::vector<std::optional<MigrationItem>> items(files.size());
    {
        WorkerPool pool(static_cast<std::size_t>(m_settings.workers));
        for (std::size_t i = 0; i < files.size(); ++i) {
            pool.submit([this, i, &files, &targetRoot, &options, &report, &items, &failed, &finish]() {
                try {
                    report.outcomes[i] = classifyFile(files[i], targetRoot, options, items[i]);
                } catch (const std::exception& e) {
                    items[i].reset();
                    failed(i, e);
                }
                if (!items[i]) finish(i);
            });
        }
        pool.join();
    }

    // Claim target names in input order.
    std::set<std::string> plannedNames;
    std::vector<MigrationResult> reservations(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (!items[i]) continue;
        if (m_stopRequested) {
            report.outcomes[i] = cancelledBeforeMigration(std::move(report.outcomes[i]));
            items[i].reset();
            finish(i);
            continue;
        }
        reservations[i] = m_executor->reserve(*items[i], plannedNames);
        if (options.dryRun) {
            ApplyMigration(report.outcomes[i], reservations[i], true);
        }
    }

    if (!options.dryRun) {
        WorkerPool pool(static_cast<std::size_t>(m_settings.workers));
        for (std::size_t i = 0; i < files.size(); ++i) {
            if (!items[i]) continue;
            pool.submit([this, i, &report, &items, &reservations, &failed, &finish]() {
                try {
                    if (m_stopRequested) {
                        report.outcomes[i] = cancelledBeforeMigration(std::move(report.outcomes[i]));
                    } else {
                        ApplyMigration(report.outcomes[i], m_executor->perform(*items[i], reservations[i]), false);
                    }
                } catch (const std::exception& e) {
                    failed(i, e);
                }
                finish(i);
            });
        }
        pool.join();
    }

    if (aggregator) {
        aggregator->stop();
        report.storeAppended = aggregator->appended();
        report.storeDuplicates = aggregator->duplicates();
        report.storeFailures = aggregator->failed();
    }
    if (!options.dryRun) {
        m_transferLog->end();
    }

    for (const auto& outcome : report.outcomes) {
        switch (outcome.status) {
            case domain::OutcomeStatus::Migrated: ++report.migrated; break;
            case domain::OutcomeStatus::Planned: ++report.planned; break;
            case domain::OutcomeStatus::ClassificationFailed: ++report.classificationFailed; break;
            case domain::OutcomeStatus::MigrationFailed: ++report.migrationFailed; break;
            case domain::OutcomeStatus::TimedOut: ++report.timedOut; break;
            case domain::OutcomeStatus::Cancelled: ++report.cancelled; break;
            case domain::OutcomeStatus::Error: ++report.errors; break;
        }
    }

    std::cout << "[OrganizerService] Done - migrated: " << report.migrated << ", planned: " << report.planned
              << ", unclassified: " << report.classificationFailed << ", failed: " << report.migrationFailed
              << ", timed out: " << report.timedOut << ", cancelled: " << report.cancelled
              << ", errors: " << report.errors << std::endl;
    return report;
}

domain::RestoreReport OrganizerService::restore(const std::string& session,
                                                const std::optional<std::vector<std::int64_t>>& operationIds,
                                                bool dryRun) {
    return m_transferLog->restore(session, operationIds, dryRun);
}

} // namespace tidyfile::application
