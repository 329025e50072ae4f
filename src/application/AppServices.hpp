/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ContentSummarizer.hpp"
#include "application/DuplicateCleaner.hpp"
#include "application/MigrationExecutor.hpp"
#include "application/OrganizerService.hpp"
#include "application/SmartClassifier.hpp"
#include "domain/SummarizerBackend.hpp"
#include "infrastructure/ResultStore.hpp"
#include "infrastructure/TransferLog.hpp"

namespace tidyfile::application {

struct AppServices {
    std::shared_ptr<domain::SummarizerBackend> backend;
    std::shared_ptr<ContentSummarizer> summarizer;
    std::shared_ptr<SmartClassifier> classifier;
    std::shared_ptr<infrastructure::TransferLog> transferLog;
    std::shared_ptr<infrastructure::ResultStore> resultStore;
    std::shared_ptr<MigrationExecutor> migrationExecutor;
    std::unique_ptr<OrganizerService> organizerService;
    std::unique_ptr<DuplicateCleaner> duplicateCleaner;
};

} // namespace tidyfile::application
