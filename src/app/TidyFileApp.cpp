/**
 * @file TidyFileApp.cpp
 * @brief Implementation of TidyFileApp.
 */

#include "app/TidyFileApp.hpp"
#include "application/Matchers.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/BackendChain.hpp"
#include "infrastructure/ClassificationRulesLoader.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/FileSystemScanner.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tidyfile::app {

namespace {

bool HasFlag(std::vector<std::string>& args, const std::string& flag) {
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it == flag) {
            args.erase(it);
            return true;
        }
    }
    return false;
}

std::optional<std::string> TakeOption(std::vector<std::string>& args, const std::string& option) {
    for (auto it = args.begin(); it != args.end(); ++it) {
        if (*it == option && it + 1 != args.end()) {
            std::string value = *(it + 1);
            args.erase(it, it + 2);
            return value;
        }
    }
    return std::nullopt;
}

std::vector<std::int64_t> ParseIds(const std::string& list) {
    std::vector<std::int64_t> ids;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) ids.push_back(std::stoll(item));
    }
    return ids;
}

void PrintDecision(const domain::ClassificationDecision& decision) {
    std::cout << "  path:   " << (decision.relativePath.empty() ? "(none)" : decision.relativePath) << "\n"
              << "  depth:  " << domain::MatchDepthToString(decision.depth) << "\n"
              << "  reason: " << decision.reason << "\n";
    if (!decision.summary.empty()) {
        std::cout << "  summary: " << decision.summary << "\n";
    }
}

} // namespace

void TidyFileApp::PrintUsage() {
    std::cout <<
        "Usage: tidyfile [--config <settings.json>] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  scan <dir>...                               List the files that would be processed\n"
        "  classify <file> <target-root>               Show where a file would go\n"
        "  organize <target-root> <dir>... [--apply] [--move] [--session <name>]\n"
        "                                              Classify and migrate (preview unless --apply)\n"
        "  restore <session> [--ids 1,2,...] [--apply] Undo a transfer session (preview unless --apply)\n"
        "  sessions                                    List transfer sessions, newest first\n"
        "  summary <session>                           Aggregate a transfer session\n"
        "  dedup <folder> [--apply]                    Remove duplicate files (preview unless --apply)\n"
        "  stats                                       Result store statistics\n"
        "  cleanup <days>                              Delete session documents older than <days>\n"
        "  config                                      Print the effective configuration\n";
}

bool TidyFileApp::Init(const std::optional<std::string>& configPath) {
    m_config = infrastructure::ConfigLoader::Load(configPath);

    // Dependency Injection / Composition Root
    auto backend = infrastructure::BackendChain::FromConfig(m_config);
    if (backend->size() == 0) {
        std::cerr << "[TidyFileApp] WARNING: No enabled backends. Content-assisted matching is disabled." << std::endl;
    }
    auto extractor = std::make_shared<infrastructure::ContentExtractor>();
    auto summarizer = std::make_shared<application::ContentSummarizer>(
        extractor, backend, m_config.classifier.contentExtractionLength, m_config.classifier.summaryLength);

    auto rules = std::make_shared<const domain::ClassificationRules>(
        infrastructure::ClassificationRulesLoader::Load(m_config.rulesFile));

    std::vector<std::shared_ptr<domain::Matcher>> matchers;
    matchers.push_back(std::make_shared<application::TemporalMatcher>(m_config.classifier.minYear,
                                                                      m_config.classifier.maxYear));
    matchers.push_back(std::make_shared<application::LiteralMatcher>());
    matchers.push_back(std::make_shared<application::ContentAssistedMatcher>(summarizer, rules));
    matchers.push_back(std::make_shared<application::FuzzyMatcher>(rules));

    m_services.backend = backend;
    m_services.summarizer = summarizer;
    m_services.classifier = std::make_shared<application::SmartClassifier>(std::move(matchers),
                                                                           m_config.classifier.maxDepth);
    m_services.transferLog = std::make_shared<infrastructure::TransferLog>(m_config.session.logDirectory);
    m_services.resultStore = std::make_shared<infrastructure::ResultStore>(
        m_config.session.resultStore, std::chrono::milliseconds(m_config.session.lockTimeoutMs));
    m_services.migrationExecutor = std::make_shared<application::MigrationExecutor>(m_services.transferLog);

    application::OrganizerService::Settings settings;
    settings.workers = m_config.session.workers;
    settings.classificationTimeout = std::chrono::milliseconds(
        static_cast<long long>(m_config.classifier.timeoutSeconds) * 1000);
    m_services.organizerService = std::make_unique<application::OrganizerService>(
        m_services.classifier, m_services.migrationExecutor, m_services.transferLog, m_services.resultStore,
        settings);
    m_services.duplicateCleaner = std::make_unique<application::DuplicateCleaner>(m_services.transferLog);
    return true;
}

int TidyFileApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto configPath = TakeOption(args, "--config");

    if (args.empty() || args[0] == "--help" || args[0] == "-h" || args[0] == "help") {
        PrintUsage();
        return args.empty() ? 1 : 0;
    }

    std::string command = args[0];
    args.erase(args.begin());

    if (!Init(configPath)) {
        std::cerr << "[TidyFileApp] Initialization failed" << std::endl;
        return 1;
    }

    try {
        if (command == "scan") return CmdScan(args);
        if (command == "classify") return CmdClassify(args);
        if (command == "organize") return CmdOrganize(args);
        if (command == "restore") return CmdRestore(args);
        if (command == "sessions") return CmdSessions();
        if (command == "summary") return CmdSummary(args);
        if (command == "dedup") return CmdDedup(args);
        if (command == "stats") return CmdStats();
        if (command == "cleanup") return CmdCleanup(args);
        if (command == "config") return CmdConfig();
    } catch (const domain::LogCorruption& e) {
        std::cerr << "[TidyFileApp] Corrupt document: " << e.what() << std::endl;
        return 2;
    } catch (const domain::IOError& e) {
        std::cerr << "[TidyFileApp] I/O error: " << e.what() << std::endl;
        return 2;
    } catch (const std::logic_error& e) {
        std::cerr << "[TidyFileApp] " << e.what() << std::endl;
        return 2;
    }

    std::cerr << "[TidyFileApp] Unknown command: " << command << std::endl;
    PrintUsage();
    return 1;
}

int TidyFileApp::CmdScan(const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    auto files = m_services.organizerService->scan(args);
    for (const auto& file : files) {
        std::cout << file.path << "\t" << file.sizeBytes << "\t"
                  << infrastructure::TimeUtils::ToIso8601(file.modified) << "\n";
    }
    std::cout << files.size() << " files" << std::endl;
    return 0;
}

int TidyFileApp::CmdClassify(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        PrintUsage();
        return 1;
    }
    auto file = infrastructure::FileSystemScanner::Capture(fs::absolute(args[0]).string());
    if (!file) {
        std::cerr << "[TidyFileApp] Not a readable file: " << args[0] << std::endl;
        return 1;
    }
    auto decision = m_services.organizerService->classify(*file, args[1]);
    std::cout << file->name << "\n";
    PrintDecision(decision);
    return decision.success ? 0 : 3;
}

int TidyFileApp::CmdOrganize(const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    application::OrganizeOptions options;
    options.dryRun = !HasFlag(rest, "--apply");
    bool move = HasFlag(rest, "--move");
    bool copy = HasFlag(rest, "--copy");
    options.operation = m_config.session.operation == "move" ? domain::OperationKind::Move
                                                              : domain::OperationKind::Copy;
    if (move) options.operation = domain::OperationKind::Move;
    if (copy) options.operation = domain::OperationKind::Copy;
    options.sessionName = TakeOption(rest, "--session");

    if (rest.size() < 2) {
        PrintUsage();
        return 1;
    }
    std::string targetRoot = fs::absolute(rest[0]).string();
    std::error_code ec;
    if (!fs::is_directory(targetRoot, ec)) {
        std::cerr << "[TidyFileApp] Target root is not a directory: " << targetRoot << std::endl;
        return 1;
    }

    std::vector<std::string> sources(rest.begin() + 1, rest.end());
    auto files = m_services.organizerService->scan(sources);
    auto report = m_services.organizerService->organize(files, targetRoot, options);

    for (const auto& outcome : report.outcomes) {
        std::cout << domain::OutcomeStatusToString(outcome.status) << "\t" << outcome.sourcePath;
        if (!outcome.targetPath.empty()) std::cout << " -> " << outcome.targetPath;
        if (!outcome.error.empty()) std::cout << "\t(" << outcome.error << ")";
        std::cout << "\n";
    }
    if (!report.sessionPath.empty()) {
        std::cout << "Session: " << report.sessionPath << "\n";
    }
    if (report.dryRun) {
        std::cout << "Preview only. Re-run with --apply to migrate." << std::endl;
    }
    return report.migrationFailed + report.errors > 0 ? 3 : 0;
}

int TidyFileApp::CmdRestore(const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    bool dryRun = !HasFlag(rest, "--apply");
    std::optional<std::vector<std::int64_t>> ids;
    if (auto list = TakeOption(rest, "--ids")) {
        try {
            ids = ParseIds(*list);
        } catch (const std::exception& e) {
            std::cerr << "[TidyFileApp] Invalid --ids '" << *list << "': " << e.what() << std::endl;
            return 1;
        }
    }
    if (rest.size() != 1) {
        PrintUsage();
        return 1;
    }

    auto report = m_services.organizerService->restore(rest[0], ids, dryRun);
    for (const auto& detail : report.details) {
        std::cout << "#" << detail.operationId << "\t" << domain::RestoreOutcomeToString(detail.outcome) << "\t"
                  << detail.targetPath << " -> " << detail.sourcePath;
        if (!detail.message.empty()) std::cout << "\t(" << detail.message << ")";
        std::cout << "\n";
    }
    std::cout << (dryRun ? "Would restore: " : "Restored: ") << report.restored
              << ", intact: " << report.alreadyIntact << ", skipped: " << report.skipped
              << ", failed: " << report.failed << std::endl;
    return report.failed > 0 ? 3 : 0;
}

int TidyFileApp::CmdSessions() {
    for (const auto& path : m_services.organizerService->listSessions()) {
        try {
            auto session = m_services.transferLog->load(path);
            std::cout << session.info.name << "\t" << session.info.startTime << "\t"
                      << session.info.successfulOperations << "/" << session.info.totalOperations << " ok"
                      << (session.info.endTime ? "" : "\t(open)") << "\n";
        } catch (const domain::LogCorruption& e) {
            std::cerr << "[TidyFileApp] " << e.what() << std::endl;
        }
    }
    return 0;
}

int TidyFileApp::CmdSummary(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return 1;
    }
    auto summary = m_services.organizerService->summarize(args[0]);
    std::cout << "Session:    " << summary.info.name << "\n"
              << "Started:    " << summary.info.startTime << "\n"
              << "Ended:      " << summary.info.endTime.value_or("(open)") << "\n"
              << "Operations: " << summary.info.totalOperations << " (" << summary.info.successfulOperations
              << " ok, " << summary.info.failedOperations << " failed)\n"
              << "Bytes:      " << summary.totalBytes << "\n";
    for (const auto& [kind, count] : summary.operationKinds) {
        std::cout << "  " << kind << ": " << count << "\n";
    }
    for (const auto& [folder, count] : summary.targetFolders) {
        std::cout << "  -> " << folder << ": " << count << "\n";
    }
    return 0;
}

int TidyFileApp::CmdDedup(const std::vector<std::string>& args) {
    std::vector<std::string> rest = args;
    bool dryRun = !HasFlag(rest, "--apply");
    if (rest.size() != 1) {
        PrintUsage();
        return 1;
    }
    auto report = m_services.duplicateCleaner->removeDuplicates(rest[0], dryRun);
    for (const auto& group : report.groups) {
        std::cout << group.contentHash << " (" << group.sizeBytes << " bytes) keep " << group.kept << "\n";
        for (const auto& path : group.removed) {
            std::cout << "  " << (dryRun ? "would delete " : "deleted ") << path << "\n";
        }
    }
    for (const auto& error : report.errors) {
        std::cerr << "[TidyFileApp] " << error << std::endl;
    }
    std::cout << report.duplicatesFound << " duplicates in " << report.filesScanned << " files";
    if (!dryRun) std::cout << ", " << report.deleted << " deleted, " << report.bytesFreed << " bytes freed";
    std::cout << std::endl;
    return report.errors.empty() ? 0 : 3;
}

int TidyFileApp::CmdStats() {
    auto stats = m_services.organizerService->statistics();
    std::cout << "Entries: " << stats.totalEntries << " (" << stats.successCount << " ok, " << stats.failureCount
              << " failed)\n";
    for (const auto& [status, count] : stats.byStatus) {
        std::cout << "  " << status << ": " << count << "\n";
    }
    for (const auto& [extension, count] : stats.byExtension) {
        std::cout << "  " << extension << ": " << count << "\n";
    }
    std::cout << "Recent:\n";
    for (const auto& entry : stats.recentEntries) {
        std::cout << "  " << entry.processedAt << "\t" << entry.fileName << "\t"
                  << domain::OutcomeStatusToString(entry.status) << "\t" << entry.targetFolder << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int TidyFileApp::CmdCleanup(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return 1;
    }
    int days = 0;
    try {
        days = std::stoi(args[0]);
    } catch (const std::exception& e) {
        std::cerr << "[TidyFileApp] Invalid day count '" << args[0] << "': " << e.what() << std::endl;
        return 1;
    }
    if (days < 0) {
        std::cerr << "[TidyFileApp] Day count must not be negative" << std::endl;
        return 1;
    }
    int deleted = m_services.organizerService->cleanupSessions(days);
    std::cout << deleted << " session documents deleted" << std::endl;
    return 0;
}

int TidyFileApp::CmdConfig() {
    std::cout << infrastructure::ConfigLoader::ToJson(m_config).dump(2) << std::endl;
    std::cout << "Backends: " << m_services.backend->name() << std::endl;
    return 0;
}

} // namespace tidyfile::app
