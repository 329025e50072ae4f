#include "application/DuplicateCleaner.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/FileHasher.hpp"
#include "infrastructure/FileSystemScanner.hpp"
#include "infrastructure/FileTransfer.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tidyfile::application {

DuplicateCleaner::DuplicateCleaner(std::shared_ptr<infrastructure::TransferLog> log) : m_log(std::move(log)) {}

DuplicateReport DuplicateCleaner::findDuplicates(const std::string& folder) const {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        throw domain::IOError("not a directory: " + folder);
    }

    DuplicateReport report;

    infrastructure::FileSystemScanner scanner;
    auto files = scanner.scan({folder});
    report.filesScanned = static_cast<int>(files.size());

    std::map<std::uintmax_t, std::vector<domain::FileRecord>> bySize;
    for (auto& file : files) {
        bySize[file.sizeBytes].push_back(std::move(file));
    }

    for (auto& [size, sameSize] : bySize) {
        if (sameSize.size() < 2) continue;

        std::map<std::string, std::vector<domain::FileRecord>> byHash;
        for (auto& file : sameSize) {
            auto hash = infrastructure::FileHasher::Md5Hex(file.path);
            if (!hash) {
                report.errors.push_back("cannot hash " + file.path);
                continue;
            }
            byHash[*hash].push_back(file);
        }

        for (auto& [hash, group] : byHash) {
            if (group.size() < 2) continue;
            std::stable_sort(group.begin(), group.end(), [](const auto& a, const auto& b) {
                if (a.created != b.created) return a.created < b.created;
                return a.path < b.path;
            });
            DuplicateGroup dup;
            dup.contentHash = hash;
            dup.sizeBytes = size;
            dup.kept = group.front().path;
            for (std::size_t i = 1; i < group.size(); ++i) {
                dup.removed.push_back(group[i].path);
            }
            report.duplicatesFound += static_cast<int>(dup.removed.size());
            report.groups.push_back(std::move(dup));
        }
    }
    return report;
}

DuplicateReport DuplicateCleaner::removeDuplicates(const std::string& folder, bool dryRun) {
    DuplicateReport report = findDuplicates(folder);
    report.dryRun = dryRun;

    std::cout << "[DuplicateCleaner] " << report.filesScanned << " files scanned, " << report.groups.size()
              << " duplicate groups, " << report.duplicatesFound << " duplicates"
              << (dryRun ? " (dry run)" : "") << std::endl;

    if (dryRun || report.duplicatesFound == 0 || !m_log) {
        return report;
    }

    report.sessionPath = m_log->start("dedup_" + fs::path(folder).filename().string() + "_" +
                                      infrastructure::TimeUtils::ToCompact(std::chrono::system_clock::now()));
    for (const auto& group : report.groups) {
        for (const auto& path : group.removed) {
            if (removeDuplicate(group, path, report.errors)) {
                ++report.deleted;
                report.bytesFreed += group.sizeBytes;
            }
        }
    }
    m_log->end();
    return report;
}

bool DuplicateCleaner::removeDuplicate(const DuplicateGroup& group, const std::string& path,
                                       std::vector<std::string>& errors) {
    if (!m_log || !m_log->isOpen()) {
        throw std::logic_error("removeDuplicate requires an open transfer session");
    }
    auto record = infrastructure::FileSystemScanner::Capture(path);

    domain::TransferOperation op;
    op.kind = domain::OperationKind::DeleteDuplicate;
    op.sourcePath = path;
    op.targetPath = group.kept;
    op.targetFolder = fs::path(path).parent_path().filename().string();
    op.fileSize = group.sizeBytes;
    op.contentHash = group.contentHash;
    if (record) op.createdTime = infrastructure::TimeUtils::ToEpochSeconds(record->created);

    fs::path aside = fs::path(path);
    aside += ".tidyfile-removing";
    try {
        infrastructure::FileTransfer::Move(path, aside);
    } catch (const domain::IOError& e) {
        op.success = false;
        op.errorMessage = e.what();
        errors.push_back(e.what());
        std::cerr << "[DuplicateCleaner] " << e.what() << std::endl;
        try {
            m_log->append(op);
        } catch (const domain::IOError& logError) {
            errors.push_back(std::string("transfer log: ") + logError.what());
            std::cerr << "[DuplicateCleaner] Transfer log write failed: " << logError.what() << std::endl;
        }
        return false;
    }

    op.success = true;
    try {
        m_log->append(op);
    } catch (const domain::IOError& e) {
        errors.push_back(std::string("transfer log: ") + e.what() + ", kept " + path);
        std::cerr << "[DuplicateCleaner] Transfer log write failed, keeping " << path << ": " << e.what()
                  << std::endl;
        try {
            infrastructure::FileTransfer::Move(aside, path);
        } catch (const domain::IOError& putBack) {
            errors.push_back(putBack.what());
            std::cerr << "[DuplicateCleaner] Could not put back " << path << ": " << putBack.what() << std::endl;
        }
        return false;
    }

    try {
        infrastructure::FileTransfer::Remove(aside);
    } catch (const domain::IOError& e) {
        errors.push_back(e.what());
        std::cerr << "[DuplicateCleaner] " << e.what() << std::endl;
    }
    std::cout << "[DuplicateCleaner] Deleted " << path << " (kept " << group.kept << ")" << std::endl;
    return true;
}

} // namespace tidyfile::application
