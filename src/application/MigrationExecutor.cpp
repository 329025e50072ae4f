/**
 * @file MigrationExecutor.cpp
 * @brief Implementation of MigrationExecutor.
 */

#include "application/MigrationExecutor.hpp"
#include "infrastructure/FileHasher.hpp"
#include "infrastructure/FileSystemScanner.hpp"
#include "infrastructure/FileTransfer.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tidyfile::application {

namespace {

bool IsTaken(const fs::path& candidate, const std::set<std::string>& planned) {
    std::error_code ec;
    return fs::exists(candidate, ec) || planned.count(candidate.lexically_normal().string()) > 0;
}

} // namespace

MigrationExecutor::MigrationExecutor(std::shared_ptr<infrastructure::TransferLog> log) : m_log(std::move(log)) {}

std::string MigrationExecutor::ResolveTargetPath(const std::string& source, const std::string& targetDir,
                                                 const std::set<std::string>& planned) {
    fs::path src(source);
    fs::path dir(targetDir);
    fs::path candidate = dir / src.filename();
    if (!IsTaken(candidate, planned)) {
        return candidate.lexically_normal().string();
    }

    std::string stem = src.stem().string();
    std::string ext = src.extension().string();
    std::string stamp;
    auto record = infrastructure::FileSystemScanner::Capture(source);
    if (record) {
        stamp = infrastructure::TimeUtils::ToCompact(record->modified);
    } else {
        stamp = infrastructure::TimeUtils::ToCompact(std::chrono::system_clock::now());
    }

    std::string base = stem + "_" + stamp;
    candidate = dir / (base + ext);
    if (!IsTaken(candidate, planned)) {
        return candidate.lexically_normal().string();
    }
    for (int i = 1; i <= kMaxCollisionCounter; ++i) {
        candidate = dir / (base + "_" + std::to_string(i) + ext);
        if (!IsTaken(candidate, planned)) {
            return candidate.lexically_normal().string();
        }
    }
    throw domain::CollisionError("no free name for " + src.filename().string() + " in " + targetDir);
}

std::vector<MigrationResult> MigrationExecutor::executePlan(const std::vector<MigrationItem>& items, bool dryRun) {
    if (!dryRun && m_log && !m_log->isOpen()) {
        throw std::logic_error("executePlan requires an open transfer session");
    }
    std::set<std::string> planned;
    std::vector<MigrationResult> results;
    results.reserve(items.size());
    for (const auto& item : items) {
        results.push_back(executeOne(item, dryRun, planned));
    }
    return results;
}

MigrationResult MigrationExecutor::executeOne(const MigrationItem& item, bool dryRun, std::set<std::string>& planned) {
    MigrationResult reserved = reserve(item, planned);
    if (dryRun) {
        return reserved;
    }
    return perform(item, std::move(reserved));
}

bool MigrationExecutor::IsPlannable(const MigrationItem& item) {
    return !item.targetDir.empty() && item.operation && *item.operation != domain::OperationKind::DeleteDuplicate;
}

MigrationResult MigrationExecutor::reserve(const MigrationItem& item, std::set<std::string>& planned) {
    MigrationResult result;
    result.source = item.source;
    result.operation = item.operation;

    if (item.targetDir.empty() || !item.operation) {
        result.error = "missing target directory or operation";
        result.errorKind = domain::ErrorKind::ClassificationFailure;
        return result;
    }
    if (*item.operation == domain::OperationKind::DeleteDuplicate) {
        result.error = "delete_duplicate is not a migration";
        result.errorKind = domain::ErrorKind::IO;
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        if (!infrastructure::FileSystemScanner::Capture(item.source)) {
            throw domain::IOError("source missing or not a regular file: " + item.source);
        }
        result.target = ResolveTargetPath(item.source, item.targetDir, planned);
        planned.insert(result.target);
        result.success = true;
    } catch (const domain::CollisionError& e) {
        result.error = e.what();
        result.errorKind = domain::ErrorKind::Collision;
    } catch (const domain::IOError& e) {
        result.error = e.what();
        result.errorKind = domain::ErrorKind::IO;
    }
    return result;
}

MigrationResult MigrationExecutor::perform(const MigrationItem& item, MigrationResult reserved) {
    MigrationResult result = std::move(reserved);
    if (!IsPlannable(item)) {
        return result;
    }
    if (!result.success) {
        recordFailure(item, result);
        return result;
    }

    domain::TransferOperation op = makeOperation(item, result);
    try {
        if (*item.operation == domain::OperationKind::Move) {
            infrastructure::FileTransfer::Move(item.source, result.target);
        } else {
            infrastructure::FileTransfer::Copy(item.source, result.target);
        }
    } catch (const domain::IOError& e) {
        result.success = false;
        result.error = e.what();
        result.errorKind = domain::ErrorKind::IO;
        recordFailure(item, result);
        return result;
    }
    std::cout << "[MigrationExecutor] " << domain::OperationKindToString(*item.operation) << " " << item.source
              << " -> " << result.target << std::endl;

    if (!m_log) {
        return result;
    }
    op.success = true;
    try {
        result.operationId = m_log->append(op).id;
    } catch (const domain::IOError& e) {
        std::cerr << "[MigrationExecutor] Transfer log write failed for " << item.source << ": " << e.what()
                  << std::endl;
        bool undone = undo(item, result);
        result.success = false;
        result.error = std::string(undone ? "not migrated, transfer log unavailable: "
                                          : "migrated but not logged, undo failed: ") + e.what();
        result.errorKind = domain::ErrorKind::LogCorruption;
    }
    return result;
}

domain::TransferOperation MigrationExecutor::makeOperation(const MigrationItem& item,
                                                           const MigrationResult& result) const {
    domain::TransferOperation op;
    op.kind = *item.operation;
    op.sourcePath = item.source;
    op.targetPath = result.target;
    op.targetFolder = item.targetFolder.empty() ? fs::path(item.targetDir).filename().string() : item.targetFolder;
    op.success = result.success;
    op.errorMessage = result.error;

    auto record = infrastructure::FileSystemScanner::Capture(item.source);
    if (record) {
        op.fileSize = record->sizeBytes;
        op.createdTime = infrastructure::TimeUtils::ToEpochSeconds(record->created);
        if (result.success) {
            op.contentHash = infrastructure::FileHasher::Md5Hex(item.source);
        }
    }
    return op;
}

void MigrationExecutor::recordFailure(const MigrationItem& item, MigrationResult& result) {
    std::cerr << "[MigrationExecutor] Failed " << item.source << ": " << result.error.value_or("") << std::endl;
    if (!m_log) return;
    try {
        result.operationId = m_log->append(makeOperation(item, result)).id;
    } catch (const domain::IOError& e) {
        std::cerr << "[MigrationExecutor] Transfer log write failed for " << item.source << ": " << e.what()
                  << std::endl;
    }
}

bool MigrationExecutor::undo(const MigrationItem& item, const MigrationResult& result) const {
    try {
        if (*item.operation == domain::OperationKind::Move) {
            infrastructure::FileTransfer::Move(result.target, item.source);
        } else {
            infrastructure::FileTransfer::Remove(result.target);
        }
        std::cerr << "[MigrationExecutor] Undid unlogged " << domain::OperationKindToString(*item.operation) << " of "
                  << item.source << std::endl;
        return true;
    } catch (const domain::IOError& e) {
        std::cerr << "[MigrationExecutor] Could not undo unlogged migration, file left at " << result.target << ": "
                  << e.what() << std::endl;
        return false;
    }
}

} // namespace tidyfile::application
