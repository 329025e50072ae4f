/**
 * @file TransferLog.cpp
 * @brief Implementation of TransferLog.
 */

#include "infrastructure/TransferLog.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/FileTransfer.hpp"
#include "infrastructure/TimeUtils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tidyfile::infrastructure {

using json = nlohmann::json;

namespace {

json OptionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> ReadOptionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

json OperationToJson(const domain::TransferOperation& op) {
    return {
        {"operation_id", op.id},
        {"timestamp", op.timestamp},
        {"operation_type", domain::OperationKindToString(op.kind)},
        {"source_path", op.sourcePath},
        {"target_path", op.targetPath},
        {"target_folder", op.targetFolder},
        {"file_size", op.fileSize},
        {"md5", OptionalString(op.contentHash)},
        {"ctime", op.createdTime ? json(*op.createdTime) : json(nullptr)},
        {"success", op.success},
        {"error_message", OptionalString(op.errorMessage)}
    };
}

domain::TransferOperation OperationFromJson(const json& j) {
    domain::TransferOperation op;
    op.id = j.at("operation_id").get<std::int64_t>();
    op.timestamp = j.value("timestamp", "");
    auto kind = domain::OperationKindFromString(j.at("operation_type").get<std::string>());
    if (!kind) {
        throw domain::LogCorruption("unknown operation_type '" + j.at("operation_type").get<std::string>() + "'");
    }
    op.kind = *kind;
    op.sourcePath = j.at("source_path").get<std::string>();
    op.targetPath = j.value("target_path", "");
    op.targetFolder = j.value("target_folder", "");
    op.success = j.at("success").get<bool>();
    op.errorMessage = ReadOptionalString(j, "error_message");
    if (j.contains("file_size") && j["file_size"].is_number()) {
        op.fileSize = j["file_size"].get<std::uintmax_t>();
    }
    op.contentHash = ReadOptionalString(j, "md5");
    if (j.contains("ctime") && j["ctime"].is_number()) {
        op.createdTime = j["ctime"].get<double>();
    }
    return op;
}

} // namespace

TransferLog::TransferLog(std::string logDirectory) : m_logDirectory(std::move(logDirectory)) {
    std::error_code ec;
    fs::create_directories(m_logDirectory, ec);
    if (ec) {
        std::cerr << "[TransferLog] Cannot create log directory " << m_logDirectory << ": " << ec.message() << std::endl;
    }
}

json TransferLog::ToJson(const domain::TransferSession& session) {
    json operations = json::array();
    for (const auto& op : session.operations) {
        operations.push_back(OperationToJson(op));
    }
    return {
        {"session_info", {
            {"session_name", session.info.name},
            {"start_time", session.info.startTime},
            {"end_time", OptionalString(session.info.endTime)},
            {"total_operations", session.info.totalOperations},
            {"successful_operations", session.info.successfulOperations},
            {"failed_operations", session.info.failedOperations}
        }},
        {"operations", operations}
    };
}

domain::TransferSession TransferLog::FromJson(const json& j) {
    try {
        if (!j.is_object() || !j.contains("session_info") || !j.contains("operations") ||
            !j["operations"].is_array()) {
            throw domain::LogCorruption("missing session_info or operations");
        }
        const auto& info = j["session_info"];
        domain::TransferSession session;
        session.info.name = info.at("session_name").get<std::string>();
        session.info.startTime = info.value("start_time", "");
        session.info.endTime = ReadOptionalString(info, "end_time");
        session.info.totalOperations = info.value("total_operations", 0);
        session.info.successfulOperations = info.value("successful_operations", 0);
        session.info.failedOperations = info.value("failed_operations", 0);
        for (const auto& op : j["operations"]) {
            session.operations.push_back(OperationFromJson(op));
        }
        return session;
    } catch (const json::exception& e) {
        throw domain::LogCorruption(std::string("malformed session document: ") + e.what());
    }
}

void TransferLog::persist(const domain::TransferSession& session) const {
    if (!AtomicFileWriter::Write(m_sessionPath, ToJson(session).dump(2))) {
        throw domain::IOError("cannot write session document " + m_sessionPath);
    }
}

std::string TransferLog::start(const std::optional<std::string>& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_session) {
        throw std::logic_error("transfer session '" + m_session->info.name + "' is already open");
    }

    auto now = std::chrono::system_clock::now();
    std::string baseName = name && !name->empty() ? *name : "transfer_" + TimeUtils::ToCompact(now);
    std::string sessionName = baseName;
    for (int i = 1; fs::exists(fs::path(m_logDirectory) / (sessionName + ".json")); ++i) {
        sessionName = baseName + "_" + std::to_string(i);
    }

    domain::TransferSession session;
    session.info.name = sessionName;
    session.info.startTime = TimeUtils::ToIso8601(now);

    m_sessionPath = (fs::path(m_logDirectory) / (sessionName + ".json")).string();
    try {
        persist(session);
    } catch (const domain::IOError&) {
        m_sessionPath.clear();
        throw;
    }
    m_session = std::move(session);
    m_nextId = 1;

    std::cout << "[TransferLog] Session started: " << sessionName << std::endl;
    return m_sessionPath;
}

domain::TransferOperation TransferLog::append(domain::TransferOperation operation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) {
        throw std::logic_error("append without an open transfer session");
    }

    operation.id = m_nextId;
    operation.timestamp = TimeUtils::NowIso8601();

    domain::TransferSession updated = *m_session;
    updated.operations.push_back(operation);
    updated.info.totalOperations += 1;
    if (operation.success) {
        updated.info.successfulOperations += 1;
    } else {
        updated.info.failedOperations += 1;
    }

    persist(updated);
    m_session = std::move(updated);
    ++m_nextId;
    return operation;
}

domain::SessionInfo TransferLog::end() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) {
        throw std::logic_error("end without an open transfer session");
    }

    m_session->info.endTime = TimeUtils::NowIso8601();
    try {
        persist(*m_session);
    } catch (const domain::IOError& e) {
        std::cerr << "[TransferLog] Could not stamp end time: " << e.what() << std::endl;
    }

    domain::SessionInfo info = m_session->info;
    std::cout << "[TransferLog] Session ended: " << info.name << " (" << info.successfulOperations << " ok, "
              << info.failedOperations << " failed)" << std::endl;
    m_session.reset();
    m_sessionPath.clear();
    return info;
}

bool TransferLog::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session.has_value();
}

std::string TransferLog::currentSessionPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessionPath;
}

std::string TransferLog::resolveSessionPath(const std::string& session) const {
    std::error_code ec;
    if (fs::is_regular_file(session, ec)) {
        return session;
    }
    fs::path candidate = fs::path(m_logDirectory) / session;
    if (candidate.extension() != ".json") {
        candidate += ".json";
    }
    return candidate.string();
}

domain::TransferSession TransferLog::load(const std::string& session) const {
    std::string path = resolveSessionPath(session);
    auto content = AtomicFileWriter::ReadAll(path);
    if (!content) {
        throw domain::IOError("session document not found: " + path);
    }
    json j = json::parse(*content, nullptr, false);
    if (j.is_discarded()) {
        throw domain::LogCorruption("session document is not valid JSON: " + path);
    }
    return FromJson(j);
}

std::vector<std::string> TransferLog::listSessions() const {
    std::vector<std::pair<fs::file_time_type, std::string>> found;
    std::error_code ec;
    for (fs::directory_iterator it(m_logDirectory, ec), endIt; !ec && it != endIt; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".json") {
            std::error_code timeEc;
            auto mtime = fs::last_write_time(it->path(), timeEc);
            found.emplace_back(mtime, it->path().string());
        }
    }
    if (ec) {
        std::cerr << "[TransferLog] Cannot list " << m_logDirectory << ": " << ec.message() << std::endl;
    }

    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second > b.second;
    });

    std::vector<std::string> paths;
    for (auto& entry : found) paths.push_back(std::move(entry.second));
    return paths;
}

domain::SessionSummary TransferLog::summarize(const std::string& session) const {
    domain::TransferSession loaded = load(session);
    domain::SessionSummary summary;
    summary.info = loaded.info;
    for (const auto& op : loaded.operations) {
        if (!op.success) continue;
        summary.operationKinds[domain::OperationKindToString(op.kind)] += 1;
        summary.targetFolders[op.targetFolder.empty() ? "unknown" : op.targetFolder] += 1;
        summary.totalBytes += op.fileSize;
    }
    return summary;
}

int TransferLog::cleanupOlderThan(int days) {
    auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24) * days;
    std::string openPath = currentSessionPath();
    int deleted = 0;

    for (const auto& path : listSessions()) {
        if (path == openPath) continue;
        std::error_code ec;
        auto mtime = fs::last_write_time(path, ec);
        if (ec || mtime >= cutoff) continue;
        if (fs::remove(path, ec)) {
            ++deleted;
            std::cout << "[TransferLog] Deleted old session document: " << path << std::endl;
        } else {
            std::cerr << "[TransferLog] Failed to delete " << path << ": " << ec.message() << std::endl;
        }
    }
    return deleted;
}

domain::RestoreReport TransferLog::restore(const std::string& session,
                                           const std::optional<std::vector<std::int64_t>>& operationIds,
                                           bool dryRun) {
    domain::TransferSession loaded = load(session);

    std::vector<domain::TransferOperation> selected;
    for (const auto& op : loaded.operations) {
        if (!op.success) continue;
        if (operationIds &&
            std::find(operationIds->begin(), operationIds->end(), op.id) == operationIds->end()) {
            continue;
        }
        selected.push_back(op);
    }
    // Undo newest first so chained operations on the same path unwind in order.
    std::sort(selected.begin(), selected.end(),
              [](const auto& a, const auto& b) { return a.id > b.id; });

    domain::RestoreReport report;
    report.dryRun = dryRun;
    report.totalOperations = static_cast<int>(selected.size());

    std::cout << "[TransferLog] Restoring " << selected.size() << " operations from " << loaded.info.name
              << (dryRun ? " (dry run)" : "") << std::endl;

    for (const auto& op : selected) {
        domain::RestoreDetail detail = restoreOne(op, dryRun);
        switch (detail.outcome) {
            case domain::RestoreOutcome::Restored:
            case domain::RestoreOutcome::WouldRestore:
                ++report.restored;
                break;
            case domain::RestoreOutcome::AlreadyIntact:
                ++report.alreadyIntact;
                break;
            case domain::RestoreOutcome::Skipped:
                ++report.skipped;
                break;
            case domain::RestoreOutcome::Failed:
                ++report.failed;
                break;
        }
        report.details.push_back(std::move(detail));
    }

    std::cout << "[TransferLog] Restore finished - restored: " << report.restored
              << ", intact: " << report.alreadyIntact << ", skipped: " << report.skipped
              << ", failed: " << report.failed << std::endl;
    return report;
}

domain::RestoreDetail TransferLog::restoreOne(const domain::TransferOperation& op, bool dryRun) const {
    domain::RestoreDetail detail;
    detail.operationId = op.id;
    detail.sourcePath = op.sourcePath;
    detail.targetPath = op.targetPath;
    detail.kind = op.kind;

    std::error_code ec;
    bool sourceExists = !op.sourcePath.empty() && fs::exists(op.sourcePath, ec);
    bool targetExists = !op.targetPath.empty() && fs::exists(op.targetPath, ec);

    if (sourceExists) {
        detail.outcome = domain::RestoreOutcome::AlreadyIntact;
        detail.message = "source still present";
        return detail;
    }
    if (!targetExists) {
        detail.outcome = domain::RestoreOutcome::Skipped;
        detail.message = "target missing";
        std::cerr << "[TransferLog] Skipping #" << op.id << ": target missing " << op.targetPath << std::endl;
        return detail;
    }
    if (dryRun) {
        detail.outcome = domain::RestoreOutcome::WouldRestore;
        detail.message = op.kind == domain::OperationKind::Move ? "would move back" : "would copy back";
        return detail;
    }

    try {
        if (op.kind == domain::OperationKind::Move) {
            FileTransfer::Move(op.targetPath, op.sourcePath);
            detail.message = "moved back";
        } else {
            // Copy and delete_duplicate both leave a surviving file at the target.
            FileTransfer::Copy(op.targetPath, op.sourcePath);
            detail.message = "copied back";
        }
        detail.outcome = domain::RestoreOutcome::Restored;
        std::cout << "[TransferLog] Restored #" << op.id << ": " << op.targetPath << " -> " << op.sourcePath << std::endl;
    } catch (const domain::IOError& e) {
        detail.outcome = domain::RestoreOutcome::Failed;
        detail.message = e.what();
        std::cerr << "[TransferLog] Restore of #" << op.id << " failed: " << e.what() << std::endl;
    }
    return detail;
}

} // namespace tidyfile::infrastructure
