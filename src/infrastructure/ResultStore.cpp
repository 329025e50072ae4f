/**
 * @file ResultStore.cpp
 * @brief Implementation of ResultStore.
 */

#include "infrastructure/ResultStore.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <tuple>
#include <utility>

namespace tidyfile::infrastructure {

using json = nlohmann::json;

namespace {

constexpr std::size_t kRecentEntries = 10;

// (file name, final target path); records without a target are told apart by their source path.
using DedupKey = std::tuple<std::string, std::string, std::string>;

DedupKey KeyOf(const json& record) {
    std::string target = record.value("final_target_path", "");
    std::string source = target.empty() ? record.value("source_path", "") : "";
    return {record.value("file_name", ""), target, source};
}

domain::OutcomeStatus ParseStatus(const std::string& value) {
    for (auto status : {domain::OutcomeStatus::Migrated, domain::OutcomeStatus::Planned,
                        domain::OutcomeStatus::ClassificationFailed, domain::OutcomeStatus::MigrationFailed,
                        domain::OutcomeStatus::TimedOut, domain::OutcomeStatus::Cancelled}) {
        if (value == domain::OutcomeStatusToString(status)) return status;
    }
    return domain::OutcomeStatus::Error;
}

domain::MatchDepth ParseDepth(const std::string& value) {
    if (value == domain::MatchDepthToString(domain::MatchDepth::Complete)) return domain::MatchDepth::Complete;
    if (value == domain::MatchDepthToString(domain::MatchDepth::Partial)) return domain::MatchDepth::Partial;
    return domain::MatchDepth::Unmatched;
}

domain::ErrorKind ParseErrorKind(const std::string& value) {
    for (auto kind : {domain::ErrorKind::IO, domain::ErrorKind::Backend, domain::ErrorKind::ClassificationFailure,
                      domain::ErrorKind::Collision, domain::ErrorKind::LogCorruption, domain::ErrorKind::Timeout,
                      domain::ErrorKind::Cancelled}) {
        if (value == domain::ErrorKindToString(kind)) return kind;
    }
    return domain::ErrorKind::None;
}

} // namespace

ResultStore::ResultStore(std::string storePath, std::chrono::milliseconds lockTimeout)
    : m_storePath(std::move(storePath)),
      m_lockTimeout(lockTimeout),
      m_fileLock(domain::CrossProcessLock::Create(m_storePath + ".lock")) {}

json ResultStore::ToJson(const domain::ResultEntry& e) {
    return {
        {"processed_at", e.processedAt},
        {"file_name", e.fileName},
        {"source_path", e.sourcePath},
        {"summary", e.summary},
        {"target_folder", e.targetFolder},
        {"final_target_path", e.finalTargetPath},
        {"operation", e.operation},
        {"status", domain::OutcomeStatusToString(e.status)},
        {"level_tags", e.levelTags},
        {"reason", e.reason},
        {"match_depth", domain::MatchDepthToString(e.depth)},
        {"timing", {
            {"metadata_extraction", e.timing.metadataSeconds},
            {"content_extraction", e.timing.contentExtractionSeconds},
            {"summary_generation", e.timing.summarySeconds},
            {"folder_recommendation", e.timing.recommendationSeconds},
            {"total_processing_time", e.timing.totalSeconds}
        }},
        {"file_metadata", {
            {"file_extension", e.extension},
            {"file_size", e.sizeBytes},
            {"created_time", e.createdTime},
            {"modified_time", e.modifiedTime}
        }},
        {"error_kind", domain::ErrorKindToString(e.errorKind)},
        {"error_message", e.errorMessage}
    };
}

domain::ResultEntry ResultStore::FromJson(const json& j) {
    domain::ResultEntry e;
    e.processedAt = j.value("processed_at", "");
    e.fileName = j.value("file_name", "");
    e.sourcePath = j.value("source_path", "");
    e.summary = j.value("summary", "");
    e.targetFolder = j.value("target_folder", "");
    e.finalTargetPath = j.value("final_target_path", "");
    e.operation = j.value("operation", "");
    e.status = ParseStatus(j.value("status", ""));
    if (j.contains("level_tags") && j["level_tags"].is_array()) {
        for (const auto& tag : j["level_tags"]) {
            if (tag.is_string()) e.levelTags.push_back(tag.get<std::string>());
        }
    }
    e.reason = j.value("reason", "");
    e.depth = ParseDepth(j.value("match_depth", ""));
    if (j.contains("timing") && j["timing"].is_object()) {
        const auto& t = j["timing"];
        e.timing.metadataSeconds = t.value("metadata_extraction", 0.0);
        e.timing.contentExtractionSeconds = t.value("content_extraction", 0.0);
        e.timing.summarySeconds = t.value("summary_generation", 0.0);
        e.timing.recommendationSeconds = t.value("folder_recommendation", 0.0);
        e.timing.totalSeconds = t.value("total_processing_time", 0.0);
    }
    if (j.contains("file_metadata") && j["file_metadata"].is_object()) {
        const auto& m = j["file_metadata"];
        e.extension = m.value("file_extension", "");
        e.sizeBytes = m.value("file_size", static_cast<std::uintmax_t>(0));
        e.createdTime = m.value("created_time", "");
        e.modifiedTime = m.value("modified_time", "");
    }
    e.errorKind = ParseErrorKind(j.value("error_kind", ""));
    e.errorMessage = j.value("error_message", "");
    return e;
}

json ResultStore::readArray() const {
    auto content = AtomicFileWriter::ReadAll(m_storePath);
    if (!content) {
        return json::array();
    }
    if (std::all_of(content->begin(), content->end(), [](unsigned char c) { return std::isspace(c); })) {
        return json::array();
    }
    json data = json::parse(*content, nullptr, false);
    if (data.is_discarded()) {
        throw domain::LogCorruption("result store is not valid JSON: " + m_storePath);
    }
    if (!data.is_array()) {
        throw domain::LogCorruption("result store root is not an array: " + m_storePath);
    }
    return data;
}

BatchAppendResult ResultStore::appendJson(const std::vector<json>& records) {
    BatchAppendResult result;
    std::lock_guard<std::mutex> lock(m_mutex);
    domain::CrossProcessLockGuard fileLock(*m_fileLock, m_lockTimeout);
    if (!fileLock.owned()) {
        std::cerr << "[ResultStore] Could not lock " << m_storePath << ", write refused" << std::endl;
        result.status = AppendStatus::IoFailure;
        return result;
    }

    json data;
    try {
        data = readArray();
    } catch (const domain::LogCorruption& e) {
        std::cerr << "[ResultStore] " << e.what() << "; refusing to overwrite" << std::endl;
        result.status = AppendStatus::Corrupted;
        return result;
    } catch (const domain::IOError& e) {
        std::cerr << "[ResultStore] " << e.what() << std::endl;
        result.status = AppendStatus::IoFailure;
        return result;
    }

    std::set<DedupKey> keys;
    for (const auto& existing : data) {
        if (existing.is_object()) keys.insert(KeyOf(existing));
    }
    for (const auto& record : records) {
        if (keys.insert(KeyOf(record)).second) {
            data.push_back(record);
            ++result.appended;
        } else {
            ++result.duplicates;
        }
    }

    if (result.appended == 0) {
        result.status = AppendStatus::Duplicate;
        return result;
    }
    if (!AtomicFileWriter::Write(m_storePath, data.dump(2))) {
        std::cerr << "[ResultStore] Write failed for " << m_storePath << std::endl;
        result.status = AppendStatus::IoFailure;
        result.appended = 0;
        return result;
    }
    result.status = AppendStatus::Appended;
    return result;
}

AppendStatus ResultStore::append(const domain::ResultEntry& entry) {
    AppendStatus status = appendJson({ToJson(entry)}).status;
    if (status == AppendStatus::Duplicate) {
        std::cout << "[ResultStore] Duplicate skipped: " << entry.fileName << std::endl;
    }
    return status;
}

BatchAppendResult ResultStore::appendBatch(const std::vector<domain::ResultEntry>& entries) {
    std::vector<json> records;
    records.reserve(entries.size());
    for (const auto& entry : entries) records.push_back(ToJson(entry));
    BatchAppendResult result = appendJson(records);
    std::cout << "[ResultStore] Batch: " << result.appended << " appended, " << result.duplicates
              << " duplicates (" << AppendStatusToString(result.status) << ")" << std::endl;
    return result;
}

std::vector<domain::ResultEntry> ResultStore::readAll() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    json data = readArray();
    std::vector<domain::ResultEntry> entries;
    entries.reserve(data.size());
    for (const auto& record : data) {
        if (record.is_object()) entries.push_back(FromJson(record));
    }
    return entries;
}

domain::ResultStatistics ResultStore::statistics() const {
    auto entries = readAll();
    domain::ResultStatistics stats;
    stats.totalEntries = static_cast<int>(entries.size());
    for (const auto& e : entries) {
        if (domain::IsSuccessfulOutcome(e.status)) {
            ++stats.successCount;
        } else {
            ++stats.failureCount;
        }
        stats.byStatus[domain::OutcomeStatusToString(e.status)] += 1;
        stats.byExtension[e.extension.empty() ? "(none)" : e.extension] += 1;
    }
    std::size_t first = entries.size() > kRecentEntries ? entries.size() - kRecentEntries : 0;
    stats.recentEntries.assign(entries.begin() + static_cast<std::ptrdiff_t>(first), entries.end());
    return stats;
}

} // namespace tidyfile::infrastructure
