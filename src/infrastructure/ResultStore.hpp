/**
 * @file ResultStore.hpp
 * @brief Deduplicating, crash-safe JSON array of per-file outcome records.
 */

#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/CrossProcessLock.hpp"
#include "domain/ResultEntry.hpp"

namespace tidyfile::infrastructure {

enum class AppendStatus {
    Appended,
    Duplicate,   ///< Same (file name, final target path) exists; without a target, same source path too.
    Corrupted,   ///< The store exists but is not a JSON array; left untouched.
    IoFailure    ///< Lock timeout, unreadable store or failed write.
};

inline const char* AppendStatusToString(AppendStatus status) {
    switch (status) {
        case AppendStatus::Appended: return "appended";
        case AppendStatus::Duplicate: return "duplicate";
        case AppendStatus::Corrupted: return "corrupted";
        case AppendStatus::IoFailure: return "io_failure";
    }
    return "io_failure";
}

inline bool IsAppendSuccess(AppendStatus status) {
    return status == AppendStatus::Appended || status == AppendStatus::Duplicate;
}

struct BatchAppendResult {
    AppendStatus status = AppendStatus::Appended;  ///< Appended unless the whole batch was refused.
    int appended = 0;
    int duplicates = 0;
};

/**
 * @class ResultStore
 * @brief Read-all, append in memory, write temp, rename; under a mutex and a cross-process lock.
 *
 * Safe for concurrent use from threads of one process and from several
 * processes sharing the same store path.
 */
class ResultStore {
public:
    explicit ResultStore(std::string storePath,
                         std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(10000));

    AppendStatus append(const domain::ResultEntry& entry);

    /** @brief Appends every non-duplicate entry in one rewrite; duplicates inside the batch count once. */
    BatchAppendResult appendBatch(const std::vector<domain::ResultEntry>& entries);

    /**
     * @brief All entries in store order; empty if the store does not exist yet.
     * @throws domain::LogCorruption if the store is malformed.
     */
    std::vector<domain::ResultEntry> readAll() const;

    /** @throws domain::LogCorruption if the store is malformed. */
    domain::ResultStatistics statistics() const;

    const std::string& path() const { return m_storePath; }

    static nlohmann::json ToJson(const domain::ResultEntry& entry);
    static domain::ResultEntry FromJson(const nlohmann::json& j);

private:
    BatchAppendResult appendJson(const std::vector<nlohmann::json>& records);
    nlohmann::json readArray() const;

    std::string m_storePath;
    std::chrono::milliseconds m_lockTimeout;
    std::unique_ptr<domain::CrossProcessLock> m_fileLock;
    mutable std::mutex m_mutex;
};

} // namespace tidyfile::infrastructure
