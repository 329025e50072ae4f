/**
 * @file TransferLog.hpp
 * @brief Write-ahead log of migration operations, one JSON document per session.
 */

#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/TransferOperation.hpp"

namespace tidyfile::infrastructure {

/**
 * @class TransferLog
 * @brief Session state machine Closed -> Open -> Closed with replay-based restore.
 *
 * Every append rewrites the whole session document through a temp file and an
 * atomic rename, so the document on disk is always complete. Appends from
 * several worker threads are serialized by an internal mutex; operation ids
 * strictly increase in append order.
 *
 * Session handles are either a session name (resolved inside the log
 * directory) or a path to a session document.
 */
class TransferLog {
public:
    explicit TransferLog(std::string logDirectory);

    /**
     * @brief Opens a new session document with zero operations.
     * @param name Session name, defaults to transfer_YYYYMMDD_HHMMSS.
     * @return Path of the session document.
     * @throws std::logic_error if a session is already open.
     * @throws domain::IOError if the document cannot be written.
     */
    std::string start(const std::optional<std::string>& name = std::nullopt);

    /**
     * @brief Appends one operation, assigning its id and timestamp.
     * @return The operation as stored.
     * @throws std::logic_error if no session is open.
     * @throws domain::IOError if the document cannot be rewritten; the operation is then not recorded.
     */
    domain::TransferOperation append(domain::TransferOperation operation);

    /**
     * @brief Stamps the end time and closes the session.
     * @throws std::logic_error if no session is open.
     */
    domain::SessionInfo end();

    bool isOpen() const;

    /** @brief Path of the open session document, empty when closed. */
    std::string currentSessionPath() const;

    /**
     * @brief Replays the inverse of the selected successful operations, newest first.
     * @param operationIds Operations to restore, all successful ones when nullopt.
     * @param dryRun Report what would be done without touching the filesystem.
     * @throws domain::LogCorruption if the session document is malformed.
     */
    domain::RestoreReport restore(const std::string& session,
                                  const std::optional<std::vector<std::int64_t>>& operationIds,
                                  bool dryRun);

    /** @brief Session document paths, newest first. */
    std::vector<std::string> listSessions() const;

    /** @throws domain::LogCorruption, domain::IOError */
    domain::TransferSession load(const std::string& session) const;

    /** @brief Counts of successful operations per kind and per target folder, plus bytes moved. */
    domain::SessionSummary summarize(const std::string& session) const;

    /**
     * @brief Deletes session documents last written more than the given number of days ago.
     * @return Number of deleted documents. The open session is never deleted.
     */
    int cleanupOlderThan(int days);

    std::string resolveSessionPath(const std::string& session) const;

    const std::string& directory() const { return m_logDirectory; }

    static nlohmann::json ToJson(const domain::TransferSession& session);
    static domain::TransferSession FromJson(const nlohmann::json& j);

private:
    void persist(const domain::TransferSession& session) const;
    domain::RestoreDetail restoreOne(const domain::TransferOperation& operation, bool dryRun) const;

    std::string m_logDirectory;
    mutable std::mutex m_mutex;
    std::optional<domain::TransferSession> m_session;
    std::string m_sessionPath;
    std::int64_t m_nextId = 1;
};

} // namespace tidyfile::infrastructure
