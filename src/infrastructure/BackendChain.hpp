/**
 * @file BackendChain.hpp
 * @brief Priority-ordered failover across summarizer backends with retry and backoff.
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/SummarizerBackend.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace tidyfile::infrastructure {

/**
 * @class BackendChain
 * @brief SummarizerBackend that tries each member in order, retrying each one.
 *
 * A member is retried up to RetryConfig::maxAttempts times when it throws
 * BackendError or returns no text, sleeping initialBackoffMs and multiplying
 * the pause by backoffMultiplier after every failure. The chain returns
 * nullopt once every member is exhausted; it never throws BackendError.
 */
class BackendChain : public domain::SummarizerBackend {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    BackendChain(std::vector<std::shared_ptr<domain::SummarizerBackend>> backends, RetryConfig retry,
                 Sleeper sleeper = nullptr);

    std::optional<std::string> complete(const std::vector<domain::ChatMessage>& messages) override;

    std::string name() const override;

    std::size_t size() const { return m_backends.size(); }

    /**
     * @brief Builds one backend per enabled entry, in priority order.
     *
     * Entries with an unknown kind or an unusable URL are logged and skipped.
     */
    static std::shared_ptr<BackendChain> FromConfig(const AppConfig& config);

    static std::shared_ptr<domain::SummarizerBackend> CreateBackend(const BackendConfig& config);

private:
    std::vector<std::shared_ptr<domain::SummarizerBackend>> m_backends;
    RetryConfig m_retry;
    Sleeper m_sleeper;
};

} // namespace tidyfile::infrastructure
