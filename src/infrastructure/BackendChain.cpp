/**
 * @file BackendChain.cpp
 * @brief Implementation of BackendChain.
 */

#include "infrastructure/BackendChain.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/OllamaBackend.hpp"
#include "infrastructure/OpenAICompatibleBackend.hpp"
#include <iostream>
#include <thread>

namespace tidyfile::infrastructure {

BackendChain::BackendChain(std::vector<std::shared_ptr<domain::SummarizerBackend>> backends, RetryConfig retry,
                           Sleeper sleeper)
    : m_backends(std::move(backends)), m_retry(retry), m_sleeper(std::move(sleeper)) {
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds pause) { std::this_thread::sleep_for(pause); };
    }
}

std::string BackendChain::name() const {
    std::string joined;
    for (const auto& backend : m_backends) {
        if (!joined.empty()) joined += " > ";
        joined += backend->name();
    }
    return joined.empty() ? "(no backends)" : joined;
}

std::optional<std::string> BackendChain::complete(const std::vector<domain::ChatMessage>& messages) {
    for (const auto& backend : m_backends) {
        double pauseMs = static_cast<double>(m_retry.initialBackoffMs);
        for (int attempt = 1; attempt <= m_retry.maxAttempts; ++attempt) {
            try {
                auto answer = backend->complete(messages);
                if (answer) {
                    return answer;
                }
                std::cerr << "[BackendChain] " << backend->name() << " returned no text (attempt "
                          << attempt << "/" << m_retry.maxAttempts << ")" << std::endl;
            } catch (const domain::BackendError& e) {
                std::cerr << "[BackendChain] " << backend->name() << " failed (attempt " << attempt << "/"
                          << m_retry.maxAttempts << "): " << e.what() << std::endl;
            }
            if (attempt < m_retry.maxAttempts && pauseMs > 0.0) {
                m_sleeper(std::chrono::milliseconds(static_cast<long long>(pauseMs)));
                pauseMs *= m_retry.backoffMultiplier;
            }
        }
        std::cerr << "[BackendChain] " << backend->name() << " exhausted, failing over" << std::endl;
    }
    std::cerr << "[BackendChain] All backends exhausted" << std::endl;
    return std::nullopt;
}

std::shared_ptr<domain::SummarizerBackend> BackendChain::CreateBackend(const BackendConfig& config) {
    if (config.kind == "ollama") {
        return std::make_shared<OllamaBackend>(config.name, config.baseUrl, config.model, config.timeoutSeconds);
    }
    if (config.kind == "openai_compatible" || config.kind == "lm_studio") {
        return std::make_shared<OpenAICompatibleBackend>(config.name, config.baseUrl, config.model, config.apiKey,
                                                         config.timeoutSeconds);
    }
    throw domain::BackendError("unknown backend kind '" + config.kind + "'");
}

std::shared_ptr<BackendChain> BackendChain::FromConfig(const AppConfig& config) {
    std::vector<std::shared_ptr<domain::SummarizerBackend>> backends;
    for (const auto& entry : config.backends) {
        if (!entry.enabled) continue;
        try {
            backends.push_back(CreateBackend(entry));
            std::cout << "[BackendChain] Registered " << entry.name << " (" << entry.kind << ", priority "
                      << entry.priority << ")" << std::endl;
        } catch (const domain::BackendError& e) {
            std::cerr << "[BackendChain] Skipping backend " << entry.id << ": " << e.what() << std::endl;
        }
    }
    return std::make_shared<BackendChain>(std::move(backends), config.retry);
}

} // namespace tidyfile::infrastructure
