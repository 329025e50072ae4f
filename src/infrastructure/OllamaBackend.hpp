/**
 * @file OllamaBackend.hpp
 * @brief SummarizerBackend over the Ollama REST API.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/SummarizerBackend.hpp"
#include "infrastructure/HttpEndpoint.hpp"

namespace tidyfile::infrastructure {

class OllamaBackend : public domain::SummarizerBackend {
public:
    /**
     * @param baseUrl e.g. "http://localhost:11434".
     * @param model Configured model tag, checked against /api/tags on first use; empty takes the first installed.
     * @throws domain::BackendError if the URL cannot be parsed.
     */
    OllamaBackend(std::string displayName, const std::string& baseUrl, std::string model, int timeoutSeconds);

    /** @brief Sends a POST request to /api/chat. @throws domain::BackendError */
    std::optional<std::string> complete(const std::vector<domain::ChatMessage>& messages) override;

    std::string name() const override { return m_name; }

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    /**
     * @brief Model to request given the configured tag and the installed ones.
     *
     * The configured tag itself when installed, else an installed tag of the
     * same family ("qwen3" or "qwen3:14b" both accept "qwen3:8b"), else the
     * configured tag unchanged. With nothing configured, the first installed tag.
     * @throws domain::BackendError when nothing is configured and nothing is installed.
     */
    static std::string ChooseModel(const std::string& configured, const std::vector<std::string>& installed);

private:
    std::string resolveModel();

    std::string m_name;
    HttpEndpoint m_endpoint;
    std::string m_configuredModel;
    std::string m_model;
    bool m_modelResolved = false;
    int m_timeoutSeconds;
    std::mutex m_modelMutex;
};

} // namespace tidyfile::infrastructure
