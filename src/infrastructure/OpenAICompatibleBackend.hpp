/**
 * @file OpenAICompatibleBackend.hpp
 * @brief SummarizerBackend over an OpenAI-style /chat/completions endpoint (also LM Studio).
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/SummarizerBackend.hpp"
#include "infrastructure/HttpEndpoint.hpp"

namespace tidyfile::infrastructure {

class OpenAICompatibleBackend : public domain::SummarizerBackend {
public:
    /**
     * @param baseUrl Including the API prefix, e.g. "http://localhost:1234/v1".
     * @param apiKey Sent as a Bearer token when not empty.
     * @throws domain::BackendError if the URL cannot be parsed.
     */
    OpenAICompatibleBackend(std::string displayName, const std::string& baseUrl, std::string model,
                            std::string apiKey, int timeoutSeconds);

    /** @throws domain::BackendError */
    std::optional<std::string> complete(const std::vector<domain::ChatMessage>& messages) override;

    std::string name() const override { return m_name; }

private:
    std::string m_name;
    HttpEndpoint m_endpoint;
    std::string m_model;
    std::string m_apiKey;
    int m_timeoutSeconds;
};

} // namespace tidyfile::infrastructure
