#include "infrastructure/OpenAICompatibleBackend.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace tidyfile::infrastructure {

using json = nlohmann::json;

OpenAICompatibleBackend::OpenAICompatibleBackend(std::string displayName, const std::string& baseUrl,
                                                 std::string model, std::string apiKey, int timeoutSeconds)
    : m_name(std::move(displayName)),
      m_model(std::move(model)),
      m_apiKey(std::move(apiKey)),
      m_timeoutSeconds(timeoutSeconds) {
    auto endpoint = HttpEndpoint::Parse(baseUrl);
    if (!endpoint) {
        throw domain::BackendError("invalid base URL: " + baseUrl);
    }
    m_endpoint = *endpoint;
}

std::optional<std::string> OpenAICompatibleBackend::complete(const std::vector<domain::ChatMessage>& messages) {
    json history = json::array();
    for (const auto& msg : messages) {
        history.push_back({{"role", domain::ChatMessage::RoleToString(msg.role)}, {"content", msg.content}});
    }

    json requestData = {
        {"model", m_model},
        {"messages", history},
        {"temperature", 0.0},
        {"stream", false}
    };

    httplib::Client cli(m_endpoint.origin);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeoutSeconds);

    httplib::Headers headers;
    if (!m_apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + m_apiKey);
    }

    auto res = cli.Post(m_endpoint.path("/chat/completions"), headers, requestData.dump(), "application/json");
    if (!res) {
        throw domain::BackendError(m_name + ": connection failed (" + httplib::to_string(res.error()) + ")");
    }
    if (res->status != 200) {
        throw domain::BackendError(m_name + ": HTTP " + std::to_string(res->status) + ": " + res->body);
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("choices") && body["choices"].is_array() && !body["choices"].empty()) {
            const auto& message = body["choices"][0]["message"];
            if (message.contains("content") && message["content"].is_string()) {
                std::string content = message["content"].get<std::string>();
                if (!content.empty()) return content;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[OpenAICompatibleBackend] JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace tidyfile::infrastructure
