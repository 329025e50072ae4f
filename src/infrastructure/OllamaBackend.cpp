#include "infrastructure/OllamaBackend.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>

namespace tidyfile::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
}

OllamaBackend::OllamaBackend(std::string displayName, const std::string& baseUrl, std::string model,
                             int timeoutSeconds)
    : m_name(std::move(displayName)),
      m_configuredModel(model),
      m_model(std::move(model)),
      m_timeoutSeconds(timeoutSeconds) {
    auto endpoint = HttpEndpoint::Parse(baseUrl);
    if (!endpoint) {
        throw domain::BackendError("invalid Ollama base URL: " + baseUrl);
    }
    m_endpoint = *endpoint;
}

std::string OllamaBackend::resolveModel() {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    if (m_modelResolved) {
        return m_model;
    }
    auto installed = getAvailableModels();
    m_model = ChooseModel(m_configuredModel, installed);
    if (installed.empty()) {
        // Server not answering; ask again on the next request.
        return m_model;
    }
    m_modelResolved = true;
    if (m_model != m_configuredModel) {
        std::cout << "[OllamaBackend] " << m_name << " using model " << m_model
                  << (m_configuredModel.empty() ? "" : " instead of " + m_configuredModel) << std::endl;
    }
    return m_model;
}

std::string OllamaBackend::ChooseModel(const std::string& configured, const std::vector<std::string>& installed) {
    if (configured.empty()) {
        if (installed.empty()) {
            throw domain::BackendError("no model configured and none installed");
        }
        return installed.front();
    }
    if (std::find(installed.begin(), installed.end(), configured) != installed.end()) {
        return configured;
    }
    auto familyOf = [](const std::string& tag) { return tag.substr(0, tag.find(':')); };
    std::string family = familyOf(configured);
    for (const auto& tag : installed) {
        if (familyOf(tag) == family) {
            return tag;
        }
    }
    return configured;
}

std::optional<std::string> OllamaBackend::complete(const std::vector<domain::ChatMessage>& messages) {
    std::string model = resolveModel();

    json history = json::array();
    for (const auto& msg : messages) {
        history.push_back({{"role", domain::ChatMessage::RoleToString(msg.role)}, {"content", msg.content}});
    }

    json requestData = {
        {"model", model},
        {"messages", history},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };

    httplib::Client cli(m_endpoint.origin);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_timeoutSeconds);

    auto res = cli.Post(m_endpoint.path("/api/chat"), requestData.dump(), "application/json");
    if (!res) {
        throw domain::BackendError(m_name + ": connection failed (" + httplib::to_string(res.error()) + ")");
    }
    if (res->status != 200) {
        throw domain::BackendError(m_name + ": HTTP " + std::to_string(res->status) + ": " + res->body);
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("message") && body["message"].contains("content")) {
            std::string content = body["message"]["content"].get<std::string>();
            if (!content.empty()) return content;
        }
    } catch (const std::exception& e) {
        std::cerr << "[OllamaBackend] Chat JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaBackend::getAvailableModels() {
    httplib::Client cli(m_endpoint.origin);
    cli.set_read_timeout(5);

    auto res = cli.Get(m_endpoint.path("/api/tags"));
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaBackend] Tags JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        std::cerr << "[OllamaBackend] Could not list models at " << m_endpoint.origin << std::endl;
    }
    return models;
}

} // namespace tidyfile::infrastructure
