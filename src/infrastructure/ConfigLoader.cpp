/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tidyfile::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

BackendConfig ParseBackend(const json& j, std::size_t index) {
    BackendConfig backend;
    ReadKey(j, "id", backend.id);
    ReadKey(j, "name", backend.name);
    ReadKey(j, "kind", backend.kind);
    ReadKey(j, "base_url", backend.baseUrl);
    ReadKey(j, "model", backend.model);
    ReadKey(j, "api_key", backend.apiKey);
    ReadKey(j, "priority", backend.priority);
    ReadKey(j, "enabled", backend.enabled);
    ReadKey(j, "timeout_seconds", backend.timeoutSeconds);
    if (backend.id.empty()) backend.id = "backend_" + std::to_string(index + 1);
    if (backend.name.empty()) backend.name = backend.kind + ":" + backend.model;
    return backend;
}

} // namespace

AppConfig ConfigLoader::Defaults() {
    AppConfig config;
    BackendConfig local;
    local.id = "ollama_local";
    local.name = "Local Ollama";
    config.backends.push_back(local);
    return config;
}

AppConfig ConfigLoader::FromJson(const json& j) {
    AppConfig config = Defaults();
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("backends") && j["backends"].is_array()) {
        config.backends.clear();
        const auto& list = j["backends"];
        for (std::size_t i = 0; i < list.size(); ++i) {
            if (list[i].is_object()) {
                config.backends.push_back(ParseBackend(list[i], i));
            }
        }
        std::stable_sort(config.backends.begin(), config.backends.end(),
                         [](const BackendConfig& a, const BackendConfig& b) { return a.priority < b.priority; });
    }

    if (j.contains("retry") && j["retry"].is_object()) {
        const auto& r = j["retry"];
        ReadKey(r, "max_attempts", config.retry.maxAttempts);
        ReadKey(r, "initial_backoff_ms", config.retry.initialBackoffMs);
        ReadKey(r, "backoff_multiplier", config.retry.backoffMultiplier);
        config.retry.maxAttempts = std::max(1, config.retry.maxAttempts);
    }

    if (j.contains("classifier") && j["classifier"].is_object()) {
        const auto& c = j["classifier"];
        ReadKey(c, "content_extraction_length", config.classifier.contentExtractionLength);
        ReadKey(c, "summary_length", config.classifier.summaryLength);
        ReadKey(c, "max_depth", config.classifier.maxDepth);
        ReadKey(c, "timeout_seconds", config.classifier.timeoutSeconds);
        ReadKey(c, "min_year", config.classifier.minYear);
        ReadKey(c, "max_year", config.classifier.maxYear);
        config.classifier.maxDepth = std::max(1, config.classifier.maxDepth);
    }

    if (j.contains("session") && j["session"].is_object()) {
        const auto& s = j["session"];
        ReadKey(s, "workers", config.session.workers);
        ReadKey(s, "operation", config.session.operation);
        ReadKey(s, "log_directory", config.session.logDirectory);
        ReadKey(s, "result_store", config.session.resultStore);
        ReadKey(s, "lock_timeout_ms", config.session.lockTimeoutMs);
        config.session.workers = std::max(1, config.session.workers);
        if (config.session.operation != "copy" && config.session.operation != "move") {
            std::cerr << "[ConfigLoader] Unknown session.operation '" << config.session.operation
                      << "', using copy" << std::endl;
            config.session.operation = "copy";
        }
    }

    ReadKey(j, "rules_file", config.rulesFile);
    return config;
}

json ConfigLoader::ToJson(const AppConfig& config) {
    json backends = json::array();
    for (const auto& b : config.backends) {
        backends.push_back({
            {"id", b.id},
            {"name", b.name},
            {"kind", b.kind},
            {"base_url", b.baseUrl},
            {"model", b.model},
            {"api_key", b.apiKey},
            {"priority", b.priority},
            {"enabled", b.enabled},
            {"timeout_seconds", b.timeoutSeconds}
        });
    }
    return {
        {"backends", backends},
        {"retry", {
            {"max_attempts", config.retry.maxAttempts},
            {"initial_backoff_ms", config.retry.initialBackoffMs},
            {"backoff_multiplier", config.retry.backoffMultiplier}
        }},
        {"classifier", {
            {"content_extraction_length", config.classifier.contentExtractionLength},
            {"summary_length", config.classifier.summaryLength},
            {"max_depth", config.classifier.maxDepth},
            {"timeout_seconds", config.classifier.timeoutSeconds},
            {"min_year", config.classifier.minYear},
            {"max_year", config.classifier.maxYear}
        }},
        {"session", {
            {"workers", config.session.workers},
            {"operation", config.session.operation},
            {"log_directory", config.session.logDirectory},
            {"result_store", config.session.resultStore},
            {"lock_timeout_ms", config.session.lockTimeoutMs}
        }},
        {"rules_file", config.rulesFile}
    };
}

void ConfigLoader::ResolvePaths(AppConfig& config) {
    if (config.session.logDirectory.empty()) {
        config.session.logDirectory = PathUtils::GetTransferLogDir().string();
    }
    if (config.session.resultStore.empty()) {
        config.session.resultStore = PathUtils::GetResultStoreFile().string();
    }
    if (config.rulesFile.empty()) {
        config.rulesFile = PathUtils::GetRulesFile().string();
    }
}

AppConfig ConfigLoader::Load(const std::optional<std::string>& path) {
    std::filesystem::path configPath = path ? std::filesystem::path(*path) : PathUtils::GetSettingsFile();
    AppConfig config = Defaults();

    if (!std::filesystem::exists(configPath)) {
        if (path) {
            std::cerr << "[ConfigLoader] " << configPath << " not found, using defaults" << std::endl;
        }
    } else {
        try {
            std::ifstream f(configPath);
            json j;
            f >> j;
            config = FromJson(j);
            std::cout << "[ConfigLoader] Loaded " << configPath << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what()
                      << ", using defaults" << std::endl;
            config = Defaults();
        }
    }

    ResolvePaths(config);
    return config;
}

} // namespace tidyfile::infrastructure
