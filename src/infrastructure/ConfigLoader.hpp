/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps the JSON parsing of backends, retry policy, classifier limits and
 * session paths in one place.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tidyfile::infrastructure {

/** @brief One summarizer endpoint entry of the "backends" list. */
struct BackendConfig {
    std::string id;
    std::string name;
    std::string kind = "ollama";  ///< "ollama", "openai_compatible" or "lm_studio".
    std::string baseUrl = "http://localhost:11434";
    std::string model = "qwen3:8b";
    std::string apiKey;
    int priority = 1;              ///< Lower values are tried first.
    bool enabled = true;
    int timeoutSeconds = 60;
};

struct RetryConfig {
    int maxAttempts = 3;
    int initialBackoffMs = 1000;
    double backoffMultiplier = 2.0;
};

struct ClassifierConfig {
    std::size_t contentExtractionLength = 2000;
    std::size_t summaryLength = 150;
    int maxDepth = 10;
    int timeoutSeconds = 180;
    int minYear = 1900;
    int maxYear = 2099;
};

struct SessionConfig {
    int workers = 4;
    std::string operation = "copy";  ///< Default migration for organize: "copy" or "move".
    std::string logDirectory;        ///< Empty means the XDG data directory.
    std::string resultStore;         ///< Empty means the XDG data directory.
    int lockTimeoutMs = 10000;
};

struct AppConfig {
    std::vector<BackendConfig> backends;
    RetryConfig retry;
    ClassifierConfig classifier;
    SessionConfig session;
    std::string rulesFile;  ///< Empty means the XDG config directory.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json.
     * @param path Explicit file, or nullopt for the XDG location.
     * @return Parsed configuration; built-in defaults when the file is missing or malformed.
     */
    static AppConfig Load(const std::optional<std::string>& path = std::nullopt);

    /** @brief Applies the keys present in the document over the defaults. */
    static AppConfig FromJson(const nlohmann::json& j);

    /** @brief Serializes the configuration, e.g. to write a starter settings.json. */
    static nlohmann::json ToJson(const AppConfig& config);

    /** @brief Fills empty directory and file settings with their XDG locations. */
    static void ResolvePaths(AppConfig& config);

    static AppConfig Defaults();
};

} // namespace tidyfile::infrastructure
