/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the summarizer and folder selection prompts.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/SummarizerBackend.hpp"

namespace tidyfile::infrastructure {

class PromptCatalog {
public:
    /** @brief Messages asking for a plain summary of at most maxLength characters. */
    static std::vector<domain::ChatMessage> BuildSummaryRequest(const std::string& fileName,
                                                                const std::string& content,
                                                                std::size_t maxLength);

    /** @brief Messages asking to pick exactly one of the candidate directories. */
    static std::vector<domain::ChatMessage> BuildSelectionRequest(const std::string& fileName,
                                                                  const std::string& extension,
                                                                  const std::string& summary,
                                                                  const std::vector<std::string>& candidates,
                                                                  const std::vector<std::string>& ruleLines);
};

} // namespace tidyfile::infrastructure
