#include "infrastructure/PromptCatalog.hpp"

namespace tidyfile::infrastructure {

namespace {
constexpr std::size_t kPromptContentLength = 1000;
constexpr std::size_t kPromptSummaryLength = 150;
}

std::vector<domain::ChatMessage> PromptCatalog::BuildSummaryRequest(const std::string& fileName,
                                                                    const std::string& content,
                                                                    std::size_t maxLength) {
    std::string system =
        "You are a document summarization expert. Output only the summary text, "
        "with no reasoning, tags or explanations.";

    std::string user =
        "Answer directly without thinking.\n\n"
        "Write a concise summary of the following file in at most " + std::to_string(maxLength) + " characters.\n\n"
        "File name: " + fileName + "\n"
        "File content:\n" + content.substr(0, kPromptContentLength) + "\n\n"
        "Return the summary only.\n\n"
        "/no_think";

    return {
        {domain::ChatMessage::Role::System, system},
        {domain::ChatMessage::Role::User, user}
    };
}

std::vector<domain::ChatMessage> PromptCatalog::BuildSelectionRequest(const std::string& fileName,
                                                                      const std::string& extension,
                                                                      const std::string& summary,
                                                                      const std::vector<std::string>& candidates,
                                                                      const std::vector<std::string>& ruleLines) {
    std::string system =
        "You are a file classification expert. Output a directory name only, "
        "with no reasoning, tags, numbering or explanations.";

    std::string user =
        "Answer directly without thinking.\n\n"
        "Pick the single directory from the list below that best fits this file.\n\n"
        "File:\n"
        "- Name: " + fileName + "\n"
        "- Extension: " + (extension.empty() ? "(none)" : extension) + "\n"
        "- Summary: " + (summary.empty() ? "(no summary)" : summary.substr(0, kPromptSummaryLength)) + "\n\n"
        "Directories (answer with one of these exactly, without numbers or punctuation):\n";
    for (const auto& candidate : candidates) {
        user += candidate + "\n";
    }

    if (!ruleLines.empty()) {
        user += "\nUser classification rules:\n";
        for (const auto& line : ruleLines) {
            user += line + "\n";
        }
    }

    user +=
        "\nMatching priority:\n"
        "1. A directory named after a date or year contained in the file name\n"
        "2. A directory whose name appears in the file name\n"
        "3. A directory whose topic matches the file content (see the rules above)\n"
        "4. A directory matching the file type\n\n"
        "Return only the directory name.\n\n"
        "/no_think";

    return {
        {domain::ChatMessage::Role::System, system},
        {domain::ChatMessage::Role::User, user}
    };
}

} // namespace tidyfile::infrastructure
