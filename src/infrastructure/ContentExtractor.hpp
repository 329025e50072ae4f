/**
 * @file ContentExtractor.hpp
 * @brief Bounded text extraction from plain text, PDF and DOCX files.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "domain/ContentSource.hpp"

namespace tidyfile::infrastructure {

/**
 * @class ContentExtractor
 * @brief domain::ContentSource backed by direct reads and external tools.
 *
 * PDF goes through `pdftotext` (first pages only), DOCX through
 * `unzip -p file word/document.xml` with the markup stripped. Images and
 * binary files yield nullopt.
 */
class ContentExtractor : public domain::ContentSource {
public:
    std::optional<std::string> extract(const std::string& path, std::size_t maxLength) override;

    static bool IsImageExtension(const std::string& extension);

    /** @brief Removes XML tags, turning paragraph ends into newlines. */
    static std::string StripXml(const std::string& xml);

    /** @brief At most maxBytes of s, cut at a UTF-8 character boundary. */
    static std::string TruncateUtf8(const std::string& s, std::size_t maxBytes);

    /** @brief True when at least 70% of the bytes look like text. */
    static bool LooksLikeText(const std::string& content);

private:
    static std::optional<std::string> ExtractText(const std::string& path, std::size_t maxLength);
    static std::optional<std::string> ExtractPdf(const std::string& path, std::size_t maxLength);
    static std::optional<std::string> ExtractDocx(const std::string& path, std::size_t maxLength);

    /** @brief Runs a shell command and captures at most maxBytes of stdout. */
    static std::optional<std::string> RunCommand(const std::string& cmd, std::size_t maxBytes);
    static std::string ShellQuote(const std::string& arg);
    static bool HasTool(const std::string& tool);
};

} // namespace tidyfile::infrastructure
