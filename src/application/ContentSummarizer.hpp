/**
 * @file ContentSummarizer.hpp
 * @brief Lazy, once-per-file content extraction and summary generation.
 */

#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include "domain/ClassificationDecision.hpp"
#include "domain/ContentSource.hpp"
#include "domain/SummarizerBackend.hpp"

namespace tidyfile::application {

/**
 * @class ContentSummarizer
 * @brief Fills ClassificationContext::content and ::summary on first request.
 *
 * A failed extraction caches an empty string; a failed backend call caches an
 * empty summary and clears ClassificationContext::backendAvailable, so neither
 * step is attempted twice for the same file.
 */
class ContentSummarizer {
public:
    ContentSummarizer(std::shared_ptr<domain::ContentSource> contentSource,
                      std::shared_ptr<domain::SummarizerBackend> backend,
                      std::size_t contentLength,
                      std::size_t summaryLength);

    const std::string& content(domain::ClassificationContext& ctx) const;
    const std::string& summary(domain::ClassificationContext& ctx) const;

    domain::SummarizerBackend& backend() const { return *m_backend; }

    /** @brief Removes <think> blocks, blank lines and surrounding whitespace from a model answer. */
    static std::string CleanResponse(const std::string& response);

private:
    std::shared_ptr<domain::ContentSource> m_contentSource;
    std::shared_ptr<domain::SummarizerBackend> m_backend;
    std::size_t m_contentLength;
    std::size_t m_summaryLength;
};

} // namespace tidyfile::application
