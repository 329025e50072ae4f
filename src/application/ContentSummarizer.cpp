#include "application/ContentSummarizer.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>

namespace tidyfile::application {

namespace {

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string Trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

ContentSummarizer::ContentSummarizer(std::shared_ptr<domain::ContentSource> contentSource,
                                     std::shared_ptr<domain::SummarizerBackend> backend,
                                     std::size_t contentLength,
                                     std::size_t summaryLength)
    : m_contentSource(std::move(contentSource)),
      m_backend(std::move(backend)),
      m_contentLength(contentLength),
      m_summaryLength(summaryLength) {}

const std::string& ContentSummarizer::content(domain::ClassificationContext& ctx) const {
    if (!ctx.content) {
        auto start = std::chrono::steady_clock::now();
        std::optional<std::string> text;
        if (m_contentSource) {
            text = m_contentSource->extract(ctx.file.path, m_contentLength);
        }
        ctx.content = text.value_or("");
        ctx.timing.contentExtractionSeconds += SecondsSince(start);
    }
    return *ctx.content;
}

const std::string& ContentSummarizer::summary(domain::ClassificationContext& ctx) const {
    if (ctx.summary) {
        return *ctx.summary;
    }

    const std::string& text = content(ctx);
    if (Trim(text).size() < 10 || !ctx.backendAvailable || !m_backend) {
        ctx.summary = std::string();
        return *ctx.summary;
    }

    auto start = std::chrono::steady_clock::now();
    std::optional<std::string> answer;
    try {
        answer = m_backend->complete(infrastructure::PromptCatalog::BuildSummaryRequest(ctx.file.name, text, m_summaryLength));
    } catch (const domain::BackendError& e) {
        std::cerr << "[ContentSummarizer] Summary failed for " << ctx.file.name << ": " << e.what() << std::endl;
    }
    ctx.timing.summarySeconds += SecondsSince(start);

    if (!answer) {
        ctx.backendAvailable = false;
        ctx.summary = std::string();
        std::cerr << "[ContentSummarizer] Backend unavailable, continuing without summary for " << ctx.file.name
                  << std::endl;
    } else {
        ctx.summary = infrastructure::ContentExtractor::TruncateUtf8(CleanResponse(*answer), m_summaryLength);
    }
    return *ctx.summary;
}

std::string ContentSummarizer::CleanResponse(const std::string& response) {
    std::string text = response;
    for (;;) {
        auto open = text.find("<think>");
        if (open == std::string::npos) break;
        auto close = text.find("</think>", open);
        if (close == std::string::npos) {
            text.erase(open);
            break;
        }
        text.erase(open, close + 8 - open);
    }
    // A lone closing tag means the model streamed its reasoning without the opening tag.
    auto strayClose = text.find("</think>");
    if (strayClose != std::string::npos) {
        text.erase(0, strayClose + 8);
    }

    std::istringstream lines(text);
    std::string line;
    std::string joined;
    while (std::getline(lines, line)) {
        line = Trim(line);
        if (line.empty()) continue;
        if (!joined.empty()) joined += "\n";
        joined += line;
    }
    return joined;
}

} // namespace tidyfile::application
