/**
 * @file Matchers.cpp
 * @brief Implementation of the directory matching heuristics.
 */

#include "application/Matchers.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>

namespace tidyfile::application {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && ToLower(a) == ToLower(b);
}

std::string Trim(const std::string& s, const std::string& chars) {
    auto b = s.find_first_not_of(chars);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(chars);
    return s.substr(b, e - b + 1);
}

const std::string kWhitespace = " \t\r\n";

} // namespace

// TemporalMatcher

std::vector<int> TemporalMatcher::extractYears(const std::string& text) const {
    std::vector<int> years;
    std::size_t i = 0;
    while (i < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }
        std::size_t start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        if (i - start >= 4) {
            int year = std::stoi(text.substr(start, 4));
            if (year >= m_minYear && year <= m_maxYear &&
                std::find(years.begin(), years.end(), year) == years.end()) {
                years.push_back(year);
            }
        }
    }
    return years;
}

std::optional<domain::MatchResult> TemporalMatcher::tryMatch(const domain::MatchRequest& request) {
    auto fileYears = extractYears(request.context.file.name);
    for (int year : fileYears) {
        for (const auto& candidate : request.candidates) {
            auto dirYears = extractYears(candidate);
            if (std::find(dirYears.begin(), dirYears.end(), year) != dirYears.end()) {
                return domain::MatchResult{candidate, "year " + std::to_string(year) + " in file name matches " + candidate};
            }
        }
    }
    return std::nullopt;
}

// LiteralMatcher

std::optional<domain::MatchResult> LiteralMatcher::tryMatch(const domain::MatchRequest& request) {
    std::string fileName = ToLower(request.context.file.name);
    const std::string* best = nullptr;
    for (const auto& candidate : request.candidates) {
        if (candidate.empty()) continue;
        if (fileName.find(ToLower(candidate)) != std::string::npos) {
            if (!best || candidate.size() > best->size()) {
                best = &candidate;
            }
        }
    }
    if (!best) return std::nullopt;
    return domain::MatchResult{*best, "file name contains " + *best};
}

// ContentAssistedMatcher

ContentAssistedMatcher::ContentAssistedMatcher(std::shared_ptr<ContentSummarizer> summarizer,
                                               std::shared_ptr<const domain::ClassificationRules> rules)
    : m_summarizer(std::move(summarizer)), m_rules(std::move(rules)) {}

std::string ContentAssistedMatcher::CleanAnswer(const std::string& answer) {
    std::string text = ContentSummarizer::CleanResponse(answer);

    // First non-empty line
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        line = Trim(line, kWhitespace);
        if (!line.empty()) break;
    }

    // List markers: "1. ", "2) ", "3、", "- ", "* "
    std::size_t pos = 0;
    while (pos < line.size() && std::isdigit(static_cast<unsigned char>(line[pos]))) ++pos;
    if (pos > 0 && pos < line.size()) {
        if (line[pos] == '.' || line[pos] == ')') {
            line = line.substr(pos + 1);
        } else if (line.compare(pos, 3, "\xE3\x80\x81") == 0 || line.compare(pos, 3, "\xEF\xBC\x89") == 0) {
            line = line.substr(pos + 3);
        }
    } else if (!line.empty() && (line[0] == '-' || line[0] == '*') && line.size() > 1 && line[1] == ' ') {
        line = line.substr(2);
    }

    line = Trim(line, kWhitespace + "\"'`*");
    // "Directory: Finance" style prefixes
    auto colon = line.rfind(": ");
    if (colon != std::string::npos) {
        line = line.substr(colon + 2);
    }
    return Trim(line, kWhitespace + "\"'`*.,;:!?/\\");
}

std::optional<std::string> ContentAssistedMatcher::ResolveAnswer(const std::string& answer,
                                                                 const std::vector<std::string>& candidates) {
    std::string raw = Trim(ContentSummarizer::CleanResponse(answer), kWhitespace);
    std::string cleaned = CleanAnswer(answer);
    for (const std::string& attempt : {raw, cleaned}) {
        for (const auto& candidate : candidates) {
            if (attempt == candidate) return candidate;
        }
    }
    for (const std::string& attempt : {raw, cleaned}) {
        for (const auto& candidate : candidates) {
            if (EqualsIgnoreCase(attempt, candidate)) return candidate;
        }
    }
    return std::nullopt;
}

std::optional<domain::MatchResult> ContentAssistedMatcher::tryMatch(const domain::MatchRequest& request) {
    auto& ctx = request.context;
    if (!ctx.backendAvailable) {
        return std::nullopt;
    }

    const std::string& summary = m_summarizer->summary(ctx);
    if (!ctx.backendAvailable) {
        return std::nullopt;
    }

    std::vector<std::string> ruleLines;
    if (m_rules) {
        ruleLines = m_rules->describe(request.candidates);
    }

    auto start = std::chrono::steady_clock::now();
    std::optional<std::string> answer;
    try {
        answer = m_summarizer->backend().complete(infrastructure::PromptCatalog::BuildSelectionRequest(
            ctx.file.name, ctx.file.extension, summary, request.candidates, ruleLines));
    } catch (const domain::BackendError& e) {
        std::cerr << "[ContentAssistedMatcher] Backend error: " << e.what() << std::endl;
    }
    ctx.timing.recommendationSeconds += std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!answer) {
        ctx.backendAvailable = false;
        return std::nullopt;
    }

    auto resolved = ResolveAnswer(*answer, request.candidates);
    if (!resolved) {
        std::cerr << "[ContentAssistedMatcher] Rejected answer '" << CleanAnswer(*answer) << "' for "
                  << ctx.file.name << " at level " << request.level << ": not a candidate" << std::endl;
        return std::nullopt;
    }
    return domain::MatchResult{*resolved, "content summary matches " + *resolved};
}

// FuzzyMatcher

FuzzyMatcher::FuzzyMatcher(std::shared_ptr<const domain::ClassificationRules> rules) : m_rules(std::move(rules)) {}

std::vector<std::string> FuzzyMatcher::Keywords(const std::string& directoryName) {
    std::vector<std::string> keywords;
    std::string current;
    auto flush = [&]() {
        if (current.size() > 2) keywords.push_back(ToLower(current));
        current.clear();
    };
    for (char c : directoryName) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return keywords;
}

std::optional<domain::MatchResult> FuzzyMatcher::tryMatch(const domain::MatchRequest& request) {
    const auto& ctx = request.context;
    std::string haystack = ToLower(ctx.file.name + " " + ctx.summary.value_or(""));

    for (const auto& candidate : request.candidates) {
        auto keywords = Keywords(candidate);
        if (m_rules) {
            for (const auto& keyword : m_rules->keywordsFor(candidate)) {
                if (!keyword.empty()) keywords.push_back(ToLower(keyword));
            }
        }
        for (const auto& keyword : keywords) {
            if (haystack.find(keyword) != std::string::npos) {
                return domain::MatchResult{candidate, "keyword '" + keyword + "' matches " + candidate};
            }
        }
    }
    return std::nullopt;
}

} // namespace tidyfile::application
