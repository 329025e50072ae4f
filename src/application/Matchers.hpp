/**
 * @file Matchers.hpp
 * @brief The four directory matching heuristics, in the order the classifier applies them.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/ContentSummarizer.hpp"
#include "domain/ClassificationRules.hpp"
#include "domain/Matcher.hpp"

namespace tidyfile::application {

/**
 * @class TemporalMatcher
 * @brief A year found in the file name equals a year found in a candidate name.
 *
 * A year is the leading four digits of any run of four or more digits,
 * kept only inside [minYear, maxYear]. Never touches content or the backend.
 */
class TemporalMatcher : public domain::Matcher {
public:
    TemporalMatcher(int minYear, int maxYear) : m_minYear(minYear), m_maxYear(maxYear) {}

    std::optional<domain::MatchResult> tryMatch(const domain::MatchRequest& request) override;
    const char* name() const override { return "temporal"; }

    std::vector<int> extractYears(const std::string& text) const;

private:
    int m_minYear;
    int m_maxYear;
};

/** @brief The candidate name appears in the file name, ignoring case; the longest one wins. */
class LiteralMatcher : public domain::Matcher {
public:
    std::optional<domain::MatchResult> tryMatch(const domain::MatchRequest& request) override;
    const char* name() const override { return "literal"; }
};

/**
 * @class ContentAssistedMatcher
 * @brief Asks the backend to pick a candidate given the file summary and the folder rules.
 *
 * The answer is accepted only when, after cleaning, it names a candidate
 * exactly or ignoring case.
 */
class ContentAssistedMatcher : public domain::Matcher {
public:
    ContentAssistedMatcher(std::shared_ptr<ContentSummarizer> summarizer,
                           std::shared_ptr<const domain::ClassificationRules> rules);

    std::optional<domain::MatchResult> tryMatch(const domain::MatchRequest& request) override;
    const char* name() const override { return "content"; }

    /** @brief Strips reasoning blocks, list markers, quotes and stray punctuation from an answer. */
    static std::string CleanAnswer(const std::string& answer);

    /** @brief Candidate named by the answer, exact match first, then ignoring case. */
    static std::optional<std::string> ResolveAnswer(const std::string& answer,
                                                    const std::vector<std::string>& candidates);

private:
    std::shared_ptr<ContentSummarizer> m_summarizer;
    std::shared_ptr<const domain::ClassificationRules> m_rules;
};

/**
 * @class FuzzyMatcher
 * @brief A keyword of the candidate name (or of its rule) occurs in the file name or summary.
 *
 * Name keywords are split on whitespace, '_', '-' and '.', and must be longer
 * than two characters. Uses the summary only if one was already generated.
 */
class FuzzyMatcher : public domain::Matcher {
public:
    explicit FuzzyMatcher(std::shared_ptr<const domain::ClassificationRules> rules);

    std::optional<domain::MatchResult> tryMatch(const domain::MatchRequest& request) override;
    const char* name() const override { return "fuzzy"; }

    static std::vector<std::string> Keywords(const std::string& directoryName);

private:
    std::shared_ptr<const domain::ClassificationRules> m_rules;
};

} // namespace tidyfile::application
