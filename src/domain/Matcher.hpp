/**
 * @file Matcher.hpp
 * @brief Strategy interface for picking a child directory at one recursion level.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/ClassificationDecision.hpp"

namespace tidyfile::domain {

/** @brief Candidate directory picked by a matcher. */
struct MatchResult {
    std::string directory;
    std::string reason;
};

/** @brief Input of one level: the candidates plus the file's working context. */
struct MatchRequest {
    const std::vector<std::string>& candidates;
    ClassificationContext& context;
    int level;
};

/**
 * @class Matcher
 * @brief One heuristic of the ordered chain. The classifier stops at the first match.
 */
class Matcher {
public:
    virtual ~Matcher() = default;

    virtual std::optional<MatchResult> tryMatch(const MatchRequest& request) = 0;

    /** @brief Short identifier used in logs. */
    virtual const char* name() const = 0;
};

} // namespace tidyfile::domain
