/**
 * @file SmartClassifier.cpp
 * @brief Implementation of SmartClassifier.
 */

#include "application/SmartClassifier.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/FileSystemScanner.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace tidyfile::application {

SmartClassifier::SmartClassifier(std::vector<std::shared_ptr<domain::Matcher>> matchers, int maxDepth)
    : m_matchers(std::move(matchers)), m_maxDepth(std::max(1, maxDepth)) {}

domain::ClassificationDecision SmartClassifier::classify(domain::ClassificationContext& ctx,
                                                         const std::string& targetRoot) const {
    auto start = std::chrono::steady_clock::now();
    domain::ClassificationDecision decision;
    std::vector<std::string> reasons;

    fs::path current(targetRoot);
    bool reachedEnd = false;  // leaf directory or depth cap

    for (int level = 1; level <= m_maxDepth; ++level) {
        auto candidates = infrastructure::FileSystemScanner::ListSubdirectories(current.string());
        if (candidates.empty()) {
            reachedEnd = true;
            if (level == 1) {
                reasons.push_back("target root has no subdirectories");
            }
            break;
        }

        std::optional<domain::MatchResult> match;
        const char* matcherName = "";
        domain::MatchRequest request{candidates, ctx, level};
        for (const auto& matcher : m_matchers) {
            try {
                match = matcher->tryMatch(request);
            } catch (const domain::IOError& e) {
                std::cerr << "[SmartClassifier] " << matcher->name() << " matcher I/O error on " << ctx.file.name
                          << ": " << e.what() << std::endl;
            } catch (const domain::BackendError& e) {
                std::cerr << "[SmartClassifier] " << matcher->name() << " matcher backend error on " << ctx.file.name
                          << ": " << e.what() << std::endl;
                ctx.backendAvailable = false;
            }
            if (match && std::find(candidates.begin(), candidates.end(), match->directory) == candidates.end()) {
                match.reset();
            }
            if (match) {
                matcherName = matcher->name();
                break;
            }
        }

        if (!match) {
            reasons.push_back("level " + std::to_string(level) + ": no matching directory");
            break;
        }

        reasons.push_back("level " + std::to_string(level) + ": " + matcherName + " - " + match->reason);
        ctx.levelTags.push_back(match->directory);
        current /= match->directory;

        if (level == m_maxDepth) {
            reachedEnd = true;
        }
    }

    decision.levelTags = ctx.levelTags;
    fs::path relative;
    for (const auto& tag : decision.levelTags) relative /= tag;
    decision.relativePath = relative.generic_string();

    decision.success = !decision.levelTags.empty();
    if (!decision.success) {
        decision.depth = domain::MatchDepth::Unmatched;
    } else {
        decision.depth = reachedEnd ? domain::MatchDepth::Complete : domain::MatchDepth::Partial;
    }

    for (std::size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) decision.reason += "; ";
        decision.reason += reasons[i];
    }

    decision.summary = ctx.summary.value_or("");
    ctx.timing.totalSeconds += std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    decision.timing = ctx.timing;
    return decision;
}

} // namespace tidyfile::application
