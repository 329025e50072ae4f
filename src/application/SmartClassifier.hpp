/**
 * @file SmartClassifier.hpp
 * @brief Level-by-level descent of a target tree driven by an ordered matcher chain.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/ClassificationDecision.hpp"
#include "domain/Matcher.hpp"

namespace tidyfile::application {

/**
 * @class SmartClassifier
 * @brief Picks one child directory per level until nothing matches, a leaf is reached or maxDepth.
 *
 * At every level the immediate subdirectories are listed in name order and
 * offered to the matchers in chain order; the first match wins. The result
 * path always exists below the target root: it is the deepest matched prefix.
 */
class SmartClassifier {
public:
    SmartClassifier(std::vector<std::shared_ptr<domain::Matcher>> matchers, int maxDepth);

    /**
     * @brief Classifies the file described by the context.
     *
     * Content and summary caches in the context are filled on demand and the
     * context is meant to be discarded afterwards.
     */
    domain::ClassificationDecision classify(domain::ClassificationContext& ctx, const std::string& targetRoot) const;

    int maxDepth() const { return m_maxDepth; }

private:
    std::vector<std::shared_ptr<domain::Matcher>> m_matchers;
    int m_maxDepth;
};

} // namespace tidyfile::application
