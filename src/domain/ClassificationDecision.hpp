/**
 * @file ClassificationDecision.hpp
 * @brief Result of the recursive classifier and the per-file context it works on.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/FileRecord.hpp"

namespace tidyfile::domain {

/**
 * @enum MatchDepth
 * @brief How far down the target tree a file got.
 */
enum class MatchDepth {
    Complete,  ///< Reached a directory without children, or the depth cap.
    Partial,   ///< Matched at least one level, then nothing matched below.
    Unmatched  ///< Nothing matched at the first level.
};

inline const char* MatchDepthToString(MatchDepth depth) {
    switch (depth) {
        case MatchDepth::Complete: return "complete";
        case MatchDepth::Partial: return "partial";
        case MatchDepth::Unmatched: return "unmatched";
    }
    return "unmatched";
}

/** @brief Seconds spent in each classification step. */
struct TimingInfo {
    double metadataSeconds = 0.0;
    double contentExtractionSeconds = 0.0;
    double summarySeconds = 0.0;
    double recommendationSeconds = 0.0;
    double totalSeconds = 0.0;
};

/**
 * @struct ClassificationDecision
 * @brief Path, per-level tags and reason for one file. Consumed once by the executor.
 */
struct ClassificationDecision {
    std::string relativePath;            ///< Generic ('/') path below the target root.
    std::vector<std::string> levelTags;  ///< One directory name per matched level.
    std::string reason;
    bool success = false;
    MatchDepth depth = MatchDepth::Unmatched;
    std::string summary;                 ///< Backend summary, empty if never generated.
    TimingInfo timing;
};

/**
 * @struct ClassificationContext
 * @brief Per-file working state: lazily filled caches, discarded when the file is done.
 */
struct ClassificationContext {
    FileRecord file;
    std::optional<std::string> content;  ///< Bounded text prefix, once extracted.
    std::optional<std::string> summary;  ///< Backend summary, once generated.
    bool backendAvailable = true;        ///< Cleared after the first exhausted backend call.
    std::vector<std::string> levelTags;
    TimingInfo timing;

    explicit ClassificationContext(FileRecord record) : file(std::move(record)) {}
};

} // namespace tidyfile::domain
