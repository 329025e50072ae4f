/**
 * @file ClassificationRules.hpp
 * @brief User-provided hints describing what belongs in a target folder.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

namespace tidyfile::domain {

struct ClassificationRule {
    std::string description;
    std::vector<std::string> keywords;
};

/**
 * @class ClassificationRules
 * @brief Folder name -> rule. Lookups are by exact folder name.
 */
class ClassificationRules {
public:
    ClassificationRules() = default;
    explicit ClassificationRules(std::map<std::string, ClassificationRule> rules) : m_rules(std::move(rules)) {}

    bool empty() const { return m_rules.empty(); }
    std::size_t size() const { return m_rules.size(); }

    const ClassificationRule* find(const std::string& folder) const {
        auto it = m_rules.find(folder);
        return it == m_rules.end() ? nullptr : &it->second;
    }

    /** @brief "folder: description" lines for the candidates that have a rule, in candidate order. */
    std::vector<std::string> describe(const std::vector<std::string>& candidates) const {
        std::vector<std::string> lines;
        for (const auto& candidate : candidates) {
            const ClassificationRule* rule = find(candidate);
            if (rule && !rule->description.empty()) {
                lines.push_back(candidate + ": " + rule->description);
            }
        }
        return lines;
    }

    const std::vector<std::string>& keywordsFor(const std::string& folder) const {
        static const std::vector<std::string> kNone;
        const ClassificationRule* rule = find(folder);
        return rule ? rule->keywords : kNone;
    }

private:
    std::map<std::string, ClassificationRule> m_rules;
};

} // namespace tidyfile::domain
