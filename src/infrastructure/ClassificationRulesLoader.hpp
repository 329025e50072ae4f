/**
 * @file ClassificationRulesLoader.hpp
 * @brief Reads the classification rules document.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "domain/ClassificationRules.hpp"

namespace tidyfile::infrastructure {

class ClassificationRulesLoader {
public:
    /**
     * @brief Loads {folder: {description, keywords[]}} or {folder: "description"}.
     * @return Empty rules when the file is missing or malformed (logged).
     */
    static domain::ClassificationRules Load(const std::string& path);

    static domain::ClassificationRules FromJson(const nlohmann::json& j);
};

} // namespace tidyfile::infrastructure
