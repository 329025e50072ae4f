#include "infrastructure/ClassificationRulesLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tidyfile::infrastructure {

using json = nlohmann::json;

domain::ClassificationRules ClassificationRulesLoader::FromJson(const json& j) {
    std::map<std::string, domain::ClassificationRule> rules;
    if (!j.is_object()) {
        return domain::ClassificationRules{};
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        domain::ClassificationRule rule;
        if (it.value().is_string()) {
            rule.description = it.value().get<std::string>();
        } else if (it.value().is_object()) {
            rule.description = it.value().value("description", "");
            if (it.value().contains("keywords") && it.value()["keywords"].is_array()) {
                for (const auto& keyword : it.value()["keywords"]) {
                    if (keyword.is_string()) rule.keywords.push_back(keyword.get<std::string>());
                }
            }
        } else {
            continue;
        }
        rules.emplace(it.key(), std::move(rule));
    }
    return domain::ClassificationRules(std::move(rules));
}

domain::ClassificationRules ClassificationRulesLoader::Load(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return domain::ClassificationRules{};
    }
    try {
        std::ifstream f(path);
        json j;
        f >> j;
        auto rules = FromJson(j);
        std::cout << "[ClassificationRules] Loaded " << rules.size() << " rules from " << path << std::endl;
        return rules;
    } catch (const std::exception& e) {
        std::cerr << "[ClassificationRules] Error reading " << path << ": " << e.what() << std::endl;
    }
    return domain::ClassificationRules{};
}

} // namespace tidyfile::infrastructure
