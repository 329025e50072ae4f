// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace tidyfile::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetSettingsFile();
    static std::filesystem::path GetTransferLogDir();
    static std::filesystem::path GetResultStoreFile();
    static std::filesystem::path GetRulesFile();
};

} // namespace tidyfile::infrastructure
