#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace tidyfile::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDirName = "TidyFile";

fs::path EnsureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << dir << ": " << ec.message() << std::endl;
    }
    return dir;
}

} // namespace

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / kAppDirName / "settings.json";
}

fs::path PathUtils::GetTransferLogDir() {
    return EnsureDir(GetDataHome() / kAppDirName / "transfer_logs");
}

fs::path PathUtils::GetResultStoreFile() {
    return EnsureDir(GetDataHome() / kAppDirName) / "ai_organize_result.json";
}

fs::path PathUtils::GetRulesFile() {
    return GetConfigHome() / kAppDirName / "classification_rules.json";
}

} // namespace tidyfile::infrastructure
