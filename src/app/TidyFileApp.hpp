/**
 * @file TidyFileApp.hpp
 * @brief Composition root and command dispatcher of the tidyfile tool.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace tidyfile::app {

/**
 * @class TidyFileApp
 * @brief Loads the configuration, wires the services and runs one command.
 */
class TidyFileApp {
public:
    /**
     * @brief Parses the command line and runs the requested command.
     * @return Process exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Builds every service from the loaded configuration.
     * @return True if initialization succeeded.
     */
    bool Init(const std::optional<std::string>& configPath);

    int CmdScan(const std::vector<std::string>& args);
    int CmdClassify(const std::vector<std::string>& args);
    int CmdOrganize(const std::vector<std::string>& args);
    int CmdRestore(const std::vector<std::string>& args);
    int CmdSessions();
    int CmdSummary(const std::vector<std::string>& args);
    int CmdDedup(const std::vector<std::string>& args);
    int CmdStats();
    int CmdCleanup(const std::vector<std::string>& args);
    int CmdConfig();

    static void PrintUsage();

    infrastructure::AppConfig m_config;        ///< Effective configuration after path resolution.
    application::AppServices m_services;       ///< Wired services, valid after Init().
};

} // namespace tidyfile::app
