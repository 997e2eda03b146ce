/**
 * Campaign Keeper - Configuration Manager
 *
 * Manages the program configuration file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>

#include <spdlog/common.h>

namespace keeper {

/**
 * Program-wide settings
 */
struct ProgramConfig {
    std::filesystem::path campaignsDirectory;      // Root holding one folder per campaign
    std::string activeCampaign;                    // Campaign selected at startup, may be empty
    std::string entityExtension = ".md";           // Extension of entity files
    std::string logVerbosity = "info";             // debug, info, warning, error
    int lockStallWarningSeconds = 30;              // 0 disables stall warnings
};

/**
 * Convert a verbosity string from the config file to a spdlog level
 */
spdlog::level::level_enum logLevelFromString(const std::string& verbosity);

/**
 * Central configuration manager
 *
 * Handles loading, saving, and providing access to the program config.
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Lifecycle
    bool initialize(const std::filesystem::path& configDirectory);
    bool save();

    // State queries
    bool isFirstRun() const { return m_isFirstRun; }
    const std::filesystem::path& configDirectory() const { return m_configDirectory; }
    std::filesystem::path logDirectory() const { return m_configDirectory / "logs"; }

    // Program config
    const ProgramConfig& programConfig() const { return m_programConfig; }
    bool setProgramConfig(const ProgramConfig& config);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadProgramConfig();
    bool saveProgramConfig();

    std::filesystem::path m_configDirectory;
    bool m_isFirstRun = true;

    ProgramConfig m_programConfig;
};

} // namespace keeper
