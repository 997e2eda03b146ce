/**
 * Campaign Keeper - Configuration Manager Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ConfigManager.hpp"
#include "core/platform/Platform.hpp"

#include <fstream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace keeper {

namespace {
    constexpr const char* PROGRAM_CONFIG_FILE = "config.json";
}

spdlog::level::level_enum logLevelFromString(const std::string& verbosity) {
    if (verbosity == "debug") return spdlog::level::debug;
    if (verbosity == "warning" || verbosity == "warn") return spdlog::level::warn;
    if (verbosity == "error") return spdlog::level::err;
    return spdlog::level::info;
}

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::initialize(const std::filesystem::path& configDirectory) {
    m_configDirectory = configDirectory;
    m_programConfig = ProgramConfig{};
    m_programConfig.campaignsDirectory = Platform::getDefaultCampaignsPath();

    // Create directories if they don't exist
    try {
        std::filesystem::create_directories(m_configDirectory);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return false;
    }

    // Check if this is first run
    m_isFirstRun = !std::filesystem::exists(m_configDirectory / PROGRAM_CONFIG_FILE);

    if (!m_isFirstRun) {
        if (!loadProgramConfig()) {
            spdlog::warn("Failed to load program config, using defaults");
        }
    }

    spdlog::info("ConfigManager initialized at: {}", m_configDirectory.string());
    return true;
}

bool ConfigManager::save() {
    return saveProgramConfig();
}

bool ConfigManager::setProgramConfig(const ProgramConfig& config) {
    m_programConfig = config;
    return saveProgramConfig();
}

bool ConfigManager::loadProgramConfig() {
    auto configPath = m_configDirectory / PROGRAM_CONFIG_FILE;

    try {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            return false;
        }

        nlohmann::json j = nlohmann::json::parse(file);

        if (j.contains("campaignsDirectory")) {
            m_programConfig.campaignsDirectory = j["campaignsDirectory"].get<std::string>();
        }
        if (j.contains("activeCampaign")) {
            m_programConfig.activeCampaign = j["activeCampaign"].get<std::string>();
        }
        if (j.contains("entityExtension")) {
            m_programConfig.entityExtension = j["entityExtension"].get<std::string>();
        }
        if (j.contains("logVerbosity")) {
            m_programConfig.logVerbosity = j["logVerbosity"].get<std::string>();
        }
        if (j.contains("lockStallWarningSeconds")) {
            m_programConfig.lockStallWarningSeconds = j["lockStallWarningSeconds"].get<int>();
        }

        if (m_programConfig.entityExtension.empty() || m_programConfig.entityExtension[0] != '.') {
            m_programConfig.entityExtension = "." + m_programConfig.entityExtension;
        }

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load program config: {}", e.what());
        return false;
    }
}

bool ConfigManager::saveProgramConfig() {
    auto configPath = m_configDirectory / PROGRAM_CONFIG_FILE;

    try {
        nlohmann::json j;
        j["campaignsDirectory"] = m_programConfig.campaignsDirectory.string();
        j["activeCampaign"] = m_programConfig.activeCampaign;
        j["entityExtension"] = m_programConfig.entityExtension;
        j["logVerbosity"] = m_programConfig.logVerbosity;
        j["lockStallWarningSeconds"] = m_programConfig.lockStallWarningSeconds;

        std::ofstream file(configPath);
        if (!file.is_open()) {
            spdlog::error("Failed to open program config for writing: {}", configPath.string());
            return false;
        }
        file << j.dump(2);
        m_isFirstRun = false;

        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save program config: {}", e.what());
        return false;
    }
}

} // namespace keeper
