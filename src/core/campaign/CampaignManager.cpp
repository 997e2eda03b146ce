/**
 * Campaign Keeper - Campaign Manager Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "CampaignManager.hpp"
#include "content/IdGenerator.hpp"

#include <algorithm>
#include <fstream>

#include <QDateTime>

#include <spdlog/spdlog.h>

namespace keeper {

namespace {
    constexpr const char* CAMPAIGN_CONFIG_FILE = "campaign.json";
    constexpr const char* ASSETS_DIR = "assets";
    
    std::string nowIso() {
        return QDateTime::currentDateTimeUtc().toString(Qt::ISODate).toStdString();
    }
}

CampaignManager::CampaignManager(const std::filesystem::path& campaignsDirectory)
    : m_campaignsDirectory(campaignsDirectory)
{
}

std::vector<CampaignConfig> CampaignManager::list() const {
    std::vector<CampaignConfig> campaigns;
    
    std::error_code ec;
    if (!std::filesystem::is_directory(m_campaignsDirectory, ec)) {
        return campaigns;
    }
    
    try {
        for (const auto& entry : std::filesystem::directory_iterator(m_campaignsDirectory)) {
            if (!entry.is_directory()) {
                continue;
            }
            auto config = load(entry.path().filename().string());
            if (config) {
                campaigns.push_back(*config);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to list campaigns: {}", e.what());
    }
    
    std::sort(campaigns.begin(), campaigns.end(),
        [](const CampaignConfig& a, const CampaignConfig& b) {
            if (!a.lastAccessed.empty() && !b.lastAccessed.empty()) {
                if (a.lastAccessed != b.lastAccessed) {
                    return a.lastAccessed > b.lastAccessed;
                }
                return a.name < b.name;
            }
            if (a.lastAccessed.empty() != b.lastAccessed.empty()) {
                return !a.lastAccessed.empty();
            }
            return a.name < b.name;
        });
    
    return campaigns;
}

std::optional<CampaignConfig> CampaignManager::load(const std::string& campaignId) const {
    if (!isValidEntityId(campaignId)) {
        return std::nullopt;
    }
    
    auto configPath = m_campaignsDirectory / campaignId / CAMPAIGN_CONFIG_FILE;
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return std::nullopt;
    }
    
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    auto config = CampaignConfig::fromJson(content);
    if (config && config->id != campaignId) {
        spdlog::warn("Campaign folder {} declares id {}, using folder name", campaignId, config->id);
        config->id = campaignId;
    }
    return config;
}

std::optional<CampaignConfig> CampaignManager::create(const CreateCampaignInput& input) {
    CampaignConfig config;
    config.id = input.id ? *input.id : generateEntityId(input.name);
    config.name = input.name;
    config.description = input.description;
    config.created = nowIso();
    config.lastAccessed = config.created;
    config.modules = input.modules;
    
    if (!isValidEntityId(config.id)) {
        spdlog::error("Invalid campaign id: {}", config.id);
        return std::nullopt;
    }
    
    auto campaignPath = m_campaignsDirectory / config.id;
    if (std::filesystem::exists(campaignPath / CAMPAIGN_CONFIG_FILE)) {
        spdlog::error("Campaign already exists: {}", config.id);
        return std::nullopt;
    }
    
    try {
        std::filesystem::create_directories(campaignPath / ASSETS_DIR);
        for (const auto& moduleId : config.modules) {
            if (!isValidEntityId(moduleId)) {
                spdlog::warn("Skipping invalid module folder: {}", moduleId);
                continue;
            }
            std::filesystem::create_directories(campaignPath / moduleId);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to create campaign folders: {}", e.what());
        return std::nullopt;
    }
    
    if (!writeConfig(config)) {
        return std::nullopt;
    }
    
    spdlog::info("Created campaign: {} ({})", config.name, config.id);
    return config;
}

std::optional<CampaignConfig> CampaignManager::setActive(const std::string& campaignId) {
    auto config = load(campaignId);
    if (!config) {
        spdlog::warn("Cannot activate unknown campaign: {}", campaignId);
        return std::nullopt;
    }
    
    config->lastAccessed = nowIso();
    if (!writeConfig(*config)) {
        spdlog::warn("Could not record access time for campaign: {}", campaignId);
    }
    
    std::lock_guard<std::mutex> lock(m_mutex);
    m_active = config;
    spdlog::info("Active campaign: {}", campaignId);
    return config;
}

std::optional<CampaignContext> CampaignManager::getActive() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_active) {
        return std::nullopt;
    }
    return CampaignContext{m_active->id, m_campaignsDirectory / m_active->id};
}

void CampaignManager::clearActive() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_active.reset();
}

bool CampaignManager::writeConfig(const CampaignConfig& config) const {
    auto configPath = m_campaignsDirectory / config.id / CAMPAIGN_CONFIG_FILE;
    
    std::ofstream file(configPath);
    if (!file.is_open()) {
        spdlog::error("Failed to write campaign config: {}", configPath.string());
        return false;
    }
    file << config.toJson();
    return true;
}

} // namespace keeper
