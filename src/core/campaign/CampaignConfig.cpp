/**
 * Campaign Keeper - Campaign Configuration Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "CampaignConfig.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace keeper {

std::optional<CampaignConfig> CampaignConfig::fromJson(const std::string& json) {
    CampaignConfig config;
    
    try {
        auto j = nlohmann::json::parse(json);
        
        if (j.contains("id")) {
            config.id = j["id"].get<std::string>();
        }
        if (j.contains("name")) {
            config.name = j["name"].get<std::string>();
        }
        if (j.contains("description")) {
            config.description = j["description"].get<std::string>();
        }
        if (j.contains("created")) {
            config.created = j["created"].get<std::string>();
        }
        if (j.contains("lastAccessed")) {
            config.lastAccessed = j["lastAccessed"].get<std::string>();
        }
        if (j.contains("modules")) {
            config.modules = j["modules"].get<std::vector<std::string>>();
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse campaign config: {}", e.what());
        return std::nullopt;
    }
    
    if (config.id.empty()) {
        spdlog::warn("Campaign config without id");
        return std::nullopt;
    }
    return config;
}

std::string CampaignConfig::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["description"] = description;
    j["created"] = created;
    j["lastAccessed"] = lastAccessed;
    j["modules"] = modules;
    return j.dump(2);
}

} // namespace keeper
