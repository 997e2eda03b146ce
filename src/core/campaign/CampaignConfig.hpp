/**
 * Campaign Keeper - Campaign Configuration
 * 
 * Per-campaign record stored as campaign.json in the campaign folder.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace keeper {

/**
 * Campaign record
 */
struct CampaignConfig {
    std::string id;
    std::string name;
    std::string description;
    std::string created;               // ISO 8601
    std::string lastAccessed;          // ISO 8601, empty if never opened
    std::vector<std::string> modules;  // Enabled module ids
    
    // Serialization
    static std::optional<CampaignConfig> fromJson(const std::string& json);
    std::string toJson() const;
};

/**
 * Context the content store needs from the active campaign
 */
struct CampaignContext {
    std::string id;
    std::filesystem::path rootPath;    // <campaignsDirectory>/<id>
};

} // namespace keeper
