/**
 * Campaign Keeper - Campaign Manager
 * 
 * Minimal campaign lifecycle: lookup, creation, and the active campaign.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "CampaignConfig.hpp"

namespace keeper {

/**
 * Input for creating a campaign
 */
struct CreateCampaignInput {
    std::optional<std::string> id;     // Generated when absent
    std::string name;
    std::string description;
    std::vector<std::string> modules;  // One folder is created per module
};

/**
 * Campaign manager
 * 
 * Owns the campaigns directory layout and the process-wide notion of the
 * active campaign. Content operations only consume getActive().
 */
class CampaignManager {
public:
    explicit CampaignManager(const std::filesystem::path& campaignsDirectory);
    
    /**
     * All campaigns, most recently accessed first
     */
    std::vector<CampaignConfig> list() const;
    
    /**
     * Load a campaign record, std::nullopt if absent or unreadable
     */
    std::optional<CampaignConfig> load(const std::string& campaignId) const;
    
    /**
     * Create a campaign folder, its module folders, and campaign.json
     */
    std::optional<CampaignConfig> create(const CreateCampaignInput& input);
    
    /**
     * Make a campaign active and bump its lastAccessed time
     */
    std::optional<CampaignConfig> setActive(const std::string& campaignId);
    
    /**
     * Active campaign context, std::nullopt if none is active
     */
    std::optional<CampaignContext> getActive() const;
    
    void clearActive();
    
    const std::filesystem::path& campaignsDirectory() const { return m_campaignsDirectory; }
    
private:
    bool writeConfig(const CampaignConfig& config) const;
    
    std::filesystem::path m_campaignsDirectory;
    
    mutable std::mutex m_mutex;
    std::optional<CampaignConfig> m_active;
};

} // namespace keeper
