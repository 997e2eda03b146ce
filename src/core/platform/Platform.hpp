/**
 * Campaign Keeper - Platform Abstraction
 * 
 * Cross-platform locations for configuration and campaign data.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace keeper {

/**
 * Platform abstraction layer
 * 
 * Resolves the per-user directories the application reads and writes.
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     * 
     * Linux:   ~/.config/campaign-keeper/
     * Windows: %APPDATA%\campaign-keeper\
     * macOS:   ~/Library/Preferences/campaign-keeper/
     */
    static std::filesystem::path getConfigPath();
    
    /**
     * Get the data directory path (campaigns live here by default)
     * 
     * Linux:   ~/.local/share/campaign-keeper/
     * Windows: %LOCALAPPDATA%\campaign-keeper\
     * macOS:   ~/Library/Application Support/campaign-keeper/
     */
    static std::filesystem::path getDataPath();
    
    /**
     * Default root directory holding one folder per campaign
     */
    static std::filesystem::path getDefaultCampaignsPath();
};

} // namespace keeper
