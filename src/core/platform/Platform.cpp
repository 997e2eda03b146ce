/**
 * Campaign Keeper - Platform Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Platform.hpp"

#include <cstdlib>

#include <QStandardPaths>
#include <QString>

namespace keeper {

namespace {
    constexpr const char* APP_DIR_NAME = "campaign-keeper";

#ifdef PLATFORM_LINUX
    // XDG base directory lookup, falling back under $HOME
    std::filesystem::path xdgPath(const char* variable, const char* homeFallback) {
        const char* xdg = std::getenv(variable);
        if (xdg && xdg[0] != '\0') {
            return std::filesystem::path(xdg) / APP_DIR_NAME;
        }
        
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / homeFallback / APP_DIR_NAME;
        }
        
        return std::filesystem::path(homeFallback) / APP_DIR_NAME;
    }
#else
    std::filesystem::path standardPath(QStandardPaths::StandardLocation location) {
        QString base = QStandardPaths::writableLocation(location);
        if (base.isEmpty()) {
            return std::filesystem::path(APP_DIR_NAME);
        }
        return std::filesystem::path(base.toStdString()) / APP_DIR_NAME;
    }
#endif
}

std::filesystem::path Platform::getConfigPath() {
#ifdef PLATFORM_LINUX
    return xdgPath("XDG_CONFIG_HOME", ".config");
#else
    return standardPath(QStandardPaths::GenericConfigLocation);
#endif
}

std::filesystem::path Platform::getDataPath() {
#ifdef PLATFORM_LINUX
    return xdgPath("XDG_DATA_HOME", ".local/share");
#else
    return standardPath(QStandardPaths::GenericDataLocation);
#endif
}

std::filesystem::path Platform::getDefaultCampaignsPath() {
    return getDataPath() / "campaigns";
}

} // namespace keeper
