/**
 * Campaign Keeper - Content Filter Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ContentFilter.hpp"

#include <array>

namespace keeper {

namespace {

constexpr std::array<const char*, 3> DM_ONLY_FIELDS = {
    "dmOnly", "hidden", "playerVisible"
};

Frontmatter stripDmOnlyFields(const Frontmatter& fields) {
    Frontmatter cleaned = fields;
    if (!cleaned.is_object()) {
        return cleaned;
    }
    for (const char* field : DM_ONLY_FIELDS) {
        cleaned.erase(field);
    }
    return cleaned;
}

} // anonymous namespace

bool isHiddenFromPlayers(const Frontmatter& fields) {
    if (!fields.is_object()) {
        return false;
    }
    
    auto hidden = fields.find("hidden");
    if (hidden != fields.end() && hidden->is_boolean() && hidden->get<bool>()) {
        return true;
    }
    
    auto visible = fields.find("playerVisible");
    if (visible != fields.end() && visible->is_boolean() && !visible->get<bool>()) {
        return true;
    }
    
    return false;
}

bool isHiddenFromPlayers(const EntityMetadata& metadata) {
    return isHiddenFromPlayers(metadata.fields);
}

Entity filterDmOnlyContent(const Entity& entity) {
    Entity filtered = entity;
    filtered.frontmatter = stripDmOnlyFields(entity.frontmatter);
    return filtered;
}

EntityMetadata filterDmOnlyMetadata(const EntityMetadata& metadata) {
    EntityMetadata filtered = metadata;
    filtered.fields = stripDmOnlyFields(metadata.fields);
    return filtered;
}

std::vector<EntityMetadata> filterDmOnlyMetadataList(const std::vector<EntityMetadata>& metadataList) {
    std::vector<EntityMetadata> filtered;
    filtered.reserve(metadataList.size());
    for (const auto& item : metadataList) {
        if (isHiddenFromPlayers(item)) {
            continue;
        }
        filtered.push_back(filterDmOnlyMetadata(item));
    }
    return filtered;
}

} // namespace keeper
