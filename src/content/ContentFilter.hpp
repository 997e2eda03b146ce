/**
 * Campaign Keeper - Content Filter
 * 
 * Player-safe projections of entities and listings.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <vector>

#include "Entity.hpp"

namespace keeper {

/**
 * Check if an item is hidden from players
 * 
 * Two conventions coexist across modules and either one hides the item:
 * "hidden": true, or "playerVisible": false.
 */
bool isHiddenFromPlayers(const Frontmatter& fields);
bool isHiddenFromPlayers(const EntityMetadata& metadata);

/**
 * Copy of an entity without the dmOnly, hidden and playerVisible fields
 */
Entity filterDmOnlyContent(const Entity& entity);

/**
 * Copy of a listing record without the dmOnly, hidden and playerVisible fields
 */
EntityMetadata filterDmOnlyMetadata(const EntityMetadata& metadata);

/**
 * Drop hidden items, then strip DM-only fields from the rest (order kept)
 */
std::vector<EntityMetadata> filterDmOnlyMetadataList(const std::vector<EntityMetadata>& metadataList);

} // namespace keeper
