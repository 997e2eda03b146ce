/**
 * Campaign Keeper - Content Service
 * 
 * Validated DM operations on the active campaign and the read-only,
 * filtered player surface.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ContentError.hpp"
#include "Entity.hpp"
#include "ModuleRegistry.hpp"
#include "RelationshipIndex.hpp"

namespace keeper {

class CampaignManager;
class ContentStore;

/**
 * Result of a content operation
 */
template <typename T>
struct ContentResult {
    ContentErrorKind error = ContentErrorKind::None;
    std::string errorMessage;
    std::optional<T> value;
    
    bool isSuccess() const { return error == ContentErrorKind::None && value.has_value(); }
    
    static ContentResult success(T result) {
        ContentResult r;
        r.value = std::move(result);
        return r;
    }
    
    static ContentResult failure(ContentErrorKind kind, const std::string& message) {
        ContentResult r;
        r.error = kind;
        r.errorMessage = message;
        return r;
    }
};

/**
 * One player search hit
 */
struct SearchResult {
    std::string moduleId;
    std::string id;
    std::string name;
    std::string snippet;                // From personality or appearance
    std::optional<std::string> type;
    
    nlohmann::json toJson() const;
};

/**
 * Content service
 * 
 * Owns the create/update flow: field rules and hierarchy checks run
 * against the module's current entities before anything is written.
 * Store failures come back as a ContentResult, never as an exception.
 */
class ContentService {
public:
    ContentService(CampaignManager& campaigns,
                   ContentStore& store,
                   RelationshipIndex& index,
                   const ModuleRegistry& modules);
    
    // =====================
    // DM surface (active campaign)
    // =====================
    
    ContentResult<std::vector<EntityMetadata>> listEntities(const std::string& moduleId) const;
    ContentResult<Entity> getEntity(const std::string& moduleId, const std::string& id) const;
    ContentResult<Entity> createEntity(const std::string& moduleId, const CreateEntityInput& input);
    ContentResult<Entity> updateEntity(const std::string& moduleId,
                                       const std::string& id,
                                       const UpdateEntityInput& update);
    ContentResult<bool> deleteEntity(const std::string& moduleId, const std::string& id);
    
    /**
     * Outgoing and incoming relationships of an entity
     */
    ContentResult<RelatedEntities> getRelated(const std::string& entityId) const;
    
    // =====================
    // Player surface (read-only, filtered)
    // =====================
    
    /**
     * Visible entities of a module with DM-only fields stripped
     */
    ContentResult<std::vector<EntityMetadata>> listForPlayers(const std::string& campaignId,
                                                              const std::string& moduleId) const;
    
    /**
     * A visible entity with DM-only fields stripped; hidden reads as NotFound
     */
    ContentResult<Entity> getForPlayers(const std::string& campaignId,
                                        const std::string& moduleId,
                                        const std::string& id) const;
    
    ContentResult<RelatedEntities> relatedForPlayers(const std::string& campaignId,
                                                     const std::string& entityId) const;
    
    /**
     * Case-insensitive search over names and visible string fields
     * 
     * An empty query yields no results. Modules default to npcs and lore.
     */
    ContentResult<std::vector<SearchResult>> searchForPlayers(
        const std::string& campaignId,
        const std::string& query,
        const std::vector<std::string>& moduleIds = {}) const;
    
private:
    struct Target {
        std::string campaignId;
        ModuleDefinition module;
    };
    
    Target resolveActive(const std::string& moduleId) const;
    Target resolvePlayer(const std::string& campaignId, const std::string& moduleId) const;
    ModuleDefinition requireModule(const std::string& moduleId) const;
    std::optional<std::string> checkHierarchy(const std::string& campaignId,
                                              const ModuleDefinition& module,
                                              const std::optional<std::string>& childId,
                                              const Frontmatter& proposed) const;
    
    CampaignManager& m_campaigns;
    ContentStore& m_store;
    RelationshipIndex& m_index;
    const ModuleRegistry& m_modules;
};

} // namespace keeper
