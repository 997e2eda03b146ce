/**
 * Campaign Keeper - Relationship Index
 * 
 * Registry of relationship fields and on-demand reverse reference lookups.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "Entity.hpp"

namespace keeper {

class ContentStore;

/**
 * One field of one entity pointing at a target id
 */
struct ReverseReference {
    std::string sourceModule;
    std::string sourceEntityId;
    std::string field;
    
    bool operator==(const ReverseReference& other) const {
        return sourceModule == other.sourceModule &&
               sourceEntityId == other.sourceEntityId &&
               field == other.field;
    }
};

/**
 * Target entity id -> references pointing at it
 */
using ReverseReferenceMap = std::map<std::string, std::vector<ReverseReference>>;

/**
 * Both directions of an entity's relationships
 */
struct RelatedEntities {
    std::vector<EntityMetadata> references;     // Entities this one points at
    std::vector<EntityMetadata> referencedBy;   // Entities pointing at this one
};

/**
 * Relationship index
 * 
 * Forward registrations (which fields of which module hold ids) are static
 * and kept in memory. Everything derived from entity data is recomputed
 * from disk per query, so concurrent writers can never leave it stale.
 * 
 * Module ids here are module data folder names.
 */
class RelationshipIndex {
public:
    explicit RelationshipIndex(const ContentStore& store);
    
    /**
     * Register relationship fields for a module (union with earlier calls)
     */
    void registerFields(const std::string& moduleId, const std::vector<std::string>& fields);
    
    /**
     * Relationship fields of a module, empty if never registered
     */
    std::set<std::string> getFields(const std::string& moduleId) const;
    
    /**
     * Modules with at least one registration
     */
    std::vector<std::string> registeredModules() const;
    
    /**
     * Scan every module of a campaign and invert its relationship fields
     */
    ReverseReferenceMap computeReverseReferences(const std::string& campaignId) const;
    
    /**
     * Resolve what an entity references and what references it
     */
    RelatedEntities getRelated(const std::string& campaignId, const std::string& entityId) const;
    
    /**
     * Resolve ids to listing records across all modules, unknown ids skipped
     */
    std::vector<EntityMetadata> resolveIds(const std::string& campaignId,
                                           const std::vector<std::string>& ids) const;
    
    /**
     * Ids held by a relationship field value (string or array of strings)
     */
    static std::vector<std::string> extractIds(const nlohmann::json& value);
    
private:
    struct ScannedEntity {
        std::string module;
        EntityMetadata metadata;
    };
    
    std::vector<ScannedEntity> scanCampaign(const std::string& campaignId) const;
    ReverseReferenceMap invert(const std::vector<ScannedEntity>& entities) const;
    
    const ContentStore& m_store;
    
    mutable std::mutex m_mutex;
    std::map<std::string, std::set<std::string>> m_fields;
};

} // namespace keeper
