/**
 * Campaign Keeper - Cycle Detector Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "CycleDetector.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace keeper {

CycleDetector::CycleDetector(std::string parentField, std::string entityLabel)
    : m_parentField(std::move(parentField))
    , m_entityLabel(std::move(entityLabel))
{
}

std::string CycleDetector::parentOf(const EntityMetadata& entity) const {
    return frontmatterString(entity.fields, m_parentField);
}

bool CycleDetector::wouldCreateCycle(const std::vector<EntityMetadata>& entities,
                                     const std::string& childId,
                                     const std::string& proposedParentId) const {
    // Can't be your own parent
    if (childId == proposedParentId) {
        return true;
    }
    
    std::unordered_map<std::string, const EntityMetadata*> byId;
    byId.reserve(entities.size());
    for (const auto& entity : entities) {
        byId.emplace(entity.id, &entity);
    }
    
    // Walk up from the proposed parent looking for the child
    std::unordered_set<std::string> visited;
    std::string current = proposedParentId;
    
    while (!current.empty()) {
        if (current == childId) {
            return true;
        }
        
        // Stored data already loops
        if (!visited.insert(current).second) {
            return true;
        }
        
        auto it = byId.find(current);
        if (it == byId.end()) {
            break;
        }
        current = parentOf(*it->second);
    }
    
    return false;
}

std::optional<std::string> CycleDetector::validateParentAssignment(
    const std::vector<EntityMetadata>& entities,
    const std::string& childId,
    const std::optional<std::string>& proposedParentId) const {
    
    // No parent is always valid
    if (!proposedParentId || proposedParentId->empty()) {
        return std::nullopt;
    }
    
    bool parentExists = std::any_of(entities.begin(), entities.end(),
        [&](const EntityMetadata& entity) { return entity.id == *proposedParentId; });
    if (!parentExists) {
        return "Parent " + m_entityLabel + " not found";
    }
    
    if (wouldCreateCycle(entities, childId, *proposedParentId)) {
        return std::string("Cannot set parent: would create a circular reference");
    }
    
    return std::nullopt;
}

} // namespace keeper
