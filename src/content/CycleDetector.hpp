/**
 * Campaign Keeper - Cycle Detector
 * 
 * Guards parent-style links within a module against cycles.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "Entity.hpp"

namespace keeper {

/**
 * Validates parent assignments in a child -> parent hierarchy
 * 
 * Hierarchies are shallow, so every check walks the ancestor chain from
 * scratch over the module's current entities.
 */
class CycleDetector {
public:
    /**
     * @param parentField Frontmatter field holding the parent id
     * @param entityLabel Noun used in messages ("location")
     */
    explicit CycleDetector(std::string parentField = "parent",
                           std::string entityLabel = "location");
    
    /**
     * Check if making proposedParentId the parent of childId closes a cycle
     * 
     * Also true when the ancestor chain of proposedParentId already loops.
     */
    bool wouldCreateCycle(const std::vector<EntityMetadata>& entities,
                          const std::string& childId,
                          const std::string& proposedParentId) const;
    
    /**
     * Validate a parent assignment
     * 
     * @return Error message, or std::nullopt if the assignment is valid
     */
    std::optional<std::string> validateParentAssignment(
        const std::vector<EntityMetadata>& entities,
        const std::string& childId,
        const std::optional<std::string>& proposedParentId) const;
    
    const std::string& parentField() const { return m_parentField; }
    
    /**
     * Parent id of an item, empty for a root
     */
    std::string parentOf(const EntityMetadata& entity) const;
    
private:
    std::string m_parentField;
    std::string m_entityLabel;
};

} // namespace keeper
