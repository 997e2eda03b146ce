/**
 * Campaign Keeper - Module Registry
 * 
 * Content module definitions and their data-driven field rules.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Entity.hpp"

namespace keeper {

class RelationshipIndex;
class ContentStore;

/**
 * Expected JSON type of a frontmatter field
 */
enum class FieldType {
    String,
    Number,
    Boolean,
    StringList,
    StringOrStringList,
    Object
};

/**
 * Validation rule for one frontmatter field
 */
struct FieldRule {
    std::string field;
    FieldType type = FieldType::String;
    bool required = false;
};

/**
 * Content module definition
 */
struct ModuleDefinition {
    std::string id;                                    // e.g. "locations"
    std::string name;                                  // Display name
    std::string dataFolder;                            // Folder inside the campaign
    std::vector<std::string> relationshipFields;       // Fields holding entity ids
    std::optional<std::string> hierarchyField;         // Parent link, e.g. "parent"
    std::string hierarchyLabel = "entity";             // Noun used in hierarchy errors
    std::vector<FieldRule> fieldRules;
    std::vector<std::filesystem::path> derivedArtifacts;  // Invalidated on change
};

/**
 * Check frontmatter against a module's field rules
 * 
 * Null values are accepted for optional fields (they remove the field in
 * an update).
 * 
 * @param partial Skip "required" checks (for partial updates)
 * @return First violation, or std::nullopt if the frontmatter is valid
 */
std::optional<std::string> validateFrontmatter(const ModuleDefinition& module,
                                               const Frontmatter& frontmatter,
                                               bool partial = false);

/**
 * Convert field type to string
 */
const char* fieldTypeToString(FieldType type);

/**
 * Module registry
 * 
 * Populated once at startup; lookups afterwards are read-only.
 */
class ModuleRegistry {
public:
    /**
     * Register a module (a second registration of the same id replaces it)
     */
    void registerModule(const ModuleDefinition& module);
    
    std::optional<ModuleDefinition> get(const std::string& moduleId) const;
    std::vector<ModuleDefinition> getAll() const;
    bool contains(const std::string& moduleId) const;
    
    /**
     * Register every module's relationship fields with the index
     */
    void registerRelationships(RelationshipIndex& index) const;
    
    /**
     * Register every module's derived artifacts with the store
     */
    void registerDerivedArtifacts(ContentStore& store) const;
    
    /**
     * Registry with the built-in content modules
     */
    static ModuleRegistry withBuiltinModules();
    
private:
    std::map<std::string, ModuleDefinition> m_modules;
};

/**
 * Built-in module definitions
 */
std::vector<ModuleDefinition> builtinModules();

} // namespace keeper
