/**
 * Campaign Keeper - Module Registry Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ModuleRegistry.hpp"
#include "ContentStore.hpp"
#include "RelationshipIndex.hpp"

#include <spdlog/spdlog.h>

namespace keeper {

namespace {

bool isStringList(const nlohmann::json& value) {
    if (!value.is_array()) {
        return false;
    }
    for (const auto& element : value) {
        if (!element.is_string()) {
            return false;
        }
    }
    return true;
}

bool matchesType(const nlohmann::json& value, FieldType type) {
    switch (type) {
        case FieldType::String:
            return value.is_string();
        case FieldType::Number:
            return value.is_number();
        case FieldType::Boolean:
            return value.is_boolean();
        case FieldType::StringList:
            return isStringList(value);
        case FieldType::StringOrStringList:
            return value.is_string() || isStringList(value);
        case FieldType::Object:
            return value.is_object();
    }
    return false;
}

// Fields every content module understands
std::vector<FieldRule> commonRules() {
    return {
        {"id", FieldType::String, false},
        {"name", FieldType::String, true},
        {"tags", FieldType::StringList, false},
        {"hidden", FieldType::Boolean, false},
        {"playerVisible", FieldType::Boolean, false},
        {"dmOnly", FieldType::Object, false},
    };
}

ModuleDefinition makeModule(const std::string& id,
                            const std::string& name,
                            std::vector<std::string> relationshipFields,
                            std::vector<FieldRule> extraRules) {
    ModuleDefinition module;
    module.id = id;
    module.name = name;
    module.dataFolder = id;
    module.relationshipFields = std::move(relationshipFields);
    module.fieldRules = commonRules();
    module.fieldRules.insert(module.fieldRules.end(), extraRules.begin(), extraRules.end());
    return module;
}

} // anonymous namespace

const char* fieldTypeToString(FieldType type) {
    switch (type) {
        case FieldType::String:             return "a string";
        case FieldType::Number:             return "a number";
        case FieldType::Boolean:            return "a boolean";
        case FieldType::StringList:         return "a list of strings";
        case FieldType::StringOrStringList: return "a string or a list of strings";
        case FieldType::Object:             return "an object";
    }
    return "unknown";
}

std::optional<std::string> validateFrontmatter(const ModuleDefinition& module,
                                               const Frontmatter& frontmatter,
                                               bool partial) {
    if (!frontmatter.is_object()) {
        return std::string("Frontmatter must be an object");
    }

    for (const auto& rule : module.fieldRules) {
        auto it = frontmatter.find(rule.field);
        bool present = it != frontmatter.end() && !it->is_null();

        if (!present) {
            if (rule.required && !partial) {
                return "Field '" + rule.field + "' is required";
            }
            if (rule.required && it != frontmatter.end()) {
                return "Field '" + rule.field + "' cannot be removed";
            }
            continue;
        }

        if (!matchesType(*it, rule.type)) {
            return "Field '" + rule.field + "' must be " + fieldTypeToString(rule.type);
        }

        if (rule.required && it->is_string() &&
            it->get<std::string>().find_first_not_of(" \t\r\n") == std::string::npos) {
            return "Field '" + rule.field + "' cannot be empty";
        }
    }

    return std::nullopt;
}

void ModuleRegistry::registerModule(const ModuleDefinition& module) {
    if (m_modules.count(module.id)) {
        spdlog::warn("Module {} is already registered. Overwriting.", module.id);
    }
    m_modules[module.id] = module;
    spdlog::debug("Module registered: {}", module.id);
}

std::optional<ModuleDefinition> ModuleRegistry::get(const std::string& moduleId) const {
    auto it = m_modules.find(moduleId);
    if (it != m_modules.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<ModuleDefinition> ModuleRegistry::getAll() const {
    std::vector<ModuleDefinition> modules;
    modules.reserve(m_modules.size());
    for (const auto& [id, module] : m_modules) {
        modules.push_back(module);
    }
    return modules;
}

bool ModuleRegistry::contains(const std::string& moduleId) const {
    return m_modules.count(moduleId) > 0;
}

void ModuleRegistry::registerRelationships(RelationshipIndex& index) const {
    for (const auto& [id, module] : m_modules) {
        std::vector<std::string> fields = module.relationshipFields;
        if (module.hierarchyField) {
            fields.push_back(*module.hierarchyField);
        }
        if (!fields.empty()) {
            index.registerFields(module.dataFolder, fields);
        }
    }
}

void ModuleRegistry::registerDerivedArtifacts(ContentStore& store) const {
    for (const auto& [id, module] : m_modules) {
        if (!module.derivedArtifacts.empty()) {
            store.setDerivedArtifacts(module.dataFolder, module.derivedArtifacts);
        }
    }
}

ModuleRegistry ModuleRegistry::withBuiltinModules() {
    ModuleRegistry registry;
    for (const auto& module : builtinModules()) {
        registry.registerModule(module);
    }
    return registry;
}

std::vector<ModuleDefinition> builtinModules() {
    std::vector<ModuleDefinition> modules;

    auto locations = makeModule("locations", "Locations", {}, {
        {"type", FieldType::String, false},
        {"parent", FieldType::String, false},
        {"description", FieldType::String, false},
        {"image", FieldType::String, false},
        {"treeRoot", FieldType::Boolean, false},
    });
    locations.hierarchyField = "parent";
    locations.hierarchyLabel = "location";
    locations.derivedArtifacts = {"player-system-map.html"};
    modules.push_back(locations);

    modules.push_back(makeModule("npcs", "NPCs + Entities", {"relatedCharacters"}, {
        {"occupation", FieldType::String, false},
        {"location", FieldType::String, false},
        {"appearance", FieldType::String, false},
        {"personality", FieldType::String, false},
        {"goals", FieldType::String, false},
        {"relatedCharacters", FieldType::StringList, false},
    }));

    modules.push_back(makeModule("ships", "Ships", {"affiliations"}, {
        {"type", FieldType::String, false},
        {"class", FieldType::String, false},
        {"owner", FieldType::String, false},
        {"isCrewShip", FieldType::Boolean, false},
        {"affiliations", FieldType::StringList, false},
        {"characteristics", FieldType::StringList, false},
    }));

    modules.push_back(makeModule("factions", "Factions", {"affiliations"}, {
        {"description", FieldType::String, false},
        {"location", FieldType::String, false},
        {"leader", FieldType::String, false},
        {"affiliations", FieldType::StringList, false},
    }));

    modules.push_back(makeModule("player-characters", "Player Characters",
        {"npcConnections", "locationConnections", "loreConnections", "playbookMoves"}, {
        {"npcConnections", FieldType::StringList, false},
        {"locationConnections", FieldType::StringList, false},
        {"loreConnections", FieldType::StringList, false},
        {"playbookMoves", FieldType::StringList, false},
    }));

    modules.push_back(makeModule("lore", "Lore", {}, {}));
    modules.push_back(makeModule("projects", "Projects", {}, {}));
    modules.push_back(makeModule("rules", "Rules", {}, {}));
    modules.push_back(makeModule("session-notes", "Session Notes", {}, {}));
    modules.push_back(makeModule("story-artefacts", "Story Artefacts", {}, {}));

    return modules;
}

} // namespace keeper
