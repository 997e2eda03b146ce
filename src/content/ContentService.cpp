/**
 * Campaign Keeper - Content Service Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ContentService.hpp"
#include "ContentFilter.hpp"
#include "ContentStore.hpp"
#include "CycleDetector.hpp"
#include "core/campaign/CampaignManager.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace keeper {

namespace {
    constexpr std::size_t SNIPPET_LENGTH = 100;
    
    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }
    
    bool isFatal(ContentErrorKind kind) {
        return kind == ContentErrorKind::IO || kind == ContentErrorKind::Parse;
    }
    
    /**
     * Run an operation, turning thrown errors into a failed result
     */
    template <typename T, typename Operation>
    ContentResult<T> guarded(const char* action, Operation&& operation) {
        try {
            return operation();
        } catch (const ContentError& e) {
            if (isFatal(e.kind())) {
                spdlog::error("{} failed ({}): {}", action, contentErrorKindToString(e.kind()), e.what());
            } else {
                spdlog::debug("{} rejected: {}", action, e.what());
            }
            return ContentResult<T>::failure(e.kind(), e.what());
        } catch (const std::exception& e) {
            spdlog::error("{} failed: {}", action, e.what());
            return ContentResult<T>::failure(ContentErrorKind::IO, e.what());
        }
    }
    
    /**
     * First maxChars UTF-8 characters of text, never splitting a sequence
     * 
     * @return true if text was longer and got cut
     */
    bool truncateUtf8(const std::string& text, std::size_t maxChars, std::string& out) {
        std::size_t chars = 0;
        for (std::size_t i = 0; i < text.size(); ++i) {
            // Continuation bytes (10xxxxxx) belong to the previous character
            if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) {
                continue;
            }
            if (chars == maxChars) {
                out = text.substr(0, i);
                return true;
            }
            ++chars;
        }
        out = text;
        return false;
    }
    
    std::optional<std::string> stringValue(const Frontmatter& fields, const std::string& key) {
        auto it = fields.find(key);
        if (it == fields.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    }
}

nlohmann::json SearchResult::toJson() const {
    nlohmann::json obj;
    obj["moduleId"] = moduleId;
    obj["id"] = id;
    obj["name"] = name;
    obj["snippet"] = snippet;
    if (type) {
        obj["type"] = *type;
    }
    return obj;
}

ContentService::ContentService(CampaignManager& campaigns,
                               ContentStore& store,
                               RelationshipIndex& index,
                               const ModuleRegistry& modules)
    : m_campaigns(campaigns)
    , m_store(store)
    , m_index(index)
    , m_modules(modules)
{
}

ModuleDefinition ContentService::requireModule(const std::string& moduleId) const {
    auto module = m_modules.get(moduleId);
    if (!module) {
        throw ContentError(ContentErrorKind::Validation, "Unknown module: " + moduleId);
    }
    return *module;
}

ContentService::Target ContentService::resolveActive(const std::string& moduleId) const {
    auto active = m_campaigns.getActive();
    if (!active) {
        throw ContentError(ContentErrorKind::Validation, "No active campaign");
    }
    return Target{active->id, requireModule(moduleId)};
}

ContentService::Target ContentService::resolvePlayer(const std::string& campaignId,
                                                     const std::string& moduleId) const {
    if (!m_campaigns.load(campaignId)) {
        throw ContentError(ContentErrorKind::NotFound, "Campaign not found: " + campaignId);
    }
    return Target{campaignId, requireModule(moduleId)};
}

std::optional<std::string> ContentService::checkHierarchy(const std::string& campaignId,
                                                          const ModuleDefinition& module,
                                                          const std::optional<std::string>& childId,
                                                          const Frontmatter& proposed) const {
    if (!module.hierarchyField) {
        return std::nullopt;
    }
    auto parent = stringValue(proposed, *module.hierarchyField);
    if (!parent || parent->empty()) {
        return std::nullopt;
    }
    
    auto entities = m_store.listEntities(campaignId, module.dataFolder);
    CycleDetector detector(*module.hierarchyField, module.hierarchyLabel);
    
    if (!childId) {
        // A new entity has no descendants, only the parent has to exist
        bool exists = std::any_of(entities.begin(), entities.end(),
            [&](const EntityMetadata& e) { return e.id == *parent; });
        if (!exists) {
            return "Parent " + module.hierarchyLabel + " not found";
        }
        return std::nullopt;
    }
    
    return detector.validateParentAssignment(entities, *childId, parent);
}

// =====================
// DM surface
// =====================

ContentResult<std::vector<EntityMetadata>> ContentService::listEntities(const std::string& moduleId) const {
    return guarded<std::vector<EntityMetadata>>("List entities", [&] {
        auto target = resolveActive(moduleId);
        return ContentResult<std::vector<EntityMetadata>>::success(
            m_store.listEntities(target.campaignId, target.module.dataFolder));
    });
}

ContentResult<Entity> ContentService::getEntity(const std::string& moduleId, const std::string& id) const {
    return guarded<Entity>("Get entity", [&] {
        auto target = resolveActive(moduleId);
        auto entity = m_store.getEntity(target.campaignId, target.module.dataFolder, id);
        if (!entity) {
            return ContentResult<Entity>::failure(ContentErrorKind::NotFound, "Entity not found: " + id);
        }
        return ContentResult<Entity>::success(*entity);
    });
}

ContentResult<Entity> ContentService::createEntity(const std::string& moduleId, const CreateEntityInput& input) {
    return guarded<Entity>("Create entity", [&] {
        auto target = resolveActive(moduleId);
        
        Frontmatter proposed = input.frontmatter.is_object() ? input.frontmatter : Frontmatter::object();
        proposed["name"] = input.name;
        if (input.id) {
            proposed["id"] = *input.id;
        }
        
        if (auto error = validateFrontmatter(target.module, proposed)) {
            return ContentResult<Entity>::failure(ContentErrorKind::Validation, *error);
        }
        if (auto error = checkHierarchy(target.campaignId, target.module, std::nullopt, proposed)) {
            return ContentResult<Entity>::failure(ContentErrorKind::Validation, *error);
        }
        
        auto entity = m_store.createEntity(target.campaignId, target.module.dataFolder, input);
        spdlog::info("Created {}/{}", target.module.id, entity.id());
        return ContentResult<Entity>::success(entity);
    });
}

ContentResult<Entity> ContentService::updateEntity(const std::string& moduleId,
                                                   const std::string& id,
                                                   const UpdateEntityInput& update) {
    return guarded<Entity>("Update entity", [&] {
        auto target = resolveActive(moduleId);
        
        Frontmatter proposed = update.frontmatter.is_object() ? update.frontmatter : Frontmatter::object();
        if (update.name) {
            proposed["name"] = *update.name;
        }
        
        if (auto error = validateFrontmatter(target.module, proposed, true)) {
            return ContentResult<Entity>::failure(ContentErrorKind::Validation, *error);
        }
        if (auto error = checkHierarchy(target.campaignId, target.module, id, proposed)) {
            return ContentResult<Entity>::failure(ContentErrorKind::Validation, *error);
        }
        
        auto entity = m_store.updateEntity(target.campaignId, target.module.dataFolder, id, update);
        if (!entity) {
            return ContentResult<Entity>::failure(ContentErrorKind::NotFound, "Entity not found: " + id);
        }
        spdlog::info("Updated {}/{}", target.module.id, id);
        return ContentResult<Entity>::success(*entity);
    });
}

ContentResult<bool> ContentService::deleteEntity(const std::string& moduleId, const std::string& id) {
    return guarded<bool>("Delete entity", [&] {
        auto target = resolveActive(moduleId);
        if (!m_store.deleteEntity(target.campaignId, target.module.dataFolder, id)) {
            return ContentResult<bool>::failure(ContentErrorKind::NotFound, "Entity not found: " + id);
        }
        spdlog::info("Deleted {}/{}", target.module.id, id);
        return ContentResult<bool>::success(true);
    });
}

ContentResult<RelatedEntities> ContentService::getRelated(const std::string& entityId) const {
    return guarded<RelatedEntities>("Get relationships", [&] {
        auto active = m_campaigns.getActive();
        if (!active) {
            return ContentResult<RelatedEntities>::failure(ContentErrorKind::Validation, "No active campaign");
        }
        return ContentResult<RelatedEntities>::success(m_index.getRelated(active->id, entityId));
    });
}

// =====================
// Player surface
// =====================

ContentResult<std::vector<EntityMetadata>> ContentService::listForPlayers(const std::string& campaignId,
                                                                          const std::string& moduleId) const {
    return guarded<std::vector<EntityMetadata>>("List entities for players", [&] {
        auto target = resolvePlayer(campaignId, moduleId);
        auto entities = m_store.listEntities(target.campaignId, target.module.dataFolder);
        return ContentResult<std::vector<EntityMetadata>>::success(filterDmOnlyMetadataList(entities));
    });
}

ContentResult<Entity> ContentService::getForPlayers(const std::string& campaignId,
                                                    const std::string& moduleId,
                                                    const std::string& id) const {
    return guarded<Entity>("Get entity for players", [&] {
        auto target = resolvePlayer(campaignId, moduleId);
        auto entity = m_store.getEntity(target.campaignId, target.module.dataFolder, id);
        
        // Hidden entities must be indistinguishable from missing ones
        if (!entity || isSystemRecordId(entity->id()) || isHiddenFromPlayers(entity->frontmatter)) {
            return ContentResult<Entity>::failure(ContentErrorKind::NotFound, "Entity not found: " + id);
        }
        return ContentResult<Entity>::success(filterDmOnlyContent(*entity));
    });
}

ContentResult<RelatedEntities> ContentService::relatedForPlayers(const std::string& campaignId,
                                                                 const std::string& entityId) const {
    return guarded<RelatedEntities>("Get relationships for players", [&] {
        if (!m_campaigns.load(campaignId)) {
            return ContentResult<RelatedEntities>::failure(ContentErrorKind::NotFound,
                                                           "Campaign not found: " + campaignId);
        }
        
        auto self = m_index.resolveIds(campaignId, {entityId});
        if (!self.empty() && isHiddenFromPlayers(self.front())) {
            return ContentResult<RelatedEntities>::failure(ContentErrorKind::NotFound,
                                                           "Entity not found: " + entityId);
        }
        
        auto related = m_index.getRelated(campaignId, entityId);
        RelatedEntities filtered;
        filtered.references = filterDmOnlyMetadataList(related.references);
        filtered.referencedBy = filterDmOnlyMetadataList(related.referencedBy);
        return ContentResult<RelatedEntities>::success(filtered);
    });
}

ContentResult<std::vector<SearchResult>> ContentService::searchForPlayers(
    const std::string& campaignId,
    const std::string& query,
    const std::vector<std::string>& moduleIds) const
{
    return guarded<std::vector<SearchResult>>("Search for players", [&] {
        std::string needle = toLower(query);
        auto begin = needle.find_first_not_of(" \t\r\n");
        auto end = needle.find_last_not_of(" \t\r\n");
        needle = begin == std::string::npos ? std::string() : needle.substr(begin, end - begin + 1);
        
        std::vector<SearchResult> results;
        if (needle.empty()) {
            return ContentResult<std::vector<SearchResult>>::success(results);
        }
        
        std::vector<std::string> modules = moduleIds;
        if (modules.empty()) {
            modules = {"npcs", "lore"};
        }
        
        for (const auto& moduleId : modules) {
            auto target = resolvePlayer(campaignId, moduleId);
            
            std::error_code ec;
            if (!std::filesystem::is_directory(
                    m_store.moduleDirectory(target.campaignId, target.module.dataFolder), ec)) {
                spdlog::debug("Search skipping {}: no module folder", moduleId);
                continue;
            }
            
            auto visible = filterDmOnlyMetadataList(
                m_store.listEntities(target.campaignId, target.module.dataFolder));
            
            for (const auto& item : visible) {
                bool matched = toLower(item.name).find(needle) != std::string::npos;
                for (auto it = item.fields.begin(); !matched && it != item.fields.end(); ++it) {
                    if (it->is_string() &&
                        toLower(it->get<std::string>()).find(needle) != std::string::npos) {
                        matched = true;
                    }
                }
                if (!matched) {
                    continue;
                }
                
                SearchResult result;
                result.moduleId = target.module.id;
                result.id = item.id;
                result.name = item.name;
                
                auto source = stringValue(item.fields, "personality");
                if (!source) {
                    source = stringValue(item.fields, "appearance");
                }
                if (source) {
                    if (truncateUtf8(*source, SNIPPET_LENGTH, result.snippet)) {
                        result.snippet += "...";
                    }
                }
                result.type = stringValue(item.fields, "type");
                results.push_back(std::move(result));
            }
        }
        
        std::stable_sort(results.begin(), results.end(),
            [](const SearchResult& a, const SearchResult& b) {
                return toLower(a.name) < toLower(b.name);
            });
        
        return ContentResult<std::vector<SearchResult>>::success(results);
    });
}

} // namespace keeper
