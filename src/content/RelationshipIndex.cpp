/**
 * Campaign Keeper - Relationship Index Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "RelationshipIndex.hpp"
#include "ContentError.hpp"
#include "ContentStore.hpp"

#include <algorithm>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace keeper {

RelationshipIndex::RelationshipIndex(const ContentStore& store)
    : m_store(store)
{
}

void RelationshipIndex::registerFields(const std::string& moduleId, const std::vector<std::string>& fields) {
    std::lock_guard<std::mutex> lock(m_mutex);
    
    auto& registered = m_fields[moduleId];
    std::size_t before = registered.size();
    registered.insert(fields.begin(), fields.end());
    
    if (before > 0 && registered.size() != before) {
        spdlog::warn("Relationship fields of {} extended after first registration", moduleId);
    }
    spdlog::debug("Relationship fields registered for {}: {}", moduleId, registered.size());
}

std::set<std::string> RelationshipIndex::getFields(const std::string& moduleId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_fields.find(moduleId);
    if (it != m_fields.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> RelationshipIndex::registeredModules() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> modules;
    modules.reserve(m_fields.size());
    for (const auto& [moduleId, fields] : m_fields) {
        modules.push_back(moduleId);
    }
    return modules;
}

std::vector<std::string> RelationshipIndex::extractIds(const nlohmann::json& value) {
    std::vector<std::string> ids;
    if (value.is_string()) {
        auto id = value.get<std::string>();
        if (!id.empty()) {
            ids.push_back(id);
        }
    } else if (value.is_array()) {
        for (const auto& element : value) {
            if (element.is_string() && !element.get<std::string>().empty()) {
                ids.push_back(element.get<std::string>());
            }
        }
    }
    return ids;
}

std::vector<RelationshipIndex::ScannedEntity> RelationshipIndex::scanCampaign(const std::string& campaignId) const {
    std::vector<ScannedEntity> entities;
    
    for (const auto& module : m_store.listModuleFolders(campaignId)) {
        try {
            for (auto& metadata : m_store.listEntities(campaignId, module)) {
                entities.push_back({module, std::move(metadata)});
            }
        } catch (const ContentError& e) {
            // One unreadable module degrades the scan, it does not abort it
            spdlog::warn("Skipping module {} in relationship scan: {}", module, e.what());
        }
    }
    
    spdlog::debug("Relationship scan of {}: {} entities", campaignId, entities.size());
    return entities;
}

ReverseReferenceMap RelationshipIndex::invert(const std::vector<ScannedEntity>& entities) const {
    ReverseReferenceMap reverse;
    
    for (const auto& entity : entities) {
        for (const auto& field : getFields(entity.module)) {
            auto it = entity.metadata.fields.find(field);
            if (it == entity.metadata.fields.end()) {
                continue;
            }
            
            for (const auto& targetId : extractIds(*it)) {
                ReverseReference reference{entity.module, entity.metadata.id, field};
                auto& references = reverse[targetId];
                if (std::find(references.begin(), references.end(), reference) == references.end()) {
                    references.push_back(std::move(reference));
                }
            }
        }
    }
    
    return reverse;
}

ReverseReferenceMap RelationshipIndex::computeReverseReferences(const std::string& campaignId) const {
    return invert(scanCampaign(campaignId));
}

RelatedEntities RelationshipIndex::getRelated(const std::string& campaignId, const std::string& entityId) const {
    auto entities = scanCampaign(campaignId);
    
    // First module in folder order wins if two modules share an id
    std::unordered_map<std::string, const ScannedEntity*> byId;
    for (const auto& entity : entities) {
        byId.emplace(entity.metadata.id, &entity);
    }
    
    RelatedEntities related;
    
    auto self = byId.find(entityId);
    if (self != byId.end()) {
        std::set<std::string> seen;
        const auto& source = *self->second;
        for (const auto& field : getFields(source.module)) {
            auto it = source.metadata.fields.find(field);
            if (it == source.metadata.fields.end()) {
                continue;
            }
            for (const auto& targetId : extractIds(*it)) {
                auto target = byId.find(targetId);
                if (target != byId.end() && seen.insert(targetId).second) {
                    related.references.push_back(target->second->metadata);
                }
            }
        }
    }
    
    auto reverse = invert(entities);
    auto incoming = reverse.find(entityId);
    if (incoming != reverse.end()) {
        std::set<std::pair<std::string, std::string>> seen;
        for (const auto& reference : incoming->second) {
            if (!seen.insert({reference.sourceModule, reference.sourceEntityId}).second) {
                continue;
            }
            for (const auto& entity : entities) {
                if (entity.module == reference.sourceModule &&
                    entity.metadata.id == reference.sourceEntityId) {
                    related.referencedBy.push_back(entity.metadata);
                    break;
                }
            }
        }
    }
    
    return related;
}

std::vector<EntityMetadata> RelationshipIndex::resolveIds(const std::string& campaignId,
                                                          const std::vector<std::string>& ids) const {
    auto entities = scanCampaign(campaignId);
    
    std::unordered_map<std::string, const EntityMetadata*> byId;
    for (const auto& entity : entities) {
        byId.emplace(entity.metadata.id, &entity.metadata);
    }
    
    std::vector<EntityMetadata> resolved;
    for (const auto& id : ids) {
        auto it = byId.find(id);
        if (it != byId.end()) {
            resolved.push_back(*it->second);
        }
    }
    return resolved;
}

} // namespace keeper
