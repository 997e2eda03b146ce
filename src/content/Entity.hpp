/**
 * Campaign Keeper - Entity
 *
 * Data model for campaign entities persisted one per file.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace keeper {

/**
 * Structured header of an entity file
 *
 * Always a JSON object holding at least "id" and "name".
 */
using Frontmatter = nlohmann::json;

/**
 * Read a string field, empty if absent or not a string
 */
inline std::string frontmatterString(const Frontmatter& frontmatter, const std::string& key) {
    if (!frontmatter.is_object()) {
        return {};
    }
    auto it = frontmatter.find(key);
    if (it == frontmatter.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

/**
 * A full entity with body content
 */
struct Entity {
    Frontmatter frontmatter = Frontmatter::object();
    std::string content;     // Free text body
    std::string filePath;    // Relative to the campaign directory
    std::string modified;    // ISO 8601 modification time

    std::string id() const { return frontmatterString(frontmatter, "id"); }
    std::string name() const { return frontmatterString(frontmatter, "name"); }

    /**
     * Serialize to JSON
     */
    nlohmann::json toJson() const {
        nlohmann::json obj;
        obj["frontmatter"] = frontmatter;
        obj["content"] = content;
        obj["filePath"] = filePath;
        obj["modified"] = modified;
        return obj;
    }
};

/**
 * Lightweight listing record, no body content
 *
 * `fields` carries the whole frontmatter so that visibility flags and
 * relationship fields are available to filters and indexes.
 */
struct EntityMetadata {
    std::string id;
    std::string name;
    std::string filePath;
    std::string modified;
    Frontmatter fields = Frontmatter::object();

    /**
     * Serialize to JSON (frontmatter fields flattened in)
     */
    nlohmann::json toJson() const {
        nlohmann::json obj = fields.is_object() ? fields : nlohmann::json::object();
        obj["id"] = id;
        obj["name"] = name;
        obj["filePath"] = filePath;
        obj["modified"] = modified;
        return obj;
    }
};

/**
 * Input for creating an entity
 */
struct CreateEntityInput {
    std::string name;
    std::optional<std::string> id;              // Generated from name when absent
    std::string content;
    Frontmatter frontmatter = Frontmatter::object();
};

/**
 * Partial update of an entity
 *
 * Only provided values change. A frontmatter key mapped to null removes
 * that key; "id" can never be changed.
 */
struct UpdateEntityInput {
    std::optional<std::string> name;
    std::optional<std::string> content;
    Frontmatter frontmatter = Frontmatter::object();
};

/**
 * Entities whose id starts with an underscore hold module settings
 */
inline bool isSystemRecordId(const std::string& id) {
    return !id.empty() && id[0] == '_';
}

} // namespace keeper
