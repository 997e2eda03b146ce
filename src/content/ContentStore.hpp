/**
 * Campaign Keeper - Content Store
 *
 * CRUD over campaign entities, one file per entity.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QFuture>

#include "Entity.hpp"
#include "FileLock.hpp"

namespace keeper {

/**
 * Content Store
 *
 * Entities live at <campaignsDirectory>/<campaignId>/<moduleFolder>/<id><ext>.
 * Every mutation runs inside the shared FileLock, keyed by the entity's
 * storage path, so writers of one entity never interleave. Reads take no
 * lock; writes replace files atomically so readers never see a torn file.
 *
 * Missing campaign or module directories and malformed ids raise
 * ContentError (Validation). Disk failures raise ContentError (IO).
 */
class ContentStore {
public:
    /**
     * Create a store rooted at the campaigns directory
     *
     * @param campaignsDirectory Directory holding one folder per campaign
     * @param locks Lock registry shared with every other writer
     * @param extension Entity file extension, including the dot
     */
    ContentStore(const std::filesystem::path& campaignsDirectory,
                 std::shared_ptr<FileLock> locks,
                 const std::string& extension = ".md");
    ~ContentStore();

    // =====================
    // Queries
    // =====================

    /**
     * List all parsable entities of a module, sorted by name
     *
     * Files that fail to parse or lack an id or name are skipped with a
     * warning. System records (id starting with '_') are not listed.
     */
    std::vector<EntityMetadata> listEntities(const std::string& campaignId,
                                             const std::string& moduleFolder) const;

    /**
     * Get a full entity, std::nullopt if no entity has this id
     */
    std::optional<Entity> getEntity(const std::string& campaignId,
                                    const std::string& moduleFolder,
                                    const std::string& id) const;

    // =====================
    // Mutations
    // =====================

    /**
     * Create an entity
     *
     * Without an explicit id, one is generated from the name and the random
     * suffix is regenerated until it does not collide. An explicit id that
     * already exists is a validation error.
     */
    Entity createEntity(const std::string& campaignId,
                        const std::string& moduleFolder,
                        const CreateEntityInput& input);

    /**
     * Merge a partial update into an entity
     *
     * @return Updated entity, std::nullopt if no entity has this id
     */
    std::optional<Entity> updateEntity(const std::string& campaignId,
                                       const std::string& moduleFolder,
                                       const std::string& id,
                                       const UpdateEntityInput& update);

    /**
     * Delete an entity
     *
     * @return true if a file was removed
     */
    bool deleteEntity(const std::string& campaignId,
                      const std::string& moduleFolder,
                      const std::string& id);

    // =====================
    // Async variants (run on the global thread pool)
    // =====================

    QFuture<std::vector<EntityMetadata>> listEntitiesAsync(const std::string& campaignId,
                                                           const std::string& moduleFolder) const;
    QFuture<std::optional<Entity>> getEntityAsync(const std::string& campaignId,
                                                  const std::string& moduleFolder,
                                                  const std::string& id) const;
    QFuture<Entity> createEntityAsync(const std::string& campaignId,
                                      const std::string& moduleFolder,
                                      const CreateEntityInput& input);
    QFuture<std::optional<Entity>> updateEntityAsync(const std::string& campaignId,
                                                     const std::string& moduleFolder,
                                                     const std::string& id,
                                                     const UpdateEntityInput& update);
    QFuture<bool> deleteEntityAsync(const std::string& campaignId,
                                    const std::string& moduleFolder,
                                    const std::string& id);

    // =====================
    // Layout
    // =====================

    /**
     * Module folders present in a campaign (excludes assets and hidden dirs)
     */
    std::vector<std::string> listModuleFolders(const std::string& campaignId) const;

    /**
     * Files, relative to the campaign directory, derived from a module's
     * entities. They are deleted whenever one of those entities changes.
     */
    void setDerivedArtifacts(const std::string& moduleFolder,
                             const std::vector<std::filesystem::path>& artifacts);

    std::filesystem::path campaignDirectory(const std::string& campaignId) const;
    std::filesystem::path moduleDirectory(const std::string& campaignId,
                                          const std::string& moduleFolder) const;
    std::filesystem::path entityPath(const std::string& campaignId,
                                     const std::string& moduleFolder,
                                     const std::string& id) const;

    /**
     * Key under which mutations of this entity are serialized
     */
    std::string lockKey(const std::string& campaignId,
                        const std::string& moduleFolder,
                        const std::string& id) const;

    const std::filesystem::path& campaignsDirectory() const;
    const std::string& extension() const;
    FileLock& locks() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace keeper
