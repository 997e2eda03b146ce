/**
 * Campaign Keeper - Content Store Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ContentStore.hpp"
#include "ContentError.hpp"
#include "FrontmatterParser.hpp"
#include "IdGenerator.hpp"

#include <QByteArray>
#include <QDateTime>
#include <QFileInfo>
#include <QSaveFile>
#include <QtConcurrent>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <mutex>

namespace keeper {

namespace {

constexpr int MAX_ID_ATTEMPTS = 8;
constexpr const char* ASSETS_DIR = "assets";

std::string trimmed(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string nowIso() {
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString();
}

std::string modifiedIso(const std::filesystem::path& path) {
    QFileInfo info(QString::fromStdString(path.string()));
    return info.lastModified().toUTC().toString(Qt::ISODateWithMs).toStdString();
}

// Case-insensitive ordering used for listings
bool lessByName(const EntityMetadata& a, const EntityMetadata& b) {
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };
    auto la = lower(a.name);
    auto lb = lower(b.name);
    if (la != lb) {
        return la < lb;
    }
    return a.id < b.id;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ContentError(ContentErrorKind::IO, "Failed to open " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw ContentError(ContentErrorKind::IO, "Failed to read " + path.string());
    }
    return content;
}

// Replace the file in one rename so unlocked readers see old or new, never half
void writeFileAtomic(const std::filesystem::path& path, const std::string& text) {
    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly)) {
        throw ContentError(ContentErrorKind::IO,
            "Failed to open " + path.string() + ": " + file.errorString().toStdString());
    }

    QByteArray data = QByteArray::fromStdString(text);
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        throw ContentError(ContentErrorKind::IO,
            "Failed to write " + path.string() + ": " + file.errorString().toStdString());
    }

    if (!file.commit()) {
        throw ContentError(ContentErrorKind::IO,
            "Failed to commit " + path.string() + ": " + file.errorString().toStdString());
    }
}

Frontmatter withoutNulls(const Frontmatter& frontmatter) {
    Frontmatter cleaned = Frontmatter::object();
    if (!frontmatter.is_object()) {
        return cleaned;
    }
    for (const auto& item : frontmatter.items()) {
        if (!item.value().is_null()) {
            cleaned[item.key()] = item.value();
        }
    }
    return cleaned;
}

} // anonymous namespace

class ContentStore::Impl {
public:
    std::filesystem::path campaignsDirectory;
    std::shared_ptr<FileLock> locks;
    std::string extension;

    mutable std::mutex artifactsMutex;
    std::map<std::string, std::vector<std::filesystem::path>> derivedArtifacts;

    std::filesystem::path campaignDirectory(const std::string& campaignId) const {
        if (!isValidEntityId(campaignId)) {
            throw ContentError(ContentErrorKind::Validation, "Invalid campaign id: " + campaignId);
        }
        return campaignsDirectory / campaignId;
    }

    std::filesystem::path requireModuleDirectory(const std::string& campaignId,
                                                 const std::string& moduleFolder) const {
        auto campaignDir = campaignDirectory(campaignId);
        if (!isValidEntityId(moduleFolder)) {
            throw ContentError(ContentErrorKind::Validation, "Invalid module folder: " + moduleFolder);
        }

        std::error_code ec;
        if (!std::filesystem::is_directory(campaignDir, ec)) {
            throw ContentError(ContentErrorKind::Validation, "Campaign not found: " + campaignId);
        }
        auto moduleDir = campaignDir / moduleFolder;
        if (!std::filesystem::is_directory(moduleDir, ec)) {
            throw ContentError(ContentErrorKind::Validation,
                "Module folder not found: " + campaignId + "/" + moduleFolder);
        }
        return moduleDir;
    }

    bool isEntityFile(const std::filesystem::directory_entry& entry) const {
        return entry.is_regular_file() && entry.path().extension() == extension;
    }

    std::string relativePath(const std::string& moduleFolder, const std::filesystem::path& file) const {
        return (std::filesystem::path(moduleFolder) / file.filename()).generic_string();
    }

    /**
     * Locate the file holding an entity
     *
     * Tries <id><ext> first, then scans for files whose name differs from
     * the id they declare.
     */
    std::optional<std::filesystem::path> findEntityFile(const std::filesystem::path& moduleDir,
                                                        const std::string& id) const {
        auto direct = moduleDir / (id + extension);
        std::error_code ec;
        if (std::filesystem::is_regular_file(direct, ec)) {
            try {
                auto document = FrontmatterParser::parse(readFile(direct));
                if (frontmatterString(document.frontmatter, "id") == id) {
                    return direct;
                }
            } catch (const ContentError& e) {
                spdlog::warn("Skipping unreadable entity file {}: {}", direct.string(), e.what());
            }
        }

        for (const auto& entry : std::filesystem::directory_iterator(moduleDir)) {
            if (!isEntityFile(entry) || entry.path() == direct) {
                continue;
            }
            try {
                auto document = FrontmatterParser::parse(readFile(entry.path()));
                if (frontmatterString(document.frontmatter, "id") == id) {
                    return entry.path();
                }
            } catch (const ContentError& e) {
                spdlog::debug("Ignoring {} during id lookup: {}", entry.path().string(), e.what());
            }
        }

        return std::nullopt;
    }

    Entity loadEntity(const std::string& moduleFolder, const std::filesystem::path& file) const {
        auto document = FrontmatterParser::parse(readFile(file));

        Entity entity;
        entity.frontmatter = std::move(document.frontmatter);
        entity.content = std::move(document.content);
        entity.filePath = relativePath(moduleFolder, file);
        entity.modified = modifiedIso(file);
        return entity;
    }

    Entity writeEntity(const std::string& moduleFolder,
                       const std::filesystem::path& file,
                       const Frontmatter& frontmatter,
                       const std::string& content) const {
        writeFileAtomic(file, FrontmatterParser::serialize(frontmatter, content));

        Entity entity;
        entity.frontmatter = frontmatter;
        entity.content = trimmed(content);
        entity.filePath = relativePath(moduleFolder, file);
        entity.modified = modifiedIso(file);
        return entity;
    }

    void invalidateDerivedArtifacts(const std::string& campaignId, const std::string& moduleFolder) const {
        std::vector<std::filesystem::path> artifacts;
        {
            std::lock_guard<std::mutex> lock(artifactsMutex);
            auto it = derivedArtifacts.find(moduleFolder);
            if (it == derivedArtifacts.end()) {
                return;
            }
            artifacts = it->second;
        }

        auto campaignDir = campaignsDirectory / campaignId;
        for (const auto& artifact : artifacts) {
            std::error_code ec;
            if (std::filesystem::remove(campaignDir / artifact, ec)) {
                spdlog::debug("Invalidated derived artifact: {}", (campaignDir / artifact).string());
            } else if (ec) {
                spdlog::warn("Failed to invalidate {}: {}", (campaignDir / artifact).string(), ec.message());
            }
        }
    }
};

ContentStore::ContentStore(const std::filesystem::path& campaignsDirectory,
                           std::shared_ptr<FileLock> locks,
                           const std::string& extension)
    : m_impl(std::make_unique<Impl>())
{
    m_impl->campaignsDirectory = campaignsDirectory;
    m_impl->locks = locks ? std::move(locks) : std::make_shared<FileLock>();
    m_impl->extension = extension.empty() || extension[0] == '.' ? extension : "." + extension;

    spdlog::debug("ContentStore rooted at: {}", campaignsDirectory.string());
}

ContentStore::~ContentStore() = default;

std::vector<EntityMetadata> ContentStore::listEntities(const std::string& campaignId,
                                                       const std::string& moduleFolder) const {
    auto moduleDir = m_impl->requireModuleDirectory(campaignId, moduleFolder);
    std::vector<EntityMetadata> metadata;

    try {
        for (const auto& entry : std::filesystem::directory_iterator(moduleDir)) {
            if (!m_impl->isEntityFile(entry)) {
                continue;
            }

            try {
                auto document = FrontmatterParser::parse(readFile(entry.path()));
                auto id = frontmatterString(document.frontmatter, "id");
                auto name = frontmatterString(document.frontmatter, "name");

                if (id.empty() || name.empty()) {
                    spdlog::warn("Skipping {}: frontmatter lacks id or name", entry.path().string());
                    continue;
                }
                if (isSystemRecordId(id)) {
                    continue;
                }

                EntityMetadata item;
                item.id = id;
                item.name = name;
                item.filePath = m_impl->relativePath(moduleFolder, entry.path());
                item.modified = modifiedIso(entry.path());
                item.fields = std::move(document.frontmatter);
                metadata.push_back(std::move(item));
            } catch (const ContentError& e) {
                spdlog::warn("Skipping file {}: {}", entry.path().filename().string(), e.what());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to list {}: {}", moduleDir.string(), e.what());
        throw ContentError(ContentErrorKind::IO, e.what());
    }

    std::sort(metadata.begin(), metadata.end(), lessByName);
    return metadata;
}

std::optional<Entity> ContentStore::getEntity(const std::string& campaignId,
                                              const std::string& moduleFolder,
                                              const std::string& id) const {
    auto moduleDir = m_impl->requireModuleDirectory(campaignId, moduleFolder);
    if (!isValidEntityId(id)) {
        return std::nullopt;
    }

    try {
        auto file = m_impl->findEntityFile(moduleDir, id);
        if (!file) {
            return std::nullopt;
        }
        return m_impl->loadEntity(moduleFolder, *file);
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to read entity {}/{}: {}", moduleFolder, id, e.what());
        throw ContentError(ContentErrorKind::IO, e.what());
    }
}

Entity ContentStore::createEntity(const std::string& campaignId,
                                  const std::string& moduleFolder,
                                  const CreateEntityInput& input) {
    auto moduleDir = m_impl->requireModuleDirectory(campaignId, moduleFolder);

    std::string name = trimmed(input.name);
    if (name.empty()) {
        throw ContentError(ContentErrorKind::Validation, "Name is required");
    }

    Frontmatter frontmatter = withoutNulls(input.frontmatter);
    std::optional<std::string> explicitId = input.id;
    if (!explicitId) {
        auto declared = frontmatterString(frontmatter, "id");
        if (!declared.empty()) {
            explicitId = declared;
        }
    }

    // Returns std::nullopt when the id is already taken
    auto tryCreate = [&](const std::string& id) -> std::optional<Entity> {
        return m_impl->locks->withLock(lockKey(campaignId, moduleFolder, id),
            [&]() -> std::optional<Entity> {
                // <id><ext> may be a hand-named file declaring another id
                std::error_code ec;
                if (std::filesystem::exists(moduleDir / (id + m_impl->extension), ec) ||
                    m_impl->findEntityFile(moduleDir, id)) {
                    return std::nullopt;
                }

                Frontmatter fields = frontmatter;
                fields["id"] = id;
                fields["name"] = name;
                if (!fields.contains("created")) {
                    fields["created"] = nowIso();
                }

                auto entity = m_impl->writeEntity(moduleFolder, moduleDir / (id + m_impl->extension),
                                                  fields, input.content);
                m_impl->invalidateDerivedArtifacts(campaignId, moduleFolder);
                return entity;
            });
    };

    try {
        if (explicitId) {
            if (!isValidEntityId(*explicitId)) {
                throw ContentError(ContentErrorKind::Validation, "Invalid entity id: " + *explicitId);
            }
            auto created = tryCreate(*explicitId);
            if (!created) {
                throw ContentError(ContentErrorKind::Validation, "Entity id already exists: " + *explicitId);
            }
            spdlog::info("Created entity: {}/{}", moduleFolder, *explicitId);
            return *created;
        }

        for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
            std::string candidate = generateEntityId(name);
            auto created = tryCreate(candidate);
            if (created) {
                spdlog::info("Created entity: {}/{}", moduleFolder, candidate);
                return *created;
            }
            spdlog::debug("Id collision on {}, regenerating suffix", candidate);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create entity in {}: {}", moduleFolder, e.what());
        throw ContentError(ContentErrorKind::IO, e.what());
    }

    throw ContentError(ContentErrorKind::Validation,
        "Could not generate a unique id for '" + name + "'");
}

std::optional<Entity> ContentStore::updateEntity(const std::string& campaignId,
                                                 const std::string& moduleFolder,
                                                 const std::string& id,
                                                 const UpdateEntityInput& update) {
    auto moduleDir = m_impl->requireModuleDirectory(campaignId, moduleFolder);
    if (!isValidEntityId(id)) {
        return std::nullopt;
    }
    if (update.name && trimmed(*update.name).empty()) {
        throw ContentError(ContentErrorKind::Validation, "Name is required");
    }

    try {
        return m_impl->locks->withLock(lockKey(campaignId, moduleFolder, id),
            [&]() -> std::optional<Entity> {
                auto file = m_impl->findEntityFile(moduleDir, id);
                if (!file) {
                    return std::nullopt;
                }

                auto existing = m_impl->loadEntity(moduleFolder, *file);

                Frontmatter merged = existing.frontmatter;
                if (update.frontmatter.is_object()) {
                    for (const auto& item : update.frontmatter.items()) {
                        if (item.key() == "id") {
                            continue;
                        }
                        if (item.key() == "name" && !item.value().is_null()) {
                            if (!item.value().is_string() ||
                                trimmed(item.value().get<std::string>()).empty()) {
                                throw ContentError(ContentErrorKind::Validation, "Name is required");
                            }
                            merged["name"] = trimmed(item.value().get<std::string>());
                            continue;
                        }
                        if (item.value().is_null()) {
                            // The name is required, it cannot be removed
                            if (item.key() != "name") {
                                merged.erase(item.key());
                            }
                        } else {
                            merged[item.key()] = item.value();
                        }
                    }
                }
                if (update.name) {
                    merged["name"] = trimmed(*update.name);
                }
                merged["id"] = id;

                const std::string& content = update.content ? *update.content : existing.content;
                auto entity = m_impl->writeEntity(moduleFolder, *file, merged, content);
                m_impl->invalidateDerivedArtifacts(campaignId, moduleFolder);

                spdlog::debug("Updated entity: {}/{}", moduleFolder, id);
                return entity;
            });
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to update entity {}/{}: {}", moduleFolder, id, e.what());
        throw ContentError(ContentErrorKind::IO, e.what());
    }
}

bool ContentStore::deleteEntity(const std::string& campaignId,
                                const std::string& moduleFolder,
                                const std::string& id) {
    auto moduleDir = m_impl->requireModuleDirectory(campaignId, moduleFolder);
    if (!isValidEntityId(id)) {
        return false;
    }

    try {
        return m_impl->locks->withLock(lockKey(campaignId, moduleFolder, id), [&]() {
            auto file = m_impl->findEntityFile(moduleDir, id);
            if (!file) {
                return false;
            }

            std::filesystem::remove(*file);
            m_impl->invalidateDerivedArtifacts(campaignId, moduleFolder);

            spdlog::info("Deleted entity: {}/{}", moduleFolder, id);
            return true;
        });
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to delete entity {}/{}: {}", moduleFolder, id, e.what());
        throw ContentError(ContentErrorKind::IO, e.what());
    }
}

QFuture<std::vector<EntityMetadata>> ContentStore::listEntitiesAsync(const std::string& campaignId,
                                                                     const std::string& moduleFolder) const {
    return QtConcurrent::run([this, campaignId, moduleFolder]() {
        return listEntities(campaignId, moduleFolder);
    });
}

QFuture<std::optional<Entity>> ContentStore::getEntityAsync(const std::string& campaignId,
                                                            const std::string& moduleFolder,
                                                            const std::string& id) const {
    return QtConcurrent::run([this, campaignId, moduleFolder, id]() {
        return getEntity(campaignId, moduleFolder, id);
    });
}

QFuture<Entity> ContentStore::createEntityAsync(const std::string& campaignId,
                                                const std::string& moduleFolder,
                                                const CreateEntityInput& input) {
    return QtConcurrent::run([this, campaignId, moduleFolder, input]() {
        return createEntity(campaignId, moduleFolder, input);
    });
}

QFuture<std::optional<Entity>> ContentStore::updateEntityAsync(const std::string& campaignId,
                                                               const std::string& moduleFolder,
                                                               const std::string& id,
                                                               const UpdateEntityInput& update) {
    return QtConcurrent::run([this, campaignId, moduleFolder, id, update]() {
        return updateEntity(campaignId, moduleFolder, id, update);
    });
}

QFuture<bool> ContentStore::deleteEntityAsync(const std::string& campaignId,
                                              const std::string& moduleFolder,
                                              const std::string& id) {
    return QtConcurrent::run([this, campaignId, moduleFolder, id]() {
        return deleteEntity(campaignId, moduleFolder, id);
    });
}

std::vector<std::string> ContentStore::listModuleFolders(const std::string& campaignId) const {
    auto campaignDir = m_impl->campaignDirectory(campaignId);
    std::error_code ec;
    if (!std::filesystem::is_directory(campaignDir, ec)) {
        throw ContentError(ContentErrorKind::Validation, "Campaign not found: " + campaignId);
    }

    std::vector<std::string> folders;
    try {
        for (const auto& entry : std::filesystem::directory_iterator(campaignDir)) {
            if (!entry.is_directory()) {
                continue;
            }
            auto name = entry.path().filename().string();
            if (name == ASSETS_DIR || name.empty() || name[0] == '.') {
                continue;
            }
            folders.push_back(name);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to scan campaign {}: {}", campaignId, e.what());
        throw ContentError(ContentErrorKind::IO, e.what());
    }

    std::sort(folders.begin(), folders.end());
    return folders;
}

void ContentStore::setDerivedArtifacts(const std::string& moduleFolder,
                                       const std::vector<std::filesystem::path>& artifacts) {
    std::lock_guard<std::mutex> lock(m_impl->artifactsMutex);
    m_impl->derivedArtifacts[moduleFolder] = artifacts;
}

std::filesystem::path ContentStore::campaignDirectory(const std::string& campaignId) const {
    return m_impl->campaignDirectory(campaignId);
}

std::filesystem::path ContentStore::moduleDirectory(const std::string& campaignId,
                                                    const std::string& moduleFolder) const {
    return m_impl->campaignDirectory(campaignId) / moduleFolder;
}

std::filesystem::path ContentStore::entityPath(const std::string& campaignId,
                                               const std::string& moduleFolder,
                                               const std::string& id) const {
    return moduleDirectory(campaignId, moduleFolder) / (id + m_impl->extension);
}

std::string ContentStore::lockKey(const std::string& campaignId,
                                  const std::string& moduleFolder,
                                  const std::string& id) const {
    return entityPath(campaignId, moduleFolder, id).generic_string();
}

const std::filesystem::path& ContentStore::campaignsDirectory() const {
    return m_impl->campaignsDirectory;
}

const std::string& ContentStore::extension() const {
    return m_impl->extension;
}

FileLock& ContentStore::locks() const {
    return *m_impl->locks;
}

} // namespace keeper
