/**
 * Campaign Keeper - Content Store Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <QFuture>
#include <QThreadPool>
#include <QtConcurrent>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "content/ContentError.hpp"
#include "content/ContentStore.hpp"

using namespace keeper;

class ContentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() /
            ("campaign-keeper-store-test-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir / "iron-sea" / "npcs");
        std::filesystem::create_directories(testDir / "iron-sea" / "assets");
        
        store = std::make_unique<ContentStore>(testDir, std::make_shared<FileLock>());
    }
    
    void TearDown() override {
        store.reset();
        std::filesystem::remove_all(testDir);
    }
    
    void writeRaw(const std::string& fileName, const std::string& raw) {
        std::ofstream file(testDir / "iron-sea" / "npcs" / fileName);
        file << raw;
    }
    
    std::string readRaw(const std::string& fileName) {
        std::ifstream file(testDir / "iron-sea" / "npcs" / fileName);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
    
    Entity create(const std::string& name, Frontmatter frontmatter = Frontmatter::object()) {
        CreateEntityInput input;
        input.name = name;
        input.frontmatter = std::move(frontmatter);
        return store->createEntity("iron-sea", "npcs", input);
    }
    
    std::filesystem::path testDir;
    std::unique_ptr<ContentStore> store;
};

TEST_F(ContentStoreTest, CreateGeneratesIdFromName) {
    CreateEntityInput input;
    input.name = "Captain Vex";
    input.content = "Scarred veteran.";
    input.frontmatter = {{"occupation", "Smuggler"}};
    
    auto entity = store->createEntity("iron-sea", "npcs", input);
    
    EXPECT_EQ(entity.id().rfind("captain-vex-", 0), 0u);
    EXPECT_EQ(entity.name(), "Captain Vex");
    EXPECT_EQ(entity.frontmatter["occupation"], "Smuggler");
    EXPECT_TRUE(entity.frontmatter.contains("created"));
    EXPECT_EQ(entity.filePath, "npcs/" + entity.id() + ".md");
    EXPECT_FALSE(entity.modified.empty());
    EXPECT_TRUE(std::filesystem::exists(testDir / "iron-sea" / entity.filePath));
    
    auto loaded = store->getEntity("iron-sea", "npcs", entity.id());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->frontmatter, entity.frontmatter);
    EXPECT_EQ(loaded->content, "Scarred veteran.");
}

TEST_F(ContentStoreTest, CreateRejectsDuplicateExplicitId) {
    CreateEntityInput input;
    input.name = "Mira Sol";
    input.id = "mira-sol";
    store->createEntity("iron-sea", "npcs", input);
    
    try {
        store->createEntity("iron-sea", "npcs", input);
        FAIL() << "Expected ContentError";
    } catch (const ContentError& e) {
        EXPECT_EQ(e.kind(), ContentErrorKind::Validation);
    }
    EXPECT_EQ(store->listEntities("iron-sea", "npcs").size(), 1u);
}

TEST_F(ContentStoreTest, CreateNeverOverwritesHandNamedFile) {
    writeRaw("x.md", "---\n{\"id\": \"old-salt\", \"name\": \"Old Salt\"}\n---\n\nBody");
    
    CreateEntityInput input;
    input.name = "X";
    input.id = "x";
    try {
        store->createEntity("iron-sea", "npcs", input);
        FAIL() << "Expected ContentError";
    } catch (const ContentError& e) {
        EXPECT_EQ(e.kind(), ContentErrorKind::Validation);
    }
    
    EXPECT_NE(readRaw("x.md").find("old-salt"), std::string::npos);
    auto survivor = store->getEntity("iron-sea", "npcs", "old-salt");
    ASSERT_TRUE(survivor.has_value());
    EXPECT_EQ(survivor->name(), "Old Salt");
}

TEST_F(ContentStoreTest, CreateRequiresName) {
    EXPECT_THROW(create("   "), ContentError);
}

TEST_F(ContentStoreTest, ListSkipsMalformedFiles) {
    create("Captain Vex");
    writeRaw("broken.md", "---\n{ not json\n---\nBody");
    writeRaw("unterminated.md", "---\n{\"id\": \"x\", \"name\": \"X\"}\nBody");
    writeRaw("nameless.md", "---\n{\"id\": \"nameless\"}\n---\nBody");
    writeRaw("notes.txt", "ignored, wrong extension");
    
    auto entities = store->listEntities("iron-sea", "npcs");
    
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].name, "Captain Vex");
}

TEST_F(ContentStoreTest, ListOmitsSystemRecords) {
    CreateEntityInput settings;
    settings.name = "Map Settings";
    settings.id = "_map-config";
    store->createEntity("iron-sea", "npcs", settings);
    create("Captain Vex");
    
    auto entities = store->listEntities("iron-sea", "npcs");
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].name, "Captain Vex");
    
    // Still reachable by id
    EXPECT_TRUE(store->getEntity("iron-sea", "npcs", "_map-config").has_value());
}

TEST_F(ContentStoreTest, ListIsSortedByNameAndOmitsBody) {
    CreateEntityInput input;
    input.name = "zeta";
    input.content = "Body text";
    store->createEntity("iron-sea", "npcs", input);
    create("Alpha");
    create("beta");
    
    auto entities = store->listEntities("iron-sea", "npcs");
    ASSERT_EQ(entities.size(), 3u);
    EXPECT_EQ(entities[0].name, "Alpha");
    EXPECT_EQ(entities[1].name, "beta");
    EXPECT_EQ(entities[2].name, "zeta");
    EXPECT_FALSE(entities[2].toJson().contains("content"));
}

TEST_F(ContentStoreTest, UpdateMergesPartialFrontmatter) {
    auto created = create("Captain Vex", {{"occupation", "Smuggler"}, {"goals", "Revenge"}});
    
    UpdateEntityInput update;
    update.frontmatter = {{"occupation", "Admiral"}, {"goals", nullptr}, {"id", "hijacked"}};
    auto updated = store->updateEntity("iron-sea", "npcs", created.id(), update);
    
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->id(), created.id());
    EXPECT_EQ(updated->name(), "Captain Vex");
    EXPECT_EQ(updated->frontmatter["occupation"], "Admiral");
    EXPECT_FALSE(updated->frontmatter.contains("goals"));
    EXPECT_EQ(updated->frontmatter["created"], created.frontmatter["created"]);
}

TEST_F(ContentStoreTest, UpdateKeepsContentUnlessProvided) {
    CreateEntityInput input;
    input.name = "Mira Sol";
    input.content = "Original body";
    auto created = store->createEntity("iron-sea", "npcs", input);
    
    UpdateEntityInput rename;
    rename.name = "  Mira Sol-Vance ";
    auto renamed = store->updateEntity("iron-sea", "npcs", created.id(), rename);
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(renamed->name(), "Mira Sol-Vance");
    EXPECT_EQ(renamed->content, "Original body");
    
    UpdateEntityInput rewrite;
    rewrite.content = "New body";
    auto rewritten = store->updateEntity("iron-sea", "npcs", created.id(), rewrite);
    ASSERT_TRUE(rewritten.has_value());
    EXPECT_EQ(rewritten->content, "New body");
}

TEST_F(ContentStoreTest, UpdateCannotRemoveName) {
    auto created = create("Captain Vex");
    
    UpdateEntityInput update;
    update.frontmatter = {{"name", nullptr}};
    auto updated = store->updateEntity("iron-sea", "npcs", created.id(), update);
    
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->name(), "Captain Vex");
}

TEST_F(ContentStoreTest, UpdateRejectsBlankNameInFrontmatter) {
    auto created = create("Captain Vex");
    
    UpdateEntityInput blank;
    blank.frontmatter = {{"name", "   "}};
    try {
        store->updateEntity("iron-sea", "npcs", created.id(), blank);
        FAIL() << "Expected ContentError";
    } catch (const ContentError& e) {
        EXPECT_EQ(e.kind(), ContentErrorKind::Validation);
    }
    
    UpdateEntityInput notString;
    notString.frontmatter = {{"name", 7}};
    EXPECT_THROW(store->updateEntity("iron-sea", "npcs", created.id(), notString), ContentError);
    
    auto entities = store->listEntities("iron-sea", "npcs");
    ASSERT_EQ(entities.size(), 1u);
    EXPECT_EQ(entities[0].name, "Captain Vex");
    
    UpdateEntityInput padded;
    padded.frontmatter = {{"name", " Admiral Vex "}};
    auto renamed = store->updateEntity("iron-sea", "npcs", created.id(), padded);
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(renamed->name(), "Admiral Vex");
}

TEST_F(ContentStoreTest, UpdateUnknownIdReturnsNotFound) {
    UpdateEntityInput update;
    update.content = "anything";
    EXPECT_FALSE(store->updateEntity("iron-sea", "npcs", "nobody", update).has_value());
}

TEST_F(ContentStoreTest, DeleteRemovesFile) {
    auto created = create("Captain Vex");
    
    EXPECT_TRUE(store->deleteEntity("iron-sea", "npcs", created.id()));
    EXPECT_FALSE(std::filesystem::exists(testDir / "iron-sea" / created.filePath));
    EXPECT_FALSE(store->getEntity("iron-sea", "npcs", created.id()).has_value());
    EXPECT_FALSE(store->deleteEntity("iron-sea", "npcs", created.id()));
}

TEST_F(ContentStoreTest, MissingDirectoriesAreValidationErrors) {
    try {
        store->listEntities("iron-sea", "ships");
        FAIL() << "Expected ContentError";
    } catch (const ContentError& e) {
        EXPECT_EQ(e.kind(), ContentErrorKind::Validation);
    }
    
    try {
        store->getEntity("no-such-campaign", "npcs", "x");
        FAIL() << "Expected ContentError";
    } catch (const ContentError& e) {
        EXPECT_EQ(e.kind(), ContentErrorKind::Validation);
    }
    
    EXPECT_THROW(store->listEntities("..", "npcs"), ContentError);
}

TEST_F(ContentStoreTest, FindsEntityWhoseFileNameDiffers) {
    writeRaw("renamed-by-hand.md", "---\n{\"id\": \"old-salt\", \"name\": \"Old Salt\"}\n---\n\nBody");
    
    auto entity = store->getEntity("iron-sea", "npcs", "old-salt");
    ASSERT_TRUE(entity.has_value());
    EXPECT_EQ(entity->filePath, "npcs/renamed-by-hand.md");
    
    UpdateEntityInput update;
    update.frontmatter = {{"occupation", "Cook"}};
    ASSERT_TRUE(store->updateEntity("iron-sea", "npcs", "old-salt", update).has_value());
    EXPECT_NE(readRaw("renamed-by-hand.md").find("Cook"), std::string::npos);
}

TEST_F(ContentStoreTest, ConcurrentUpdatesOfOneEntityAreNotLost) {
    auto created = create("Captain Vex");
    
    QThreadPool pool;
    pool.setMaxThreadCount(8);
    
    std::vector<QFuture<std::optional<Entity>>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(QtConcurrent::run(&pool, [this, &created, i]() {
            UpdateEntityInput update;
            update.frontmatter = {{"field" + std::to_string(i), i}};
            return store->updateEntity("iron-sea", "npcs", created.id(), update);
        }));
    }
    for (auto& future : futures) {
        future.waitForFinished();
        EXPECT_TRUE(future.result().has_value());
    }
    
    auto merged = store->getEntity("iron-sea", "npcs", created.id());
    ASSERT_TRUE(merged.has_value());
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(merged->frontmatter.value("field" + std::to_string(i), -1), i);
    }
    EXPECT_EQ(store->locks().activeKeyCount(), 0u);
}

TEST_F(ContentStoreTest, ConcurrentCreatesYieldDistinctEntities) {
    QThreadPool pool;
    pool.setMaxThreadCount(8);
    
    std::vector<QFuture<Entity>> futures;
    for (int i = 0; i < 12; ++i) {
        futures.push_back(QtConcurrent::run(&pool, [this]() {
            CreateEntityInput input;
            input.name = "Deckhand";
            return store->createEntity("iron-sea", "npcs", input);
        }));
    }
    for (auto& future : futures) {
        future.waitForFinished();
    }
    
    EXPECT_EQ(store->listEntities("iron-sea", "npcs").size(), 12u);
}

TEST_F(ContentStoreTest, AsyncVariantsReturnFutures) {
    CreateEntityInput input;
    input.name = "Captain Vex";
    auto created = store->createEntityAsync("iron-sea", "npcs", input).result();
    
    auto loaded = store->getEntityAsync("iron-sea", "npcs", created.id()).result();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->name(), "Captain Vex");
    
    EXPECT_EQ(store->listEntitiesAsync("iron-sea", "npcs").result().size(), 1u);
    EXPECT_TRUE(store->deleteEntityAsync("iron-sea", "npcs", created.id()).result());
}

TEST_F(ContentStoreTest, MutationsInvalidateDerivedArtifacts) {
    auto artifact = testDir / "iron-sea" / "npc-index.html";
    store->setDerivedArtifacts("npcs", {"npc-index.html"});
    
    std::ofstream(artifact) << "<html></html>";
    auto created = create("Captain Vex");
    EXPECT_FALSE(std::filesystem::exists(artifact));
    
    std::ofstream(artifact) << "<html></html>";
    EXPECT_TRUE(store->deleteEntity("iron-sea", "npcs", created.id()));
    EXPECT_FALSE(std::filesystem::exists(artifact));
}

TEST_F(ContentStoreTest, ListsModuleFolders) {
    std::filesystem::create_directories(testDir / "iron-sea" / "locations");
    std::filesystem::create_directories(testDir / "iron-sea" / ".trash");
    
    auto folders = store->listModuleFolders("iron-sea");
    EXPECT_EQ(folders, (std::vector<std::string>{"locations", "npcs"}));
}

TEST_F(ContentStoreTest, LockKeyIsStoragePath) {
    auto key = store->lockKey("iron-sea", "npcs", "captain-vex");
    EXPECT_EQ(key, (testDir / "iron-sea" / "npcs" / "captain-vex.md").generic_string());
}
