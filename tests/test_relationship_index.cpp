/**
 * Campaign Keeper - Relationship Index Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

#include "content/ContentStore.hpp"
#include "content/RelationshipIndex.hpp"

using namespace keeper;

class RelationshipIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() /
            ("campaign-keeper-index-test-" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(testDir);
        for (const char* module : {"npcs", "factions", "lore"}) {
            std::filesystem::create_directories(testDir / "iron-sea" / module);
        }
        
        store = std::make_unique<ContentStore>(testDir, std::make_shared<FileLock>());
        index = std::make_unique<RelationshipIndex>(*store);
        index->registerFields("npcs", {"relatedCharacters"});
        index->registerFields("factions", {"affiliations"});
    }
    
    void TearDown() override {
        index.reset();
        store.reset();
        std::filesystem::remove_all(testDir);
    }
    
    void add(const std::string& module, const std::string& id, Frontmatter frontmatter = Frontmatter::object()) {
        CreateEntityInput input;
        input.name = id;
        input.id = id;
        input.frontmatter = std::move(frontmatter);
        store->createEntity("iron-sea", module, input);
    }
    
    static bool containsId(const std::vector<EntityMetadata>& items, const std::string& id) {
        return std::any_of(items.begin(), items.end(),
            [&](const EntityMetadata& item) { return item.id == id; });
    }
    
    std::filesystem::path testDir;
    std::unique_ptr<ContentStore> store;
    std::unique_ptr<RelationshipIndex> index;
};

TEST_F(RelationshipIndexTest, RegistrationIsUnionMerge) {
    index->registerFields("npcs", {"relatedCharacters"});
    index->registerFields("npcs", {"location"});
    
    auto fields = index->getFields("npcs");
    EXPECT_EQ(fields, (std::set<std::string>{"location", "relatedCharacters"}));
    EXPECT_TRUE(index->getFields("ships").empty());
    
    auto modules = index->registeredModules();
    EXPECT_NE(std::find(modules.begin(), modules.end(), "factions"), modules.end());
}

TEST_F(RelationshipIndexTest, ExtractsIdsFromStringsAndArrays) {
    EXPECT_EQ(RelationshipIndex::extractIds("mira-sol"), (std::vector<std::string>{"mira-sol"}));
    EXPECT_EQ(RelationshipIndex::extractIds(nlohmann::json::array({"a", 3, "", "b"})),
              (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(RelationshipIndex::extractIds(nullptr).empty());
    EXPECT_TRUE(RelationshipIndex::extractIds(42).empty());
}

TEST_F(RelationshipIndexTest, ComputesReverseReferencesAcrossModules) {
    add("npcs", "mira-sol");
    add("npcs", "captain-vex", {{"relatedCharacters", {"mira-sol", "old-salt"}}});
    add("factions", "free-traders", {{"affiliations", "mira-sol"}});
    
    auto reverse = index->computeReverseReferences("iron-sea");
    
    ASSERT_EQ(reverse["mira-sol"].size(), 2u);
    EXPECT_NE(std::find(reverse["mira-sol"].begin(), reverse["mira-sol"].end(),
                        ReverseReference{"npcs", "captain-vex", "relatedCharacters"}),
              reverse["mira-sol"].end());
    EXPECT_NE(std::find(reverse["mira-sol"].begin(), reverse["mira-sol"].end(),
                        ReverseReference{"factions", "free-traders", "affiliations"}),
              reverse["mira-sol"].end());
    
    // Dangling targets are still reported
    ASSERT_EQ(reverse["old-salt"].size(), 1u);
}

TEST_F(RelationshipIndexTest, IgnoresUnregisteredFields) {
    add("npcs", "mira-sol");
    add("lore", "prophecy", {{"relatedCharacters", {"mira-sol"}}});
    add("npcs", "captain-vex", {{"enemies", {"mira-sol"}}});
    
    auto reverse = index->computeReverseReferences("iron-sea");
    EXPECT_EQ(reverse.count("mira-sol"), 0u);
}

TEST_F(RelationshipIndexTest, SeesLatestDiskState) {
    add("npcs", "mira-sol");
    add("npcs", "captain-vex", {{"relatedCharacters", {"mira-sol"}}});
    ASSERT_EQ(index->computeReverseReferences("iron-sea")["mira-sol"].size(), 1u);
    
    UpdateEntityInput update;
    update.frontmatter = {{"relatedCharacters", nlohmann::json::array()}};
    ASSERT_TRUE(store->updateEntity("iron-sea", "npcs", "captain-vex", update).has_value());
    
    EXPECT_EQ(index->computeReverseReferences("iron-sea").count("mira-sol"), 0u);
}

TEST_F(RelationshipIndexTest, ResolvesBothDirections) {
    add("npcs", "mira-sol", {{"relatedCharacters", {"captain-vex", "ghost"}}});
    add("npcs", "captain-vex", {{"relatedCharacters", {"mira-sol"}}});
    add("factions", "free-traders", {{"affiliations", {"mira-sol"}}});
    add("lore", "prophecy");
    
    auto related = index->getRelated("iron-sea", "mira-sol");
    
    ASSERT_EQ(related.references.size(), 1u);
    EXPECT_EQ(related.references[0].id, "captain-vex");
    EXPECT_EQ(related.referencedBy.size(), 2u);
    EXPECT_TRUE(containsId(related.referencedBy, "captain-vex"));
    EXPECT_TRUE(containsId(related.referencedBy, "free-traders"));
}

TEST_F(RelationshipIndexTest, UnknownEntityHasNoRelations) {
    add("npcs", "mira-sol");
    auto related = index->getRelated("iron-sea", "nobody");
    EXPECT_TRUE(related.references.empty());
    EXPECT_TRUE(related.referencedBy.empty());
}

TEST_F(RelationshipIndexTest, MalformedFileDoesNotAbortScan) {
    add("npcs", "mira-sol");
    add("factions", "free-traders", {{"affiliations", {"mira-sol"}}});
    std::ofstream(testDir / "iron-sea" / "npcs" / "broken.md") << "---\n{ nope\n---\n";
    
    EXPECT_EQ(index->computeReverseReferences("iron-sea")["mira-sol"].size(), 1u);
}

TEST_F(RelationshipIndexTest, ResolvesIdsSkippingUnknown) {
    add("npcs", "mira-sol");
    add("lore", "prophecy");
    
    auto resolved = index->resolveIds("iron-sea", {"prophecy", "ghost", "mira-sol"});
    ASSERT_EQ(resolved.size(), 2u);
    EXPECT_EQ(resolved[0].id, "prophecy");
    EXPECT_EQ(resolved[1].id, "mira-sol");
}
