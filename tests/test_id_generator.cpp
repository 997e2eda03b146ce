/**
 * Campaign Keeper - Id Generator Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <set>

#include "content/IdGenerator.hpp"

using namespace keeper;

TEST(IdGeneratorTest, SlugifiesNames) {
    EXPECT_EQ(slugify("Captain Vex"), "captain-vex");
    EXPECT_EQ(slugify("The Iron Keep!"), "the-iron-keep");
    EXPECT_EQ(slugify("  Multiple   Spaces  "), "multiple-spaces");
    EXPECT_EQ(slugify("snake_case-and-dashes"), "snake-case-and-dashes");
    EXPECT_EQ(slugify("O'Brien's Rest"), "obriens-rest");
    EXPECT_EQ(slugify("!!!"), "");
}

TEST(IdGeneratorTest, GeneratesIdsFromUrlSafeAlphabet) {
    const std::string alphabet =
        "useandom-26T198340PX75pxJACKVERYMINDBUSHWOLF_GQZbfghjklqvwyzrict";
    
    auto id = generateId();
    EXPECT_EQ(id.size(), 12u);
    for (char c : id) {
        EXPECT_NE(alphabet.find(c), std::string::npos) << "unexpected character " << c;
    }
    EXPECT_EQ(generateId(6).size(), 6u);
}

TEST(IdGeneratorTest, EntityIdsCombineSlugAndSuffix) {
    auto id = generateEntityId("Captain Vex");
    ASSERT_EQ(id.size(), std::string("captain-vex-").size() + 6);
    EXPECT_EQ(id.rfind("captain-vex-", 0), 0u);
}

TEST(IdGeneratorTest, EntityIdsForUnsluggableNames) {
    auto id = generateEntityId("???");
    EXPECT_EQ(id.rfind("entity-", 0), 0u);
    EXPECT_NE(id[0], '_');
}

TEST(IdGeneratorTest, EntityIdsAreDistinct) {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        ids.insert(generateEntityId("Same Name"));
    }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(IdGeneratorTest, RejectsPathLikeIds) {
    EXPECT_TRUE(isValidEntityId("captain-vex"));
    EXPECT_TRUE(isValidEntityId("_map-config"));
    EXPECT_FALSE(isValidEntityId(""));
    EXPECT_FALSE(isValidEntityId("."));
    EXPECT_FALSE(isValidEntityId(".."));
    EXPECT_FALSE(isValidEntityId("../escape"));
    EXPECT_FALSE(isValidEntityId("a\\b"));
}
