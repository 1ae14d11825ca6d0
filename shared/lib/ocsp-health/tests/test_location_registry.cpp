/**
 * @file test_location_registry.cpp
 * @brief Unit tests for LocationRegistry
 */

#include <gtest/gtest.h>
#include <ocspdash/health/location_registry.h>

using namespace ocspdash::health;

namespace {

Location makeLocation(const std::string& id, const std::string& name, const std::string& address = "local") {
    Location l;
    l.id = id;
    l.name = name;
    l.address = address;
    return l;
}

} // anonymous namespace

TEST(LocationRegistryTest, UpsertFindRemove) {
    LocationRegistry registry;
    registry.upsert(makeLocation("eu", "Frankfurt", "https://eu.agents.test"));

    auto found = registry.find("eu");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "Frankfurt");
    EXPECT_FALSE(found->isLocal());

    EXPECT_TRUE(registry.remove("eu"));
    EXPECT_FALSE(registry.remove("eu"));
    EXPECT_FALSE(registry.find("eu").has_value());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(LocationRegistryTest, UpsertReplacesById) {
    LocationRegistry registry;
    registry.upsert(makeLocation("eu", "Frankfurt"));
    registry.upsert(makeLocation("eu", "Amsterdam"));

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("eu")->name, "Amsterdam");
}

TEST(LocationRegistryTest, ListSortedByName) {
    LocationRegistry registry;
    registry.upsert(makeLocation("us", "Virginia"));
    registry.upsert(makeLocation("local", "Local"));
    registry.upsert(makeLocation("eu", "Frankfurt"));

    auto list = registry.list();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].name, "Frankfurt");
    EXPECT_EQ(list[1].name, "Local");
    EXPECT_EQ(list[2].name, "Virginia");
}

TEST(LocationRegistryTest, EmptyIdOrNameRejected) {
    LocationRegistry registry;
    EXPECT_THROW(registry.upsert(makeLocation("", "Nameless")), std::invalid_argument);
    EXPECT_THROW(registry.upsert(makeLocation("x", "")), std::invalid_argument);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(LocationRegistryTest, LocalAddressForms) {
    EXPECT_TRUE(makeLocation("a", "A", "local").isLocal());
    EXPECT_TRUE(makeLocation("a", "A", "").isLocal());
    EXPECT_FALSE(makeLocation("a", "A", "https://agent.test").isLocal());
}
