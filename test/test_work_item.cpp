#include <geotagger/metadata/metadata_store.hpp>
#include <geotagger/types/work_item.hpp>

#include <gtest/gtest.h>

using namespace geotagger;

TEST(work_item, starts_clean)
{
    WorkItem item("a.jpg", {{"Exif.Image.Make", std::string("Olympus")}});

    EXPECT_EQ(item.identity(), "a.jpg");
    EXPECT_TRUE(item.contains("Exif.Image.Make"));
    EXPECT_FALSE(item.isDirty());
    EXPECT_FALSE(item.position.has_value());
}

TEST(work_item, typed_access)
{
    // GIVEN: an item with one tag of each shape
    WorkItem item("a.jpg", {{"text", std::string("hello")},
                            {"integer", int64_t(42)},
                            {"rationals", RationalList{{1, 2}, {3, 4}}},
                            {"time", fromUnixSeconds(10)}});

    // THEN: each should be readable as its own shape
    EXPECT_EQ(item.getAs<std::string>("text"), "hello");
    EXPECT_EQ(item.getAs<int64_t>("integer"), 42);
    EXPECT_DOUBLE_EQ(item.getAs<RationalList>("rationals")[1].toDouble(), 0.75);
    EXPECT_EQ(item.getAs<Timestamp>("time"), fromUnixSeconds(10));

    // AND: reading the wrong shape or a missing tag should throw
    EXPECT_THROW(item.getAs<int64_t>("text"), std::runtime_error);
    EXPECT_THROW(item.get("missing"), std::runtime_error);
}

TEST(work_item, set_and_erase_mark_dirty)
{
    WorkItem item("a.jpg");

    // WHEN: erasing a tag that isn't there
    item.erase("missing");

    // THEN: nothing changed
    EXPECT_FALSE(item.isDirty());

    // WHEN: a tag is set
    item.set("text", std::string("x"));

    // THEN: the item is dirty until cleaned
    EXPECT_TRUE(item.isDirty());
    item.markClean();
    EXPECT_FALSE(item.isDirty());

    item.erase("text");
    EXPECT_TRUE(item.isDirty());
    EXPECT_FALSE(item.contains("text"));
}

TEST(work_item, describes_values)
{
    EXPECT_EQ(describe(MetadataValue(std::string("abc"))), "text \"abc\"");
    EXPECT_EQ(describe(MetadataValue(int64_t(7))), "integer 7");
    EXPECT_EQ(describe(MetadataValue(RationalList{{1, 2}, {30, 1}})), "rationals [1/2 30/1]");
    EXPECT_EQ(describe(MetadataValue(fromUnixSeconds(0))), "timestamp 1970-01-01T00:00:00Z");
}

TEST(metadata_store, commits_only_dirty_items)
{
    // GIVEN: a store holding one photo
    InMemoryMetadataStore store;
    store.put("a.jpg", {{"text", std::string("before")}});

    auto tags = store.read("a.jpg");
    ASSERT_TRUE(tags.has_value());
    WorkItem item("a.jpg", *tags);

    // WHEN: committing an unmodified item
    EXPECT_TRUE(store.commit(item));

    // THEN: nothing is written
    EXPECT_EQ(store.writeCount(), 0u);

    // WHEN: the item is modified and committed
    item.set("text", std::string("after"));
    EXPECT_TRUE(store.commit(item));

    // THEN: the store has the new value and the item is clean
    EXPECT_EQ(store.writeCount(), 1u);
    EXPECT_FALSE(item.isDirty());
    EXPECT_EQ(std::get<std::string>(store.read("a.jpg")->at("text")), "after");
}

TEST(metadata_store, unknown_identity_is_unreadable)
{
    InMemoryMetadataStore store;
    EXPECT_FALSE(store.read("nothing.jpg").has_value());
}
