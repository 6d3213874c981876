/**
 * @file test_tabular_adapter.cpp
 * @brief Unit tests for purging SQLite key/value tables
 */

#include "TestScrub.hpp"
#include "CTabularStoreAdapter.hpp"

using namespace scrub;
using namespace scrub::test;

class TabularAdapterTest : public ScratchTest {
protected:
    core::String scratchName() const override { return "tabular"; }

    TabularStoreAdapter adapter;
    MatchTermSet terms = TermCodec::Decode(TermCodec::DefaultSeeds());
};

TEST_F(TabularAdapterTest, Purge_RemovesMatchingRowsOnly) {
    core::String db = path("state.vscdb");
    makeItemTable(db, { "Augment.vscode-augment", "workbench.view.augmentPanel", "editor.fontSize" });

    auto result = adapter.Purge(makeStore(db, StoreFormat::kTabular), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().status, OutcomeStatus::kSuccess);
    EXPECT_EQ(result.Value().count, 2u);
    EXPECT_EQ(result.Value().operation, ScrubOperation::kPurge);

    EXPECT_EQ(itemTableKeys(db), (core::Vector<core::String>{ "editor.fontSize" }));
}

TEST_F(TabularAdapterTest, Purge_SecondRunIsNoOp) {
    core::String db = path("state.vscdb");
    makeItemTable(db, { "AUGMENT_TOKEN", "editor.fontSize" });

    auto first = adapter.Purge(makeStore(db, StoreFormat::kTabular), terms);
    ASSERT_TRUE(first.HasValue());
    EXPECT_EQ(first.Value().count, 1u);

    auto second = adapter.Purge(makeStore(db, StoreFormat::kTabular), terms);
    ASSERT_TRUE(second.HasValue());
    EXPECT_EQ(second.Value().status, OutcomeStatus::kNoOp);
    EXPECT_EQ(second.Value().count, 0u);
}

TEST_F(TabularAdapterTest, Purge_EmptyTableIsNoOp) {
    core::String db = path("empty.vscdb");
    makeItemTable(db, {});

    auto result = adapter.Purge(makeStore(db, StoreFormat::kTabular), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().status, OutcomeStatus::kNoOp);
}

TEST_F(TabularAdapterTest, Purge_NotADatabase) {
    core::String db = path("garbage.vscdb");
    writeText(db, "this is definitely not an sqlite database file, just some text to fill the header");

    auto result = adapter.Purge(makeStore(db, StoreFormat::kTabular), terms);
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<core::ErrorDomain::CodeType>(ScrubErrc::kParseFailure));
}

TEST_F(TabularAdapterTest, Purge_MissingTable) {
    core::String db = path("other.vscdb");
    sqlite3* handle = nullptr;
    ASSERT_EQ(SQLITE_OK, sqlite3_open(db.c_str(), &handle));
    ASSERT_EQ(SQLITE_OK, sqlite3_exec(handle, "CREATE TABLE Other (key TEXT, value BLOB);", nullptr, nullptr, nullptr));
    sqlite3_close(handle);

    auto result = adapter.Purge(makeStore(db, StoreFormat::kTabular), terms);
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<core::ErrorDomain::CodeType>(ScrubErrc::kParseFailure));
}

TEST_F(TabularAdapterTest, Purge_CustomTableName) {
    core::String db = path("custom.vscdb");
    sqlite3* handle = nullptr;
    ASSERT_EQ(SQLITE_OK, sqlite3_open(db.c_str(), &handle));
    ASSERT_EQ(SQLITE_OK, sqlite3_exec(handle,
        "CREATE TABLE Settings (key TEXT UNIQUE, value BLOB);"
        "INSERT INTO Settings VALUES ('augmentedView', 'x');"
        "INSERT INTO Settings VALUES ('theme', 'dark');", nullptr, nullptr, nullptr));
    sqlite3_close(handle);

    TabularStoreAdapter custom("Settings");
    auto result = custom.Purge(makeStore(db, StoreFormat::kTabular), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().count, 1u);
}

TEST_F(TabularAdapterTest, Regenerate_Unsupported) {
    core::String db = path("state.vscdb");
    makeItemTable(db, { "telemetry.machineId" });

    EXPECT_FALSE(adapter.Applies(ScrubOperation::kRegenerate));
    auto result = adapter.Regenerate(makeStore(db, StoreFormat::kTabular), {});
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().status, OutcomeStatus::kUnsupported);
    EXPECT_EQ(itemTableKeys(db).size(), 1u);
}
