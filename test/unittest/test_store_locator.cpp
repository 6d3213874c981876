/**
 * @file test_store_locator.cpp
 * @brief Unit tests for descriptor and editor family discovery
 */

#include "TestScrub.hpp"
#include "CStoreLocator.hpp"

using namespace scrub;
using namespace scrub::test;

class StoreLocatorTest : public ScratchTest {
protected:
    core::String scratchName() const override { return "locator"; }

    StoreLocator locator{ OsClass::kLinux };

    ApplicationDescriptor makeDescriptor(const core::Vector<core::String>& roots) {
        ApplicationDescriptor descriptor;
        descriptor.key          = "editor";
        descriptor.displayName  = "Editor";
        descriptor.linuxRoots   = roots;
        descriptor.windowsRoots = { path("windows-only") };
        descriptor.stores       = {
            { "globalStorage/state.vscdb", StoreFormat::kTabular, false },
            { "globalStorage/storage.json", StoreFormat::kDocument, false }
        };
        descriptor.operations   = ScrubOperation::kPurge | ScrubOperation::kRegenerate;
        return descriptor;
    }

    EditorFamilyDescriptor makeFamily() {
        EditorFamilyDescriptor family;
        family.key                      = "family";
        family.displayName              = "Family";
        family.linuxBases               = { path("config") };
        family.productNames             = { "Code", "Windsurf" };
        family.globalStorageLayouts     = { "User/globalStorage" };
        family.workspaceStorageLayouts  = { "User/workspaceStorage" };
        family.identifierFileLayouts    = { "machineId" };
        family.storeFiles               = {
            { "state.vscdb", StoreFormat::kTabular, false },
            { "storage.json", StoreFormat::kDocument, false }
        };
        family.operations               = ScrubOperation::kPurge | ScrubOperation::kRegenerate;
        return family;
    }
};

TEST_F(StoreLocatorTest, Discover_NothingInstalled) {
    auto stores = locator.Discover({ makeDescriptor({ path("missing/a"), path("missing/b"), "" }) });
    EXPECT_TRUE(stores.empty());

    auto base = locator.ResolveBase(makeDescriptor({ path("missing/a") }));
    ASSERT_FALSE(base.HasValue());
    EXPECT_EQ(base.Error().Value(), static_cast<core::ErrorDomain::CodeType>(ScrubErrc::kNotFound));
}

TEST_F(StoreLocatorTest, Discover_FirstExistingRootWins) {
    makeItemTable(path("second/globalStorage/state.vscdb"), {});
    makeItemTable(path("third/globalStorage/state.vscdb"), {});
    writeText(path("third/globalStorage/storage.json"), "{}");

    auto descriptor = makeDescriptor({ path("first"), path("second"), path("third") });
    auto base = locator.ResolveBase(descriptor);
    ASSERT_TRUE(base.HasValue());
    EXPECT_EQ(base.Value(), path("second"));

    auto stores = locator.Discover({ descriptor });
    ASSERT_EQ(stores.size(), 1u);
    EXPECT_EQ(stores[0].path, path("second/globalStorage/state.vscdb"));
    EXPECT_EQ(stores[0].format, StoreFormat::kTabular);
    EXPECT_EQ(stores[0].appKey, "editor");
    EXPECT_TRUE(stores[0].Supports(ScrubOperation::kPurge));
}

TEST_F(StoreLocatorTest, Discover_UsesRootsOfOsClass) {
    makeItemTable(path("windows-only/globalStorage/state.vscdb"), {});

    auto descriptor = makeDescriptor({});
    EXPECT_TRUE(locator.Discover({ descriptor }).empty());

    StoreLocator windowsLocator(OsClass::kWindows);
    EXPECT_EQ(windowsLocator.Discover({ descriptor }).size(), 1u);
}

TEST_F(StoreLocatorTest, Discover_SkipsDirectoriesWithStoreNames) {
    makeDirs(path("root/globalStorage/state.vscdb"));
    writeText(path("root/globalStorage/storage.json"), "{}");

    auto stores = locator.Discover({ makeDescriptor({ path("root") }) });
    ASSERT_EQ(stores.size(), 1u);
    EXPECT_EQ(stores[0].format, StoreFormat::kDocument);
}

TEST_F(StoreLocatorTest, DiscoverFamily_ScansMatchingInstallations) {
    makeItemTable(path("config/Code/User/globalStorage/state.vscdb"), {});
    writeText(path("config/Code/User/globalStorage/storage.json"), "{}");
    makeItemTable(path("config/Windsurf-Next/User/workspaceStorage/b123/state.vscdb"), {});
    makeItemTable(path("config/Windsurf-Next/User/workspaceStorage/a456/state.vscdb"), {});
    writeText(path("config/Windsurf-Next/machineId"), "id");
    makeItemTable(path("config/Unrelated/User/globalStorage/state.vscdb"), {});

    auto stores = locator.DiscoverFamily(makeFamily());
    ASSERT_EQ(stores.size(), 5u);

    EXPECT_EQ(stores[0].path, path("config/Code/User/globalStorage/state.vscdb"));
    EXPECT_EQ(stores[0].appName, "Code");
    EXPECT_EQ(stores[1].path, path("config/Code/User/globalStorage/storage.json"));
    EXPECT_EQ(stores[2].path, path("config/Windsurf-Next/User/workspaceStorage/a456/state.vscdb"));
    EXPECT_EQ(stores[3].path, path("config/Windsurf-Next/User/workspaceStorage/b123/state.vscdb"));

    EXPECT_EQ(stores[4].path, path("config/Windsurf-Next/machineId"));
    EXPECT_EQ(stores[4].format, StoreFormat::kIdentifierFile);
    EXPECT_TRUE(stores[4].lockAfterRegenerate);
    EXPECT_TRUE(stores[4].Supports(ScrubOperation::kRegenerate));
    EXPECT_FALSE(stores[4].Supports(ScrubOperation::kPurge));
}

TEST_F(StoreLocatorTest, DiscoverFamily_ProductMatchIgnoresCase) {
    makeItemTable(path("config/vscode-oss/User/globalStorage/state.vscdb"), {});

    EXPECT_EQ(locator.DiscoverFamily(makeFamily()).size(), 1u);
}

TEST_F(StoreLocatorTest, DiscoverFamily_MissingBase) {
    EXPECT_TRUE(locator.DiscoverFamily(makeFamily()).empty());
}

TEST_F(StoreLocatorTest, BackupFilesAreNeverDiscovered) {
    writeText(path("config/Code/User/globalStorage/storage.json.backup"), "{}");
    writeText(path("config/Code/machineId.backup"), "id");

    auto family = makeFamily();
    family.storeFiles.push_back({ "storage.json.backup", StoreFormat::kDocument, false });
    family.identifierFileLayouts.push_back("machineId.backup");

    EXPECT_TRUE(locator.DiscoverFamily(family).empty());
}

TEST_F(StoreLocatorTest, EquivalentPathsReportedOnce) {
    makeItemTable(path("config/Code/User/globalStorage/state.vscdb"), {});
    boost::filesystem::create_directory_symlink(path("config/Code"), path("config/Code-link"));

    auto stores = locator.DiscoverFamily(makeFamily());
    ASSERT_EQ(stores.size(), 1u);
    EXPECT_EQ(stores[0].path, path("config/Code/User/globalStorage/state.vscdb"));
}

TEST_F(StoreLocatorTest, SortedChildDirectories) {
    makeDirs(path("list/b"));
    makeDirs(path("list/a"));
    writeText(path("list/c"), "file");

    auto children = StoreLocator::SortedChildDirectories(path("list"));
    EXPECT_EQ(children, (core::Vector<core::String>{ path("list/a"), path("list/b") }));
    EXPECT_TRUE(StoreLocator::SortedChildDirectories(path("missing")).empty());
}
