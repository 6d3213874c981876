/**
 * @file test_application_catalog.cpp
 * @brief Unit tests for the built-in application tables
 */

#include <gtest/gtest.h>
#include <algorithm>
#include "CApplicationCatalog.hpp"

using namespace scrub;

class ApplicationCatalogTest : public ::testing::Test {
protected:
    PlatformEnvironment env;

    void SetUp() override {
        env.os              = OsClass::kLinux;
        env.home            = "/home/dev";
        env.appData         = "C:/Users/dev/AppData/Roaming";
        env.localAppData    = "C:/Users/dev/AppData/Local";
    }

    static bool hasField(const FieldPlan& plan, const core::String& field, IdentifierKind kind) {
        return std::any_of(plan.begin(), plan.end(),
                           [&](const FieldRule& r) { return r.field == field && r.kind == kind; });
    }
};

TEST_F(ApplicationCatalogTest, VsCodeDescriptor) {
    ApplicationCatalog catalog(env);

    const ApplicationDescriptor* vscode = catalog.Find("vscode");
    ASSERT_NE(vscode, nullptr);
    ASSERT_EQ(vscode->linuxRoots.size(), 1u);
    EXPECT_EQ(vscode->linuxRoots[0], "/home/dev/.config/Code/User");
    EXPECT_EQ(vscode->macosRoots[0], "/home/dev/Library/Application Support/Code/User");
    EXPECT_EQ(vscode->windowsRoots[0], "C:/Users/dev/AppData/Roaming/Code/User");
    ASSERT_EQ(vscode->stores.size(), 2u);
    EXPECT_EQ(vscode->stores[0].format, StoreFormat::kTabular);
    EXPECT_EQ(vscode->stores[1].format, StoreFormat::kDocument);
    EXPECT_TRUE(vscode->Supports(ScrubOperation::kPurge));
    EXPECT_TRUE(vscode->Supports(ScrubOperation::kRegenerate));
}

TEST_F(ApplicationCatalogTest, JetBrainsDescriptors) {
    ApplicationCatalog catalog(env);

    const ApplicationDescriptor* intellij = catalog.Find("intellij");
    ASSERT_NE(intellij, nullptr);
    ASSERT_EQ(intellij->linuxRoots.size(), 3u);
    EXPECT_EQ(intellij->linuxRoots[0], "/home/dev/.config/JetBrains/IntelliJIdea2024.3");
    EXPECT_EQ(intellij->stores[0].format, StoreFormat::kTree);
    EXPECT_TRUE(intellij->Supports(ScrubOperation::kPurge));
    EXPECT_FALSE(intellij->Supports(ScrubOperation::kRegenerate));

    const ApplicationDescriptor* ids = catalog.Find("jetbrains-ids");
    ASSERT_NE(ids, nullptr);
    ASSERT_EQ(ids->stores.size(), 2u);
    EXPECT_EQ(ids->stores[0].relativePath, "PermanentDeviceId");
    EXPECT_EQ(ids->stores[1].relativePath, "PermanentUserId");
    EXPECT_TRUE(ids->stores[0].lockAfterRegenerate);
    EXPECT_EQ(ids->stores[0].format, StoreFormat::kIdentifierFile);
}

TEST_F(ApplicationCatalogTest, UnsetEnvironmentYieldsEmptyRoots) {
    env.appData.clear();
    ApplicationCatalog catalog(env);

    const ApplicationDescriptor* vscode = catalog.Find("vscode");
    ASSERT_NE(vscode, nullptr);
    EXPECT_TRUE(vscode->windowsRoots[0].empty());
}

TEST_F(ApplicationCatalogTest, FindAndSelect) {
    ApplicationCatalog catalog(env);

    EXPECT_EQ(catalog.Find("no-such-app"), nullptr);
    EXPECT_EQ(catalog.Select({}).size(), catalog.GetDescriptors().size());

    auto selected = catalog.Select({ "pycharm", "cursor", "unknown" });
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].key, "cursor");
    EXPECT_EQ(selected[1].key, "pycharm");
}

TEST_F(ApplicationCatalogTest, EditorFamily) {
    ApplicationCatalog catalog(env);
    const EditorFamilyDescriptor& family = catalog.GetEditorFamily();

    EXPECT_EQ(family.BasesFor(OsClass::kLinux).front(), "/home/dev/.config");
    EXPECT_NE(std::find(family.productNames.begin(), family.productNames.end(), "Windsurf"), family.productNames.end());
    EXPECT_EQ(family.identifierFileLayouts, (core::Vector<core::String>{ "machineId", "data/machineId" }));
    EXPECT_EQ(family.storeFiles.size(), 2u);
}

TEST_F(ApplicationCatalogTest, FieldPlans) {
    ApplicationCatalog catalog(env);

    const FieldPlan& fields = catalog.GetFieldPlan();
    EXPECT_TRUE(hasField(fields, "machineId", IdentifierKind::kHex));
    EXPECT_TRUE(hasField(fields, "devDeviceId", IdentifierKind::kUuid));
    EXPECT_TRUE(hasField(fields, "telemetry.machineId", IdentifierKind::kHash));
    EXPECT_TRUE(hasField(fields, "telemetry.devDeviceId", IdentifierKind::kUuid));
    EXPECT_TRUE(hasField(fields, "telemetry.macMachineId", IdentifierKind::kHash));

    const FieldPlan& files = catalog.GetFilePlan();
    EXPECT_TRUE(hasField(files, "PermanentDeviceId", IdentifierKind::kUuid));
    EXPECT_TRUE(hasField(files, "PermanentUserId", IdentifierKind::kUuid));
    EXPECT_TRUE(hasField(files, "machineId", IdentifierKind::kUuid));
}
