/**
 * @file test_tree_adapter.cpp
 * @brief Unit tests for purging XML option trees
 */

#include "TestScrub.hpp"
#include "CTreeStoreAdapter.hpp"

using namespace scrub;
using namespace scrub::test;

class TreeAdapterTest : public ScratchTest {
protected:
    core::String scratchName() const override { return "tree"; }

    TreeStoreAdapter adapter;
    MatchTermSet terms = TermCodec::Decode(TermCodec::DefaultSeeds());
};

TEST_F(TreeAdapterTest, Purge_TextAndAttributeMatches) {
    core::String file = path("other.xml");
    writeText(file,
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<application>\n"
        "  <!-- keep me -->\n"
        "  <component name=\"PropertiesComponent\">\n"
        "    <property name=\"augment.enabled\" value=\"true\"/>\n"
        "    <property name=\"editor.font\" value=\"Mono\"/>\n"
        "  </component>\n"
        "  <component name=\"Plugins\">\n"
        "    <option name=\"last\">Augment</option>\n"
        "  </component>\n"
        "</application>\n");

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().status, OutcomeStatus::kSuccess);
    EXPECT_EQ(result.Value().count, 2u);

    core::String text = readText(file);
    EXPECT_EQ(text.find("augment.enabled"), core::String::npos);
    EXPECT_EQ(text.find(">Augment<"), core::String::npos);
    EXPECT_NE(text.find("editor.font"), core::String::npos);
    EXPECT_NE(text.find("keep me"), core::String::npos);
    EXPECT_NE(text.find("<?xml"), core::String::npos);
}

TEST_F(TreeAdapterTest, Purge_NestedMatchesCountedOnce) {
    core::String file = path("other.xml");
    writeText(file,
        "<application>\n"
        "  <component name=\"AugmentSettings\">\n"
        "    <option name=\"token\" value=\"augmentToken\"/>\n"
        "    <option name=\"user\">AUGMENT_USER</option>\n"
        "  </component>\n"
        "  <component name=\"Editor\"/>\n"
        "</application>\n");

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().count, 1u);

    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_file(file.c_str()));
    EXPECT_FALSE(doc.select_node("//component[@name='AugmentSettings']"));
    EXPECT_TRUE(doc.select_node("//component[@name='Editor']"));
}

TEST_F(TreeAdapterTest, Purge_RecentProjectsAndFiles) {
    core::String file = path("recentProjects.xml");
    writeText(file,
        "<application>\n"
        "  <component name=\"RecentProjectsManager\">\n"
        "    <RecentProjectMetaInfo>\n"
        "      <entry>\n"
        "        <option name=\"projectPath\" value=\"/home/dev/augment-demo\"/>\n"
        "        <option name=\"opened\" value=\"true\"/>\n"
        "      </entry>\n"
        "      <entry>\n"
        "        <option name=\"projectPath\" value=\"/home/dev/shop\"/>\n"
        "      </entry>\n"
        "    </RecentProjectMetaInfo>\n"
        "  </component>\n"
        "  <RecentFiles>\n"
        "    <option value=\"/home/dev/Augmented.kt\"/>\n"
        "    <option value=\"/home/dev/Main.kt\"/>\n"
        "  </RecentFiles>\n"
        "</application>\n");

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().status, OutcomeStatus::kSuccess);
    EXPECT_EQ(result.Value().count, 2u);

    core::String text = readText(file);
    EXPECT_EQ(text.find("augment-demo"), core::String::npos);
    EXPECT_EQ(text.find("opened"), core::String::npos);
    EXPECT_EQ(text.find("Augmented.kt"), core::String::npos);
    EXPECT_NE(text.find("/home/dev/shop"), core::String::npos);
    EXPECT_NE(text.find("Main.kt"), core::String::npos);
}

TEST_F(TreeAdapterTest, Purge_NestedRecentFilesRemovedOnce) {
    core::String file = path("recentFiles.xml");
    writeText(file,
        "<application>\n"
        "  <RecentFiles>\n"
        "    <option value=\"/x/augment\">\n"
        "      <option value=\"/x/augment/a.kt\"/>\n"
        "    </option>\n"
        "    <option value=\"/x/Main.kt\"/>\n"
        "  </RecentFiles>\n"
        "</application>\n");

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().status, OutcomeStatus::kSuccess);
    EXPECT_EQ(result.Value().count, 1u);

    core::String text = readText(file);
    EXPECT_EQ(text.find("/x/augment"), core::String::npos);
    EXPECT_NE(text.find("/x/Main.kt"), core::String::npos);
}

TEST_F(TreeAdapterTest, Purge_NestedProjectEntriesRemovedOnce) {
    core::String file = path("recentProjects.xml");
    writeText(file,
        "<application>\n"
        "  <component name=\"RecentProjectsManager\">\n"
        "    <RecentProjectMetaInfo>\n"
        "      <entry>\n"
        "        <option name=\"projectPath\" value=\"/x/augment-a\"/>\n"
        "        <entry>\n"
        "          <option name=\"projectPath\" value=\"/x/augment-a/sub\"/>\n"
        "        </entry>\n"
        "      </entry>\n"
        "      <entry>\n"
        "        <option name=\"projectPath\" value=\"/x/shop\"/>\n"
        "      </entry>\n"
        "    </RecentProjectMetaInfo>\n"
        "  </component>\n"
        "</application>\n");

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().count, 1u);

    core::String text = readText(file);
    EXPECT_EQ(text.find("augment-a"), core::String::npos);
    EXPECT_NE(text.find("/x/shop"), core::String::npos);
}

TEST_F(TreeAdapterTest, Purge_NestedListsRemovedOnce) {
    core::String file = path("recentProjects.xml");
    writeText(file,
        "<application>\n"
        "  <RecentProjectMetaInfo>\n"
        "    <RecentProjectMetaInfo>\n"
        "      <option name=\"projectPath\" value=\"/x/augment-b\"/>\n"
        "    </RecentProjectMetaInfo>\n"
        "  </RecentProjectMetaInfo>\n"
        "  <RecentFiles>\n"
        "    <RecentFiles>\n"
        "      <option value=\"/x/augment.kt\"/>\n"
        "    </RecentFiles>\n"
        "  </RecentFiles>\n"
        "</application>\n");

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().count, 2u);

    core::String text = readText(file);
    EXPECT_EQ(text.find("augment-b"), core::String::npos);
    EXPECT_EQ(text.find("augment.kt"), core::String::npos);
}

TEST_F(TreeAdapterTest, Purge_SecondRunIsNoOp) {
    core::String file = path("recentProjects.xml");
    writeText(file,
        "<application>\n"
        "  <component name=\"RecentProjectsManager\">\n"
        "    <RecentProjectMetaInfo>\n"
        "      <entry>\n"
        "        <option name=\"projectPath\" value=\"/home/dev/augment-demo\"/>\n"
        "      </entry>\n"
        "      <entry>\n"
        "        <option name=\"projectPath\" value=\"/home/dev/shop\"/>\n"
        "      </entry>\n"
        "    </RecentProjectMetaInfo>\n"
        "  </component>\n"
        "  <RecentFiles>\n"
        "    <option value=\"/home/dev/Augmented.kt\"/>\n"
        "    <option value=\"/home/dev/Main.kt\"/>\n"
        "  </RecentFiles>\n"
        "  <component name=\"PropertiesComponent\">\n"
        "    <property name=\"augment.token\" value=\"x\"/>\n"
        "  </component>\n"
        "</application>\n");

    auto first = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(first.HasValue());
    EXPECT_EQ(first.Value().status, OutcomeStatus::kSuccess);
    EXPECT_EQ(first.Value().count, 3u);
    const core::String afterFirst = readText(file);

    auto second = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(second.HasValue());
    EXPECT_EQ(second.Value().status, OutcomeStatus::kNoOp);
    EXPECT_EQ(second.Value().count, 0u);
    EXPECT_EQ(readText(file), afterFirst);
}

TEST_F(TreeAdapterTest, Purge_KeepsDoctypeAndProcessingInstructions) {
    core::String file = path("other.xml");
    writeText(file,
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<?xml-stylesheet type=\"text/xsl\" href=\"style.xsl\"?>\n"
        "<!DOCTYPE application>\n"
        "<application>\n"
        "  <property name=\"augment.token\" value=\"x\"/>\n"
        "  <property name=\"theme\" value=\"dark\"/>\n"
        "</application>\n");

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().count, 1u);

    core::String text = readText(file);
    EXPECT_NE(text.find("<?xml-stylesheet"), core::String::npos);
    EXPECT_NE(text.find("<!DOCTYPE application>"), core::String::npos);
    EXPECT_EQ(text.find("augment.token"), core::String::npos);
    EXPECT_NE(text.find("theme"), core::String::npos);
}

TEST_F(TreeAdapterTest, Purge_NoMatchLeavesFileUntouched) {
    core::String file = path("ide.general.xml");
    const core::String original =
        "<application>\n"
        "  <component name=\"GeneralSettings\">\n"
        "    <option name=\"confirmExit\" value=\"false\"/>\n"
        "  </component>\n"
        "</application>\n";
    writeText(file, original);

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().status, OutcomeStatus::kNoOp);
    EXPECT_EQ(readText(file), original);
}

TEST_F(TreeAdapterTest, Purge_MalformedDocument) {
    core::String file = path("other.xml");
    writeText(file, "<application><component name=\"x\"></application>");

    auto result = adapter.Purge(makeStore(file, StoreFormat::kTree), terms);
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<core::ErrorDomain::CodeType>(ScrubErrc::kParseFailure));
}

TEST_F(TreeAdapterTest, Regenerate_Unsupported) {
    core::String file = path("other.xml");
    writeText(file, "<application/>");

    EXPECT_FALSE(adapter.Applies(ScrubOperation::kRegenerate));
    auto result = adapter.Regenerate(makeStore(file, StoreFormat::kTree), {});
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().status, OutcomeStatus::kUnsupported);
}
