#include <gtest/gtest.h>
#include "tools/builtin_tools.hpp"

#include <memory>

using namespace toolserver;

namespace {

MetadataObject MakeObject(const std::string& category, const std::string& name, const std::string& synonym = {}) {
    MetadataObject o;
    o.category = category;
    o.name = name;
    o.synonym = synonym;
    return o;
}

}  // namespace

class BuiltinToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Project trade;
        trade.name = "Trade";
        trade.path = "/ws/Trade";
        trade.description = "Trade configuration";
        auto products = MakeObject("Catalog", "Products", "Goods | wares");
        products.attributes.push_back({"Sku", "String"});
        products.tabular_sections.push_back("Barcodes");
        products.forms.push_back("ItemForm");
        products.properties.emplace_back("Hierarchical", "true");
        trade.objects.push_back(products);
        trade.objects.push_back(MakeObject("Catalog", "Customers"));
        trade.objects.push_back(MakeObject("Catalog", "Warehouses"));
        trade.objects.push_back(MakeObject("Document", "Invoice", "Sales invoice"));
        trade.objects.push_back(MakeObject("Enum", "Colors"));
        std::string err;
        ASSERT_TRUE(workspace.AddProject(trade, &err)) << err;

        Project archive;
        archive.name = "Archive";
        archive.open = false;
        ASSERT_TRUE(workspace.AddProject(archive, &err)) << err;
    }

    ParamMap Params(std::initializer_list<std::pair<const char*, ParamValue>> values) {
        ParamMap m;
        for (const auto& [k, v] : values) m.Set(k, v);
        return m;
    }

    Workspace workspace;
    FormatterRegistry formatters = BuildDefaultFormatters();
};

TEST_F(BuiltinToolsTest, ListProjectsOnEmptyWorkspace) {
    Workspace empty;
    ListProjectsTool tool(&empty);
    EXPECT_EQ(tool.Execute(ParamMap{}), "[]");
    EXPECT_EQ(tool.ResultType(), ContentType::Json);
}

TEST_F(BuiltinToolsTest, ListProjects) {
    ListProjectsTool tool(&workspace);
    auto j = nlohmann::json::parse(tool.Execute(ParamMap{}));
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["name"], "Trade");
    EXPECT_EQ(j[0]["open"], true);
    EXPECT_EQ(j[0]["description"], "Trade configuration");
    EXPECT_EQ(j[1]["name"], "Archive");
    EXPECT_EQ(j[1]["open"], false);
}

TEST_F(BuiltinToolsTest, ListMetadataObjectsAppliesFilterAndLimit) {
    ListMetadataObjectsTool tool(&workspace, ToolLimits{100, 2});
    auto md = tool.Execute(Params({{"projectName", std::string("Trade")}, {"metadataType", std::string("catalogs")},
                                   {"limit", int64_t{50}}}));
    EXPECT_NE(md.find("# Metadata objects: Trade"), std::string::npos);
    EXPECT_NE(md.find("| Catalog.Products | Goods \\| wares |"), std::string::npos);
    EXPECT_NE(md.find("Catalog.Customers"), std::string::npos);
    EXPECT_EQ(md.find("Catalog.Warehouses"), std::string::npos);
    EXPECT_EQ(md.find("Document.Invoice"), std::string::npos);
    EXPECT_NE(md.find("Showing 2 of 3 objects."), std::string::npos);
}

TEST_F(BuiltinToolsTest, ListMetadataObjectsNoMatch) {
    ListMetadataObjectsTool tool(&workspace, ToolLimits{});
    auto md = tool.Execute(Params({{"projectName", std::string("Trade")}, {"metadataType", std::string("Report")}}));
    EXPECT_NE(md.find("No metadata objects found"), std::string::npos);
}

TEST_F(BuiltinToolsTest, LimitClamp) {
    ToolLimits limits{100, 1000};
    EXPECT_EQ(limits.Clamp(0), 100);
    EXPECT_EQ(limits.Clamp(-5), 100);
    EXPECT_EQ(limits.Clamp(10), 10);
    EXPECT_EQ(limits.Clamp(5000), 1000);
}

TEST_F(BuiltinToolsTest, UnknownAndClosedProjectsThrow) {
    ListMetadataObjectsTool tool(&workspace, ToolLimits{});
    try {
        tool.Execute(Params({{"projectName", std::string("Nope")}}));
        FAIL() << "expected ToolError";
    } catch (const ToolError& e) {
        EXPECT_STREQ(e.what(), "project not found: Nope");
    }
    EXPECT_THROW(tool.Execute(Params({{"projectName", std::string("Archive")}})), ToolError);
}

TEST_F(BuiltinToolsTest, MetadataDetails) {
    GetMetadataDetailsTool tool(&workspace, &formatters);
    auto basic = tool.Execute(Params({{"projectName", std::string("Trade")},
                                      {"objectFqn", std::string("Catalog.Products")},
                                      {"full", false}}));
    EXPECT_EQ(basic.rfind("# Catalog.Products", 0), 0u);
    EXPECT_NE(basic.find("| Synonym | Goods \\| wares |"), std::string::npos);
    EXPECT_NE(basic.find("Sku"), std::string::npos);
    EXPECT_EQ(basic.find("ItemForm"), std::string::npos);

    auto full = tool.Execute(Params({{"projectName", std::string("Trade")},
                                     {"objectFqn", std::string("Catalog.Products")},
                                     {"full", true}}));
    EXPECT_NE(full.find("ItemForm"), std::string::npos);
    EXPECT_NE(full.find("| Hierarchical | true |"), std::string::npos);
}

TEST_F(BuiltinToolsTest, MetadataDetailsErrors) {
    GetMetadataDetailsTool tool(&workspace, &formatters);
    EXPECT_THROW(tool.Execute(Params({{"projectName", std::string("Trade")}, {"objectFqn", std::string("Products")}})),
                 ToolError);
    EXPECT_THROW(
        tool.Execute(Params({{"projectName", std::string("Trade")}, {"objectFqn", std::string("Catalog.Missing")}})),
        ToolError);
}

TEST_F(BuiltinToolsTest, FormatterFallbackForUnregisteredCategory) {
    const auto& enum_formatter = formatters.Select("Enum");
    const auto& generic = formatters.Select("SomethingElse");
    EXPECT_EQ(&enum_formatter, &generic);
    EXPECT_EQ(generic.Category(), "");
    EXPECT_EQ(formatters.Select("Catalog").Category(), "Catalog");
    EXPECT_EQ(formatters.Select("Document").Category(), "Document");

    auto md = formatters.Format(MakeObject("Enum", "Colors"), false);
    EXPECT_EQ(md.rfind("# Enum.Colors", 0), 0u);
}

TEST_F(BuiltinToolsTest, RevalidateBumpsRevision) {
    RevalidateProjectTool tool(&workspace);
    auto first = nlohmann::json::parse(tool.Execute(Params({{"projectName", std::string("Trade")}})));
    auto second = nlohmann::json::parse(tool.Execute(Params({{"projectName", std::string("Trade")}})));
    EXPECT_EQ(first["revision"], 1);
    EXPECT_EQ(second["revision"], 2);
    EXPECT_EQ(workspace.FindProject("Trade")->revision, 2);
}

TEST_F(BuiltinToolsTest, RegisterBuiltinTools) {
    ToolRegistry registry;
    ServerConfig cfg;
    std::string err;
    ASSERT_TRUE(RegisterBuiltinTools(&registry, &workspace, &formatters, cfg, &err)) << err;
    auto list = registry.List();
    ASSERT_EQ(list.size(), 5u);
    EXPECT_EQ(list[0].name, "get_server_version");
    EXPECT_EQ(list[1].name, "list_projects");
    EXPECT_EQ(list[2].name, "list_metadata_objects");
    EXPECT_EQ(list[3].name, "get_metadata_details");
    EXPECT_EQ(list[4].name, "revalidate_project");
    EXPECT_TRUE(registry.Descriptor("get_metadata_details")->input_schema.IsRequired("objectFqn"));

    EXPECT_FALSE(RegisterBuiltinTools(&registry, &workspace, &formatters, cfg, &err));
}

TEST_F(BuiltinToolsTest, ServerVersion) {
    GetServerVersionTool tool;
    auto md = tool.Execute(ParamMap{});
    EXPECT_NE(md.find(kServerVersion), std::string::npos);
    EXPECT_NE(md.find(kProtocolVersion), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
