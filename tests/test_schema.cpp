#include <gtest/gtest.h>
#include "schema.hpp"

using namespace toolserver;

class SchemaTest : public ::testing::Test {
protected:
    SchemaNode sample = SchemaBuilder::Object()
                            .Description("sample")
                            .StringProperty("projectName", "Project name", true)
                            .StringProperty("metadataType", "Type filter")
                            .IntegerProperty("limit", "Max results", false, 100)
                            .BooleanProperty("full", "Full output", false, false)
                            .Build();
};

TEST_F(SchemaTest, BuilderKeepsDeclarationOrder) {
    ASSERT_EQ(sample.properties.size(), 4u);
    EXPECT_EQ(sample.properties[0].name, "projectName");
    EXPECT_EQ(sample.properties[1].name, "metadataType");
    EXPECT_EQ(sample.properties[2].name, "limit");
    EXPECT_EQ(sample.properties[3].name, "full");
    EXPECT_TRUE(sample.IsRequired("projectName"));
    EXPECT_FALSE(sample.IsRequired("limit"));
}

TEST_F(SchemaTest, FindProperty) {
    const auto* limit = sample.FindProperty("limit");
    ASSERT_NE(limit, nullptr);
    EXPECT_EQ(limit->type, SchemaType::Integer);
    ASSERT_TRUE(limit->default_value.has_value());
    EXPECT_EQ(limit->default_value->get<int64_t>(), 100);
    EXPECT_EQ(sample.FindProperty("missing"), nullptr);
}

TEST_F(SchemaTest, ToJsonShape) {
    auto j = SchemaToJson(sample);
    EXPECT_EQ(j["type"], "object");
    EXPECT_EQ(j["description"], "sample");
    EXPECT_EQ(j["properties"]["projectName"]["type"], "string");
    EXPECT_EQ(j["properties"]["limit"]["default"], 100);
    EXPECT_EQ(j["properties"]["full"]["default"], false);
    EXPECT_FALSE(j["properties"]["metadataType"].contains("default"));
    ASSERT_TRUE(j["required"].is_array());
    EXPECT_EQ(j["required"].size(), 1u);
    EXPECT_EQ(j["required"][0], "projectName");

    std::vector<std::string> keys;
    for (const auto& item : j["properties"].items()) keys.push_back(item.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"projectName", "metadataType", "limit", "full"}));
}

TEST_F(SchemaTest, EmptyObjectSchemaHasEmptyPropertiesAndRequired) {
    auto j = SchemaToJson(SchemaBuilder::Object().Build());
    EXPECT_TRUE(j["properties"].is_object());
    EXPECT_TRUE(j["properties"].empty());
    EXPECT_TRUE(j["required"].is_array());
    EXPECT_TRUE(j["required"].empty());
}

TEST_F(SchemaTest, ValidSchemaPasses) {
    std::string err;
    EXPECT_TRUE(ValidateSchema(sample, &err)) << err;
}

TEST_F(SchemaTest, RequiredMustBeDeclared) {
    auto s = SchemaBuilder::Object().StringProperty("a", "a").Required("b").Build();
    std::string err;
    EXPECT_FALSE(ValidateSchema(s, &err));
    EXPECT_NE(err.find("b"), std::string::npos);
}

TEST_F(SchemaTest, DuplicatePropertyRejected) {
    auto s = SchemaBuilder::Object().StringProperty("a", "a").IntegerProperty("a", "again").Build();
    std::string err;
    EXPECT_FALSE(ValidateSchema(s, &err));
    EXPECT_NE(err.find("duplicate"), std::string::npos);
}

TEST_F(SchemaTest, DefaultTypeMismatchRejected) {
    SchemaNode s = SchemaBuilder::Object().IntegerProperty("limit", "limit").Build();
    s.properties[0].node.default_value = nlohmann::json("ten");
    std::string err;
    EXPECT_FALSE(ValidateSchema(s, &err));
    EXPECT_NE(err.find("limit"), std::string::npos);
}

TEST_F(SchemaTest, RequiredIsNotDuplicated) {
    auto s = SchemaBuilder::Object().StringProperty("a", "a", true).Required("a").Build();
    EXPECT_EQ(s.required.size(), 1u);
}

TEST_F(SchemaTest, NestedObjectPropertyRejected) {
    SchemaNode s = SchemaBuilder::Object().StringProperty("name", "name").Build();
    SchemaNode opts;
    opts.type = SchemaType::Object;
    s.properties.push_back(SchemaProperty{"opts", opts});
    std::string err;
    EXPECT_FALSE(ValidateSchema(s, &err));
    EXPECT_NE(err.find("opts"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
