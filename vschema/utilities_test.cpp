#include "gtest/gtest.h"
#include "utilities.hpp"
#include <fstream>

TEST(UtilitiesTest, TestIsUrl)
{
  EXPECT_TRUE(vschema::is_url("https://example.com/a.json"));
  EXPECT_TRUE(vschema::is_url("http://example.com"));
  EXPECT_FALSE(vschema::is_url("ftp://example.com"));
  EXPECT_FALSE(vschema::is_url("./schemas/a.json"));
}

TEST(UtilitiesTest, TestSplitReference)
{
  EXPECT_EQ(vschema::split_reference("a.json#/definitions/Foo"), std::make_pair(std::string{ "a.json" }, std::string{ "/definitions/Foo" }));
  EXPECT_EQ(vschema::split_reference("#/definitions/Foo"), std::make_pair(std::string{}, std::string{ "/definitions/Foo" }));
  EXPECT_EQ(vschema::split_reference("a.json"), std::make_pair(std::string{ "a.json" }, std::string{}));
}

TEST(UtilitiesTest, TestDefinitionNames)
{
  EXPECT_EQ(vschema::generate_definition_name("https://example.com/a-b.json"), "example_com_a_b_json");
  EXPECT_EQ(vschema::generate_definition_name("http://10.0.0.1:8080/x"), "def_10_0_0_1_8080_x");
  EXPECT_EQ(vschema::fragment_definition_name("/definitions/io.k8s.api.core.v1.Pod"), "io.k8s.api.core.v1.Pod");
  EXPECT_EQ(vschema::fragment_definition_name("/properties/spec/"), "properties_spec");
}

TEST(UtilitiesTest, TestJsonPointerLookup)
{
  const auto document = nlohmann::json::parse(R"({"a": {"b": [1, 2]}})");
  EXPECT_EQ(vschema::json_pointer_lookup(document, "/a/b/1").value(), 2);
  EXPECT_FALSE(vschema::json_pointer_lookup(document, "/a/c").has_value());
  EXPECT_FALSE(vschema::json_pointer_lookup(document, "a").has_value());
}

TEST(UtilitiesTest, TestIsRelativeFile)
{
  const auto directory = fs::temp_directory_path() / "vschema_utilities_test";
  fs::create_directories(directory);
  std::ofstream(directory / "schema.json") << "{}";
  const auto values = (directory / "values.yaml").generic_string();

  auto found = vschema::is_relative_file(values, "schema.json");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found.value(), (directory / "schema.json").lexically_normal());

  EXPECT_FALSE(vschema::is_relative_file(values, "").has_value());
  EXPECT_FALSE(vschema::is_relative_file(values, "missing.json").has_value());
  EXPECT_FALSE(vschema::is_relative_file(values, (directory / "schema.json").string()).has_value());

  std::error_code ec;
  fs::remove_all(directory, ec);
}

TEST(UtilitiesTest, TestTrim)
{
  EXPECT_EQ(vschema::trim("  a b \n"), "a b");
  EXPECT_EQ(vschema::trim("   "), "");
}
