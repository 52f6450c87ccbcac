#include "gtest/gtest.h"
#include "schema.hpp"

class SchemaTest : public ::testing::Test {
protected:
  static vschema::schema_ptr decode(const std::string &text)
  {
    auto node = vschema::schema::from_json(nlohmann::json::parse(text));
    EXPECT_TRUE(node.has_value());
    return node.value_or(nullptr);
  }
};

TEST_F(SchemaTest, TestEqualsIsReflexiveAndSymmetric)
{
  auto a = decode(R"({"type": "object", "properties": {"port": {"type": "integer", "minimum": 1}}, "anyOf": [{"type": "string"}]})");
  auto b = decode(R"({"type": "object", "properties": {"port": {"type": "integer", "minimum": 1}}, "anyOf": [{"type": "string"}]})");

  EXPECT_TRUE(vschema::equals(a, a));
  EXPECT_TRUE(vschema::equals(a, b));
  EXPECT_TRUE(vschema::equals(b, a));
}

TEST_F(SchemaTest, TestEqualsIgnoresTitleAndDescription)
{
  auto a = decode(R"({"type": "string", "title": "first", "description": "one"})");
  auto b = decode(R"({"type": "string", "title": "second", "description": "two"})");

  EXPECT_TRUE(vschema::equals(a, b));
  EXPECT_TRUE(vschema::equals(b, a));
}

TEST_F(SchemaTest, TestEqualsDetectsDifferences)
{
  EXPECT_FALSE(vschema::equals(decode(R"({"type": "integer", "minimum": 1})"), decode(R"({"type": "integer", "minimum": 2})")));
  EXPECT_FALSE(vschema::equals(decode(R"({"type": "integer", "minimum": 1})"), decode(R"({"type": "integer"})")));
  EXPECT_FALSE(vschema::equals(decode(R"({"type": ["string", "null"]})"), decode(R"({"type": ["null", "string"]})")));
  EXPECT_FALSE(vschema::equals(decode(R"({"enum": [1, 2]})"), decode(R"({"enum": [1, 3]})")));
  EXPECT_FALSE(vschema::equals(decode(R"({"default": {"a": 1}})"), decode(R"({"default": {"a": 2}})")));
  EXPECT_FALSE(vschema::equals(decode(R"({"properties": {"a": {}}})"), decode(R"({"properties": {"b": {}}})")));
  EXPECT_FALSE(vschema::equals(decode(R"({"anyOf": [{}]})"), decode(R"({"anyOf": [{}, {}]})")));
}

TEST_F(SchemaTest, TestEqualsWithNull)
{
  vschema::schema_ptr empty;
  EXPECT_TRUE(vschema::equals(empty, empty));
  EXPECT_FALSE(vschema::equals(empty, vschema::schema::make("string")));
  EXPECT_FALSE(vschema::equals(vschema::schema::make("string"), empty));
}

TEST_F(SchemaTest, TestFixRequiredPropertiesIsIdempotent)
{
  auto root = decode(R"({
    "properties": {
      "name": {"type": "string", "required": true},
      "optional": {"type": "string"},
      "nested": {"properties": {"inner": {"required": true}}}
    }
  })");

  vschema::fix_required_properties(*root);
  const auto first_root   = root->required.names;
  const auto first_nested = root->properties["nested"]->required.names;

  vschema::fix_required_properties(*root);
  EXPECT_EQ(root->required.names, first_root);
  EXPECT_EQ(root->properties["nested"]->required.names, first_nested);

  EXPECT_EQ(root->required.names, std::vector<std::string>{ "name" });
  EXPECT_EQ(first_nested, std::vector<std::string>{ "inner" });
}

TEST_F(SchemaTest, TestFixRequiredPropertiesForcesObjectType)
{
  auto root = decode(R"({
    "type": "string",
    "items": {"properties": {"a": {"required": true}}},
    "definitions": {"Def": {"properties": {"b": {}}}},
    "additionalProperties": {"properties": {"c": {"required": true}}}
  })");

  vschema::fix_required_properties(*root);

  EXPECT_TRUE(root->items->type.matches("object"));
  EXPECT_EQ(root->items->required.names, std::vector<std::string>{ "a" });
  EXPECT_TRUE(root->definitions["Def"]->type.matches("object"));
  auto additional = std::get<vschema::schema_ptr>(root->additional_properties);
  EXPECT_EQ(additional->required.names, std::vector<std::string>{ "c" });
  EXPECT_EQ(root->type, vschema::type_list{ "string" });
}

TEST_F(SchemaTest, TestDisableRequiredProperties)
{
  auto root = decode(R"({
    "required": ["a"],
    "properties": {"a": {"required": ["b"], "properties": {"b": {}}}},
    "items": {"required": ["c"]},
    "anyOf": [{"required": ["d"]}],
    "definitions": {"Def": {"required": ["e"]}}
  })");

  vschema::disable_required_properties(*root);

  EXPECT_TRUE(root->required.names.empty());
  EXPECT_TRUE(root->properties["a"]->required.names.empty());
  EXPECT_TRUE(root->items->required.names.empty());
  EXPECT_TRUE(root->any_of[0]->required.names.empty());
  EXPECT_TRUE(root->definitions["Def"]->required.names.empty());
}

TEST_F(SchemaTest, TestSerialization)
{
  auto node          = vschema::schema::make("string");
  node->title        = "name";
  node->default_value = "nginx";
  node->custom_annotations["x-order"] = 3;
  node->set();

  const auto output = node->to_json();
  EXPECT_EQ(output["type"], "string");
  EXPECT_EQ(output["title"], "name");
  EXPECT_EQ(output["default"], "nginx");
  EXPECT_EQ(output["x-order"], 3);
  EXPECT_EQ(output["required"], nlohmann::json::array());
  EXPECT_FALSE(output.contains("hasData"));
  EXPECT_FALSE(output.contains("description"));
  EXPECT_FALSE(output.contains("additionalProperties"));

  node->type                  = { "string", "null" };
  node->additional_properties = false;
  const auto second           = node->to_json();
  EXPECT_EQ(second["type"], nlohmann::json::array({ "string", "null" }));
  EXPECT_EQ(second["additionalProperties"], false);
}

TEST_F(SchemaTest, TestDecodeKeepsCustomAnnotations)
{
  auto node = decode(R"({"type": "string", "x-ui": {"widget": "text"}, "unknownKeyword": 1})");

  ASSERT_EQ(node->custom_annotations.size(), 1);
  EXPECT_EQ(node->custom_annotations["x-ui"]["widget"], "text");
  EXPECT_FALSE(node->to_json().contains("unknownKeyword"));
}

TEST_F(SchemaTest, TestDecodeForms)
{
  auto node = decode(R"({"type": ["string", null], "required": true, "additionalProperties": {"type": "integer"}, "minimum": 2.0})");

  EXPECT_EQ(node->type, (vschema::type_list{ "string", "null" }));
  EXPECT_TRUE(node->required.flag);
  ASSERT_TRUE(std::holds_alternative<vschema::schema_ptr>(node->additional_properties));
  EXPECT_EQ(std::get<vschema::schema_ptr>(node->additional_properties)->type, vschema::type_list{ "integer" });
  EXPECT_EQ(node->minimum.value_or(0), 2);
}

TEST_F(SchemaTest, TestDecodeErrors)
{
  auto bad_minimum = vschema::schema::from_json(nlohmann::json::parse(R"({"minimum": "one"})"));
  ASSERT_FALSE(bad_minimum.has_value());
  EXPECT_EQ(bad_minimum.error().type, vschema::schema_error::kind::invalid_annotation);

  auto bad_required = vschema::schema::from_json(nlohmann::json::parse(R"({"required": "yes"})"));
  ASSERT_FALSE(bad_required.has_value());

  auto bad_child = vschema::schema::from_json(nlohmann::json::parse(R"({"properties": {"a": 1}})"));
  ASSERT_FALSE(bad_child.has_value());

  auto not_a_map = vschema::schema::from_json(nlohmann::json::parse(R"([1, 2])"));
  ASSERT_FALSE(not_a_map.has_value());
}

TEST_F(SchemaTest, TestCloneIsDeep)
{
  auto original = decode(R"({"properties": {"a": {"type": "string"}}, "items": {"type": "integer"}})");
  auto copy     = original->clone();

  copy->properties["a"]->type = { "boolean" };
  copy->items->minimum        = 4;

  EXPECT_EQ(original->properties["a"]->type, vschema::type_list{ "string" });
  EXPECT_FALSE(original->items->minimum.has_value());
}

TEST_F(SchemaTest, TestTypeList)
{
  vschema::type_list valid{ "string", "null" };
  EXPECT_FALSE(valid.validate().has_value());
  EXPECT_TRUE(valid.matches("null"));
  EXPECT_FALSE(valid.is_empty());
  EXPECT_EQ(valid.to_string(), "[string null]");

  vschema::type_list invalid{ "strnig" };
  ASSERT_TRUE(invalid.validate().has_value());
  EXPECT_EQ(invalid.validate().value(), "unsupported type [strnig]");

  EXPECT_TRUE(vschema::type_list{}.is_empty());
}
