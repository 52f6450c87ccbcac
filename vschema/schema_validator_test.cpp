#include "gtest/gtest.h"
#include "schema_validator.hpp"

class SchemaValidatorTest : public ::testing::Test {
protected:
  static std::string validation_error(const std::string &text)
  {
    auto node = vschema::schema::from_json(nlohmann::json::parse(text));
    EXPECT_TRUE(node.has_value());
    if (!node)
      return "decode failed";
    auto valid = vschema::validate(*node.value());
    return valid ? "" : valid.error().message;
  }
};

TEST_F(SchemaValidatorTest, TestValidSchemas)
{
  EXPECT_EQ(validation_error(R"({"type": "string", "format": "uri", "minLength": 1, "maxLength": 10})"), "");
  EXPECT_EQ(validation_error(R"({"type": ["integer", "null"], "minimum": 0, "maximum": 5, "multipleOf": 1})"), "");
  EXPECT_EQ(validation_error(R"({"type": "array", "items": {"type": "string"}, "minItems": 1, "maxItems": 1})"), "");
  EXPECT_EQ(validation_error(R"({"enum": ["a", "b"]})"), "");
  EXPECT_EQ(validation_error(R"({"$ref": "#/definitions/Foo"})"), "");
  EXPECT_EQ(validation_error(R"({"type": "object", "patternProperties": {"^x-": {"type": "string"}}, "x-custom": 1})"), "");
}

TEST_F(SchemaValidatorTest, TestSyntaxErrors)
{
  EXPECT_EQ(validation_error(R"({"type": "strnig"})").find("invalid schema syntax"), 0);
  EXPECT_EQ(validation_error(R"({"type": "string", "pattern": "(["})").find("invalid schema syntax"), 0);
  EXPECT_NE(validation_error(R"({"type": "integer", "multipleOf": 0})"), "");
}

TEST_F(SchemaValidatorTest, TestConstAndEnumWithType)
{
  EXPECT_EQ(validation_error(R"({"type": "string", "const": "a"})"), "cannot use both 'const' and 'type' in the same schema");
  EXPECT_EQ(validation_error(R"({"type": "string", "enum": ["a"]})"), "cannot use both 'enum' and 'type' in the same schema");
  EXPECT_EQ(validation_error(R"({"type": "string", "enum": []})"), "cannot use both 'enum' and 'type' in the same schema");
}

TEST_F(SchemaValidatorTest, TestNumericConstraints)
{
  EXPECT_EQ(validation_error(R"({"type": "string", "minimum": 1})"), "numeric constraints can only be used with number or integer types, got [string]");
  EXPECT_EQ(validation_error(R"({"type": "integer", "minimum": 1, "exclusiveMinimum": 0})"), "cannot use both minimum and exclusiveMinimum");
  EXPECT_EQ(validation_error(R"({"type": "number", "maximum": 1, "exclusiveMaximum": 2})"), "cannot use both maximum and exclusiveMaximum");
  EXPECT_EQ(validation_error(R"({"minimum": 1})"), "");
}

TEST_F(SchemaValidatorTest, TestStringConstraints)
{
  EXPECT_EQ(validation_error(R"({"type": "integer", "format": "date"})"), "format can only be used with string type, got [integer]");
  EXPECT_EQ(validation_error(R"({"type": "string", "format": "color"})"), "unsupported format: color");
  EXPECT_EQ(validation_error(R"({"type": "boolean", "pattern": "^a$"})"), "pattern can only be used with string type, got [boolean]");
  EXPECT_EQ(validation_error(R"({"type": "string", "format": "email", "pattern": "^a"})"), "cannot use both format and pattern in the same schema");
  EXPECT_EQ(validation_error(R"({"type": "string", "minLength": 5, "maxLength": 2})"), "minLength (5) cannot be greater than maxLength (2)");
}

TEST_F(SchemaValidatorTest, TestArrayConstraints)
{
  EXPECT_EQ(validation_error(R"({"type": "string", "items": {"type": "string"}})"), "items can only be used with array type, got [string]");
  EXPECT_EQ(validation_error(R"({"type": "array", "items": {"type": "string", "const": "a"}})"), "invalid items schema: cannot use both 'const' and 'type' in the same schema");
  EXPECT_EQ(validation_error(R"({"type": "object", "minItems": 1})"), "minItems/maxItems can only be used with array type, got [object]");
  EXPECT_EQ(validation_error(R"({"type": "array", "minItems": 2, "maxItems": 1})"), "maxItems (1) cannot be less than minItems (2)");
}

TEST_F(SchemaValidatorTest, TestNestedSchemas)
{
  EXPECT_EQ(validation_error(R"({"anyOf": [{"type": "string"}, {"type": "string", "const": "a"}]})"), "cannot use both 'const' and 'type' in the same schema");
  EXPECT_EQ(validation_error(R"({"if": {"type": "string"}, "then": {"type": "string", "minLength": 3, "maxLength": 1}})"), "minLength (3) cannot be greater than maxLength (1)");
  EXPECT_EQ(validation_error(R"({"definitions": {"Bad": {"type": "string", "minimum": 1}}})"), "numeric constraints can only be used with number or integer types, got [string]");
}

TEST_F(SchemaValidatorTest, TestSupportedFormats)
{
  EXPECT_TRUE(vschema::is_supported_format("date-time"));
  EXPECT_TRUE(vschema::is_supported_format("relative-json-pointer"));
  EXPECT_TRUE(vschema::is_supported_format("regex"));
  EXPECT_FALSE(vschema::is_supported_format("color"));
}

TEST_F(SchemaValidatorTest, TestSyntaxCheckerSharedInstance)
{
  auto &first  = vschema::schema_syntax_checker::get();
  auto &second = vschema::schema_syntax_checker::get();
  EXPECT_EQ(&first, &second);
  EXPECT_FALSE(first.check(nlohmann::json::parse(R"({"type": "string"})")).has_value());
  EXPECT_TRUE(first.check(nlohmann::json::parse(R"({"minLength": -1})")).has_value());
}
