#include <gtest/gtest.h>
#include "schema.hpp"

using namespace zenbot;

namespace {

nlohmann::json reminder_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"task", {{"type", "string"}, {"minLength", 1}}},
            {"notes", {{"type", nlohmann::json::array({"string", "null"})}}},
            {"confidence", {{"type", "string"}, {"enum", nlohmann::json::array({"high", "medium", "low"})}}},
            {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}}}
        }},
        {"required", nlohmann::json::array({"task"})}
    };
}

} // namespace

TEST(SchemaTest, ConformingValuePasses) {
    auto errors = validate_schema(reminder_schema(), {
        {"task", "water"}, {"notes", nullptr}, {"confidence", "high"},
        {"tags", nlohmann::json::array({"a", "b"})}, {"unknown", 1}
    });
    EXPECT_TRUE(errors.empty());
}

TEST(SchemaTest, MissingRequiredField) {
    auto errors = validate_schema(reminder_schema(), nlohmann::json::object());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "task: field required");
}

TEST(SchemaTest, TypeMismatchAndMinLength) {
    EXPECT_EQ(validate_schema(reminder_schema(), {{"task", 3}}).size(), 1u);
    EXPECT_EQ(validate_schema(reminder_schema(), {{"task", ""}}).size(), 1u);
    EXPECT_EQ(validate_schema(reminder_schema(), {{"task", "x"}, {"notes", 5}}).size(), 1u);
}

TEST(SchemaTest, EnumAndItems) {
    EXPECT_EQ(validate_schema(reminder_schema(), {{"task", "x"}, {"confidence", "certain"}}).size(), 1u);
    auto errors = validate_schema(reminder_schema(), {{"task", "x"}, {"tags", nlohmann::json::array({"a", 2})}});
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("tags[1]"), std::string::npos);
}

TEST(SchemaTest, RootMustBeObject) {
    auto errors = validate_schema(reminder_schema(), nlohmann::json::array());
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "value: expected object");
}

TEST(SchemaTest, NormalizeFillsObjectRoot) {
    auto p = normalize_parameters_schema(nullptr);
    EXPECT_EQ(p["type"], "object");
    EXPECT_TRUE(p["properties"].is_object());
}
