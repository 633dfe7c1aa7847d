// validate_test.cpp: structural and document-aware validation

#include <json-patch-cpp/json_patch.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace json_patch_cpp;
using json = nlohmann::json;

namespace {

auto kind_of_op(const char* text, const json* document = nullptr,
                const ExtendedOperationRegistry& registry = default_registry()) -> std::optional<ErrorKind> {
    try {
        validate_operation(json::parse(text), 0, document, std::nullopt, registry);
    } catch (const PatchError& e) {
        return e.kind();
    }
    return std::nullopt;
}

}  // namespace

// =============================================================================
// Structural checks
// =============================================================================

TEST(ValidateOperation, accepts_well_formed_operations) {
    EXPECT_FALSE(kind_of_op(R"({"op":"add","path":"/a","value":null})"));
    EXPECT_FALSE(kind_of_op(R"({"op":"remove","path":""})"));
    EXPECT_FALSE(kind_of_op(R"({"op":"copy","from":"/a","path":"/b"})"));
}

TEST(ValidateOperation, shape_errors) {
    EXPECT_EQ(kind_of_op(R"([1])"), ErrorKind::operation_not_an_object);
    EXPECT_EQ(kind_of_op(R"({"op":"frobnicate","path":"/a"})"), ErrorKind::operation_op_invalid);
    EXPECT_EQ(kind_of_op(R"({"op":"add","path":"a","value":1})"), ErrorKind::operation_path_invalid);
    EXPECT_EQ(kind_of_op(R"({"op":"move","path":"/a"})"), ErrorKind::operation_from_required);
    EXPECT_EQ(kind_of_op(R"({"op":"replace","path":"/a"})"), ErrorKind::operation_value_required);
    EXPECT_EQ(kind_of_op(R"({"op":"test","path":"/a"})"), ErrorKind::operation_value_required);
}

TEST(ValidateOperation, value_with_undefined) {
    auto value = json::object();
    value["bad"] = undefined_value();
    auto op = Operation{.op = OpType::add, .path = "/a", .value = value};
    try {
        validate_operation(op, 0);
        FAIL() << "expected OPERATION_VALUE_CANNOT_CONTAIN_UNDEFINED";
    } catch (const PatchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::operation_value_cannot_contain_undefined);
    }

    op.value = undefined_value();
    EXPECT_THROW(validate_operation(op, 0), PatchError);
}

// =============================================================================
// Document-aware checks
// =============================================================================

TEST(ValidateOperation, add_needs_parent) {
    const auto doc = json::parse(R"({"a":{}})");
    EXPECT_FALSE(kind_of_op(R"({"op":"add","path":"/a/b","value":1})", &doc));
    EXPECT_FALSE(kind_of_op(R"({"op":"add","path":"/a","value":1})", &doc));
    EXPECT_EQ(kind_of_op(R"({"op":"add","path":"/a/b/c","value":1})", &doc),
              ErrorKind::operation_path_cannot_add);
}

TEST(ValidateOperation, replace_remove_need_target) {
    const auto doc = json::parse(R"({"a":[1]})");
    EXPECT_FALSE(kind_of_op(R"({"op":"replace","path":"/a/0","value":2})", &doc));
    EXPECT_EQ(kind_of_op(R"({"op":"replace","path":"/a/1","value":2})", &doc),
              ErrorKind::operation_path_unresolvable);
    EXPECT_EQ(kind_of_op(R"({"op":"remove","path":"/b"})", &doc),
              ErrorKind::operation_path_unresolvable);
}

TEST(ValidateOperation, move_copy_need_source) {
    const auto doc = json::parse(R"({"a":1})");
    EXPECT_FALSE(kind_of_op(R"({"op":"copy","from":"/a","path":"/b"})", &doc));
    EXPECT_EQ(kind_of_op(R"({"op":"copy","from":"/nope","path":"/b"})", &doc),
              ErrorKind::operation_from_unresolvable);
    EXPECT_EQ(kind_of_op(R"({"op":"move","from":"/x/y","path":"/b"})", &doc),
              ErrorKind::operation_from_unresolvable);
}

TEST(ValidateOperation, source_must_start_with_slash) {
    const auto doc = json::parse(R"({"a":1})");
    EXPECT_EQ(kind_of_op(R"({"op":"copy","from":"a","path":"/b"})"), ErrorKind::operation_path_invalid);
    EXPECT_EQ(kind_of_op(R"({"op":"move","from":"a","path":"/b"})", &doc), ErrorKind::operation_path_invalid);
    EXPECT_FALSE(kind_of_op(R"({"op":"copy","from":"","path":"/b"})", &doc));
}

// =============================================================================
// Extended operations
// =============================================================================

class ValidateExtended : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = ExtendedOperationConfig{};
        config.arr = [](const Operation&, json&, std::size_t, json&) -> std::optional<ExtendedResult> {
            return std::nullopt;
        };
        config.obj = [](const Operation&, json&, const std::string&, json&) -> std::optional<ExtendedResult> {
            return std::nullopt;
        };
        config.validator = [this](const Operation& op, std::size_t index, const json*,
                                  const std::optional<std::string>& existing) {
            last_existing = existing;
            if (op.args && op.args->size() > 2) {
                throw PatchError{ErrorKind::operation_x_args_not_array, "too many args", index};
            }
        };
        registry.register_operation("x-check", config);
    }

    ExtendedOperationRegistry registry;
    std::optional<std::string> last_existing;
};

TEST_F(ValidateExtended, xid_rules) {
    EXPECT_EQ(kind_of_op(R"({"op":"x","xid":"check","path":"/a"})", nullptr, registry),
              ErrorKind::operation_x_id_invalid);
    EXPECT_EQ(kind_of_op(R"({"op":"x","path":"/a"})", nullptr, registry),
              ErrorKind::operation_x_id_invalid);
    EXPECT_EQ(kind_of_op(R"({"op":"x","xid":"x-other","path":"/a"})", nullptr, registry),
              ErrorKind::operation_x_op_invalid);
    EXPECT_FALSE(kind_of_op(R"({"op":"x","xid":"x-check","path":"/a"})", nullptr, registry));
}

TEST_F(ValidateExtended, path_and_args_rules) {
    EXPECT_EQ(kind_of_op(R"({"op":"x","xid":"x-check","path":"a"})", nullptr, registry),
              ErrorKind::operation_path_invalid);
    EXPECT_EQ(kind_of_op(R"({"op":"x","xid":"x-check","path":"/"})", nullptr, registry),
              ErrorKind::operation_path_unresolvable);
    EXPECT_EQ(kind_of_op(R"({"op":"x","xid":"x-check","path":"/a","args":{}})", nullptr, registry),
              ErrorKind::operation_x_args_not_array);
    EXPECT_EQ(kind_of_op(R"({"op":"x","xid":"x-check","path":"/a","args":[1,2,3]})", nullptr, registry),
              ErrorKind::operation_x_args_not_array);
}

TEST_F(ValidateExtended, registered_validator_sees_existing_path) {
    const auto doc = json::parse(R"({"a":{}})");
    auto sequence = json::parse(R"([{"op":"x","xid":"x-check","path":"/a/b/c","resolve":true}])");
    EXPECT_FALSE(validate_sequence(sequence, &doc, {}, registry).has_value());
    EXPECT_EQ(last_existing, "/a");
}

// =============================================================================
// Sequences
// =============================================================================

TEST(ValidateSequence, replace_on_missing_key_is_returned) {
    const auto doc = json::object();
    auto error = validate_sequence(json::parse(R"([{"op":"replace","path":"/missing","value":1}])"), &doc);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::operation_path_unresolvable);
    EXPECT_EQ(error->index(), 0u);
}

TEST(ValidateSequence, valid_sequence_leaves_document_alone) {
    const auto doc = json::parse(R"({"a":1})");
    auto error = validate_sequence(json::parse(R"([
        {"op":"add","path":"/b","value":2},
        {"op":"test","path":"/b","value":2},
        {"op":"remove","path":"/a"}
    ])"), &doc);
    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(doc, json::parse(R"({"a":1})"));
}

TEST(ValidateSequence, later_operations_see_earlier_effects) {
    const auto doc = json::object();
    auto error = validate_sequence(json::parse(R"([
        {"op":"add","path":"/a","value":{}},
        {"op":"add","path":"/a/b","value":1},
        {"op":"remove","path":"/a/c"}
    ])"), &doc);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::operation_path_unresolvable);
    EXPECT_EQ(error->index(), 2u);
}

TEST(ValidateSequence, failed_test_is_returned) {
    const auto doc = json::parse(R"({"a":1})");
    auto error = validate_sequence(json::parse(R"([{"op":"test","path":"/a","value":2}])"), &doc);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::test_operation_failed);
}

TEST(ValidateSequence, structural_only_without_document) {
    EXPECT_FALSE(validate_sequence(json::parse(R"([{"op":"remove","path":"/anything"}])")).has_value());

    auto error = validate_sequence(json::parse(R"([{"op":"add","path":"/a","value":1},{"op":"add","path":"/b"}])"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::operation_value_required);
    EXPECT_EQ(error->index(), 1u);
}

TEST(ValidateSequence, malformed_source_is_returned) {
    const auto doc = json::parse(R"({"a":1})");
    auto error = validate_sequence(json::parse(R"([{"op":"move","from":"a","path":"/b"}])"), &doc);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::operation_path_invalid);
    EXPECT_EQ(doc, json::parse(R"({"a":1})"));
}

TEST(ValidateSequence, parse_errors_are_returned) {
    auto error = validate_sequence(json::parse(R"({"op":"add"})"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::sequence_not_an_array);

    error = validate_sequence(json::parse(R"([{"op":"add","path":"/a","value":1}, "oops"])"));
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind(), ErrorKind::operation_not_an_object);
    EXPECT_EQ(error->index(), 1u);
}

TEST(ValidateSequence, prototype_error_propagates) {
    const auto doc = json::object();
    EXPECT_THROW(validate_sequence(json::parse(R"([{"op":"add","path":"/__proto__/x","value":1}])"), &doc),
                 PrototypeModificationError);
}

TEST(ValidateSequence, custom_validator_replaces_builtin) {
    auto calls = 0;
    auto validator = OperationValidator{[&](const Operation&, std::size_t, const json*,
                                            const std::optional<std::string>&) { ++calls; }};
    // Missing `value` would fail the built-in validator
    auto error = validate_sequence(json::parse(R"([{"op":"add","path":"/a"}])"), nullptr, validator);
    EXPECT_FALSE(error.has_value());
    EXPECT_EQ(calls, 1);
}
