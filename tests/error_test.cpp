#include <json-patch-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace json_patch_cpp;
using json = nlohmann::json;

TEST(ErrorKind, to_string_view_uses_wire_names) {
    EXPECT_EQ(to_string_view(ErrorKind::sequence_not_an_array),        "SEQUENCE_NOT_AN_ARRAY");
    EXPECT_EQ(to_string_view(ErrorKind::operation_not_an_object),      "OPERATION_NOT_AN_OBJECT");
    EXPECT_EQ(to_string_view(ErrorKind::operation_x_ambiguous_removal), "OPERATION_X_AMBIGUOUS_REMOVAL");
    EXPECT_EQ(to_string_view(ErrorKind::operation_path_unresolvable),  "OPERATION_PATH_UNRESOLVABLE");
    EXPECT_EQ(to_string_view(ErrorKind::operation_value_out_of_bounds), "OPERATION_VALUE_OUT_OF_BOUNDS");
    EXPECT_EQ(to_string_view(ErrorKind::test_operation_failed),        "TEST_OPERATION_FAILED");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::operation_path_invalid, "bad path"};
    const auto e2 = Error{ErrorKind::operation_path_invalid, "bad path"};
    const auto e3 = Error{ErrorKind::operation_from_required, "bad path"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(PatchError, carries_kind_and_short_message) {
    const auto e = PatchError{ErrorKind::test_operation_failed, "Test operation failed"};

    EXPECT_EQ(e.kind(), ErrorKind::test_operation_failed);
    EXPECT_EQ(e.message(), "Test operation failed");
    EXPECT_FALSE(e.index().has_value());
    EXPECT_TRUE(e.operation().is_null());
    EXPECT_TRUE(e.document().is_null());
    EXPECT_EQ(e.error(), (Error{ErrorKind::test_operation_failed, "Test operation failed"}));
}

TEST(PatchError, what_appends_context_lines) {
    const auto op = json{{"op", "test"}, {"path", "/a"}, {"value", 2}};
    const auto doc = json{{"a", 1}};
    const auto e = PatchError{ErrorKind::test_operation_failed, "Test operation failed", 3, op, doc};

    const auto what = std::string{e.what()};
    EXPECT_EQ(what.rfind("Test operation failed\n", 0), 0u);
    EXPECT_NE(what.find("name: TEST_OPERATION_FAILED"), std::string::npos);
    EXPECT_NE(what.find("index: 3"), std::string::npos);
    EXPECT_NE(what.find("operation: "), std::string::npos);
    EXPECT_NE(what.find("tree: "), std::string::npos);
    EXPECT_EQ(e.index(), 3u);
    EXPECT_EQ(e.operation(), op);
    EXPECT_EQ(e.document(), doc);
}

TEST(PatchError, omits_missing_context) {
    const auto e = PatchError{ErrorKind::sequence_not_an_array, "Patch sequence must be an array"};
    const auto what = std::string{e.what()};
    EXPECT_EQ(what.find("index:"), std::string::npos);
    EXPECT_EQ(what.find("tree:"), std::string::npos);
}

TEST(PrototypeModificationError, is_not_a_patch_error) {
    try {
        throw PrototypeModificationError{};
    } catch (const PatchError&) {
        FAIL() << "caught as PatchError";
    } catch (const std::invalid_argument& e) {
        EXPECT_EQ(std::string{e.what()}, std::string{prototype_error_message});
    }
}
