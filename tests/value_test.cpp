#include <json-patch-cpp/value.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace json_patch_cpp;
using json = nlohmann::json;

// =============================================================================
// deep_equal
// =============================================================================

TEST(DeepEqual, scalars) {
    EXPECT_TRUE(deep_equal(json(1), json(1)));
    EXPECT_TRUE(deep_equal(json("a"), json("a")));
    EXPECT_TRUE(deep_equal(json(nullptr), json(nullptr)));
    EXPECT_FALSE(deep_equal(json(1), json("1")));
    EXPECT_FALSE(deep_equal(json(true), json(1)));
}

TEST(DeepEqual, integers_and_floats_compare_numerically) {
    EXPECT_TRUE(deep_equal(json(1), json(1.0)));
}

TEST(DeepEqual, nan_equals_nan) {
    const auto nan = json(std::numeric_limits<double>::quiet_NaN());
    EXPECT_TRUE(deep_equal(nan, nan));
    EXPECT_FALSE(deep_equal(nan, json(0.0)));
}

TEST(DeepEqual, arrays_are_ordered) {
    EXPECT_TRUE(deep_equal(json{1, 2, 3}, json{1, 2, 3}));
    EXPECT_FALSE(deep_equal(json{1, 2, 3}, json{3, 2, 1}));
    EXPECT_FALSE(deep_equal(json{1, 2}, json{1, 2, 3}));
}

TEST(DeepEqual, objects_ignore_key_order) {
    auto a = json::parse(R"({"x":1,"y":{"z":[1,2]}})");
    auto b = json::parse(R"({"y":{"z":[1,2]},"x":1})");
    EXPECT_TRUE(deep_equal(a, b));
    b["y"]["z"][1] = 3;
    EXPECT_FALSE(deep_equal(a, b));
}

TEST(DeepEqual, structured_never_equals_scalar) {
    EXPECT_FALSE(deep_equal(json::array(), json(nullptr)));
    EXPECT_FALSE(deep_equal(json::object(), json::array()));
}

TEST(DeepEqual, undefined_equals_only_undefined) {
    EXPECT_TRUE(deep_equal(undefined_value(), undefined_value()));
    EXPECT_FALSE(deep_equal(undefined_value(), json(nullptr)));
}

// =============================================================================
// deep_clone / has_undefined
// =============================================================================

TEST(DeepClone, copy_is_independent) {
    auto original = json::parse(R"({"a":{"b":[1,2]}})");
    auto copy = deep_clone(original);
    copy["a"]["b"].push_back(3);
    EXPECT_EQ(original["a"]["b"].size(), 2u);
}

TEST(DeepClone, normalises_undefined) {
    auto value = json::object();
    value["keep"] = 1;
    value["drop"] = undefined_value();
    value["list"] = json::array({1, undefined_value()});

    auto copy = deep_clone(value);
    EXPECT_FALSE(copy.contains("drop"));
    EXPECT_EQ(copy["list"], (json{1, nullptr}));
    EXPECT_TRUE(deep_clone(undefined_value()).is_null());
}

TEST(HasUndefined, finds_nested_undefined) {
    auto value = json::parse(R"({"a":[1,{"b":2}]})");
    EXPECT_FALSE(has_undefined(value));
    value["a"][1]["c"] = undefined_value();
    EXPECT_TRUE(has_undefined(value));
    EXPECT_TRUE(has_undefined(undefined_value()));
}
