#include <json-patch-cpp/graft.hpp>
#include <json-patch-cpp/error.hpp>

#include <gtest/gtest.h>

using namespace json_patch_cpp;
using json = nlohmann::json;

TEST(ModType, to_string_view) {
    EXPECT_EQ(to_string_view(ModType::graft), "graft");
    EXPECT_EQ(to_string_view(ModType::prune), "prune");
}

TEST(GraftTree, single_component_copies_subtree) {
    auto target = json::parse(R"({"a":1,"b":2})");
    const auto source = json::parse(R"({"a":10,"b":20})");
    graft_tree(source, target, {ModType::graft, {"a"}});
    EXPECT_EQ(target, json::parse(R"({"a":10,"b":2})"));
}

TEST(GraftTree, single_component_prune_erases) {
    auto target = json::parse(R"({"a":1,"b":2})");
    graft_tree(json::object(), target, {ModType::prune, {"a"}});
    EXPECT_EQ(target, json::parse(R"({"b":2})"));

    auto list = json{1, 2, 3};
    graft_tree(json::array(), list, {ModType::prune, {"1"}});
    EXPECT_EQ(list, (json{1, 3}));
}

TEST(GraftTree, grafts_at_first_missing_key) {
    auto target = json::parse(R"({"a":{"keep":true}})");
    const auto source = json::parse(R"({"a":{"keep":true,"b":{"c":1}}})");
    graft_tree(source, target, {ModType::graft, {"a", "b", "c"}});
    EXPECT_EQ(target, source);
}

TEST(GraftTree, replaces_parent_of_leaf) {
    auto target = json::parse(R"({"a":{"b":{"c":1,"d":2}},"z":0})");
    const auto source = json::parse(R"({"a":{"b":{"c":5,"d":2}},"z":99})");
    graft_tree(source, target, {ModType::graft, {"a", "b", "c"}});
    EXPECT_EQ(target["a"], source["a"]);
    EXPECT_EQ(target["z"], 0);
}

TEST(GraftTree, prune_keeps_siblings) {
    auto target = json::parse(R"({"a":{"b":1,"c":2}})");
    const auto source = json::parse(R"({"a":{"c":2}})");
    graft_tree(source, target, {ModType::prune, {"a", "b"}});
    EXPECT_EQ(target, source);
}

TEST(GraftTree, missing_in_both_is_a_no_op) {
    auto target = json::parse(R"({"a":1})");
    graft_tree(json::parse(R"({"a":1})"), target, {ModType::graft, {"x", "y"}});
    EXPECT_EQ(target, json::parse(R"({"a":1})"));
}

TEST(GraftTree, array_requires_index_keys) {
    auto target = json::parse(R"({"list":[1,2]})");
    const auto source = json::parse(R"({"list":[1,2]})");
    EXPECT_THROW(graft_tree(source, target, {ModType::prune, {"list", "name", "x"}}), PatchError);
}
