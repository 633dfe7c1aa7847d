// basic_usage: demonstrates the core json-patch-cpp API
//
// Applies an RFC 6902 patch in place and to a copy, reads the per-operation
// results, validates a patch up front and shows how errors are reported.
//
// Build: cmake -B build -DJSON_PATCH_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/basic_usage

#include <json-patch-cpp/json_patch.hpp>

#include <cstdio>
#include <string>

namespace jp = json_patch_cpp;
using json = nlohmann::json;

int main() {
    auto doc = json::parse(R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs"],
        "meta": {"owner": "alice", "version": 1}
    })");

    // -- Apply a patch in place -----------------------------------------------
    auto patch = json::parse(R"([
        {"op": "add",     "path": "/items/-",       "value": "Bread"},
        {"op": "replace", "path": "/meta/version",  "value": 2},
        {"op": "copy",    "from": "/meta/owner",    "path": "/author"},
        {"op": "test",    "path": "/items/0",       "value": "Milk"},
        {"op": "remove",  "path": "/items/1"}
    ])");

    auto results = jp::apply_patch(doc, patch);
    std::printf("patched: %s\n", doc.dump().c_str());
    std::printf("replace removed: %s\n", results[1].removed->dump().c_str());
    std::printf("remove removed:  %s\n", results[4].removed->dump().c_str());

    // -- Apply to a copy: the original stays as it was ------------------------
    auto applied = jp::apply_patch_to_copy(doc, json::parse(R"([
        {"op": "move", "from": "/author", "path": "/meta/editor"}
    ])"));
    std::printf("original: %s\n", doc.dump().c_str());
    std::printf("copy:     %s\n", applied.new_document.dump().c_str());

    // -- Typed operations and pointer helpers ---------------------------------
    auto op = jp::Operation{.op = jp::OpType::add, .path = "/meta/tags", .value = json::array({"food"})};
    jp::apply_operation(doc, op);
    if (auto tags = jp::get_value_by_pointer(doc, "/meta/tags")) {
        std::printf("tags: %s\n", tags->dump().c_str());
    }
    std::printf("escaped key: %s\n", jp::escape_path_component("a/b~c").c_str());

    // -- Validate before applying ---------------------------------------------
    auto bad = json::parse(R"([
        {"op": "add",     "path": "/ok", "value": true},
        {"op": "replace", "path": "/missing", "value": 1}
    ])");
    if (auto error = jp::validate_sequence(bad, &doc)) {
        std::printf("rejected: %s at index %zu\n",
                    std::string{jp::to_string_view(error->kind())}.c_str(),
                    error->index().value_or(0));
    }

    // -- Errors carry their context -------------------------------------------
    try {
        jp::apply_patch(doc, json::parse(R"([{"op": "test", "path": "/title", "value": "Todo"}])"));
    } catch (const jp::PatchError& e) {
        std::printf("error: %s\n", e.what());
    }

    try {
        jp::apply_patch(doc, json::parse(R"([{"op": "add", "path": "/__proto__/x", "value": 1}])"));
    } catch (const jp::PrototypeModificationError& e) {
        std::printf("blocked: %s\n", e.what());
    }

    return 0;
}
