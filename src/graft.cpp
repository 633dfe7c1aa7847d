#include <json-patch-cpp/graft.hpp>
#include <json-patch-cpp/error.hpp>
#include <json-patch-cpp/pointer.hpp>

#include "json_access.hpp"

namespace json_patch_cpp {

namespace {

// Write `value` at `key`; a null `value` stands for undefined, which drops
// an object member and nulls an array element (as serialization would).
void assign_child(nlohmann::json& container, const std::string& key,
                  const nlohmann::json* value) {
    if (container.is_array()) {
        auto idx = try_parse_index(key);
        if (!idx) {
            throw PatchError{ErrorKind::operation_path_illegal_array_index,
                             "Cannot graft onto an array at a non-index key", std::nullopt, key};
        }
        if (!value) {
            if (*idx < container.size()) container[*idx] = nullptr;
            return;
        }
        container[*idx] = *value;
        return;
    }
    if (container.is_object()) {
        if (!value) {
            container.erase(key);
            return;
        }
        container[key] = *value;
        return;
    }
    throw PatchError{ErrorKind::operation_path_unresolvable,
                     "Cannot graft onto a scalar value", std::nullopt, key};
}

void erase_child(nlohmann::json& container, const std::string& key) {
    if (container.is_array()) {
        auto idx = try_parse_index(key);
        if (idx && *idx < container.size()) {
            container.erase(*idx);
        }
    } else if (container.is_object()) {
        container.erase(key);
    }
}

}  // anonymous namespace

void graft_tree(const nlohmann::json& source, nlohmann::json& target,
                const PathComponents& path) {
    const auto& components = path.components;
    if (components.empty()) return;

    // A top-level prune is a best guess that exactly this key was removed;
    // the handler's other changes are not visible here.
    if (components.size() == 1) {
        const auto& key = components.front();
        if (path.mod_type == ModType::graft) {
            assign_child(target, key, detail::find_child(source, key));
        } else {
            erase_child(target, key);
        }
        return;
    }

    auto* graft_target = &target;
    const auto* graft = &source;
    auto graft_key = std::string{};

    for (std::size_t i = 0; i < components.size(); ++i) {
        graft_key = components[i];
        graft = graft ? detail::find_child(*graft, graft_key) : nullptr;

        // Nothing in the target at this key: this is the graft point
        if (path.mod_type == ModType::graft && !detail::find_child(*graft_target, graft_key)) {
            if (!graft) return;
            break;
        }

        // Stop at the parent of the leaf
        if (i == components.size() - 2) break;

        graft_target = detail::find_child(*graft_target, graft_key);
        if (!graft_target) return;
    }

    assign_child(*graft_target, graft_key, graft);
}

}  // namespace json_patch_cpp
