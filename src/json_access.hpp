#pragma once

// Internal header: not installed.
// Child lookup shared by the resolver, the dispatcher and the reconciler.

#include <json-patch-cpp/pointer.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace json_patch_cpp::detail {

/// The member or element named by `key`, or nullptr if there is none.
/// Arrays only answer to valid in-range indices; scalars have no children.
inline auto find_child(const nlohmann::json& container, std::string_view key)
    -> const nlohmann::json* {
    if (container.is_object()) {
        auto it = container.find(std::string{key});
        if (it == container.end() || it->is_discarded()) return nullptr;
        return &*it;
    }
    if (container.is_array()) {
        auto idx = try_parse_index(key);
        if (!idx || *idx >= container.size()) return nullptr;
        return &container[*idx];
    }
    return nullptr;
}

inline auto find_child(nlohmann::json& container, std::string_view key) -> nlohmann::json* {
    return const_cast<nlohmann::json*>(
        find_child(static_cast<const nlohmann::json&>(container), key));
}

/// Join raw components [0, end) back into a pointer string.
template <typename Components>
auto join_components(const Components& raw, std::size_t end) -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < end && i < raw.size(); ++i) {
        if (i > 0) result += '/';
        result += raw[i];
    }
    return result;
}

}  // namespace json_patch_cpp::detail
