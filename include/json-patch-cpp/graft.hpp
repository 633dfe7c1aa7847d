/// @file graft.hpp
/// @brief Splicing an extended operation's result back into a live document.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace json_patch_cpp {

/// Whether a reconciliation attaches or detaches a subtree.
enum class ModType : std::uint8_t {
    graft,  ///< Copy the source subtree into the target.
    prune,  ///< Remove the key from the target.
};

constexpr auto to_string_view(ModType type) noexcept -> std::string_view {
    switch (type) {
        case ModType::graft: return "graft";
        case ModType::prune: return "prune";
    }
    return "unknown";
}

/// A reconciliation request: what to do, and the unescaped path to do it at.
struct PathComponents {
    ModType mod_type{ModType::graft};
    std::vector<std::string> components;
};

/// Merge `source` into `target` at the given path, modifying `target` in place.
///
/// `source` is a whole document (the result of an extended operation that
/// ran against a clone of `target`). With a single component, a graft copies
/// `source[key]` to `target[key]` and a prune removes `target[key]` (array
/// elements are erased, shifting later ones). With more components the two
/// trees are walked in lock-step until either the target lacks the current
/// key (the graft point; nothing happens if the source lacks it too) or the
/// parent of the last component is reached, and that one key of the target
/// is overwritten with the source subtree.
///
/// Only the named key is reconciled: a handler that changes other parts of
/// its working document will not see those changes reach `target`.
void graft_tree(const nlohmann::json& source, nlohmann::json& target,
                const PathComponents& path);

}  // namespace json_patch_cpp
