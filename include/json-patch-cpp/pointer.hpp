/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) helpers and the pointer resolver.

#pragma once

#include <json-patch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace json_patch_cpp {

// -- Components ---------------------------------------------------------------

/// Escape a single component: `~` -> `~0`, `/` -> `~1`.
auto escape_path_component(std::string_view component) -> std::string;

/// Unescape a single component: `~1` -> `/`, `~0` -> `~`.
auto unescape_path_component(std::string_view component) -> std::string;

/// Split a pointer on `/` without unescaping.
///
/// The result keeps the leading empty component, so "/a/b" yields
/// ["", "a", "b"] and "" yields [""].
auto split_pointer(std::string_view pointer) -> std::vector<std::string>;

/// Parse a pointer into unescaped components.
/// "" = root (no components), "/" = one empty component.
auto parse_pointer(std::string_view pointer) -> std::vector<std::string>;

/// Try to parse a component as an array index.
///
/// Only non-empty base-10 digit strings qualify, and "0" is the only one
/// allowed to start with a zero.
auto try_parse_index(std::string_view component) -> std::optional<std::size_t>;

/// Check whether a component may be used to reach an object prototype.
/// @param component The unescaped component.
/// @param previous The raw component preceding it ("" for the first).
auto is_prototype_key(std::string_view component, std::string_view previous) -> bool;

// -- Resolution ---------------------------------------------------------------

/// Find the value at a pointer without copying it.
/// @return A pointer into `document`, or nullptr when the path does not resolve.
/// @throws PrototypeModificationError if a component is a prototype key and
///   `ban_prototype_modifications` is set.
auto find_by_pointer(const nlohmann::json& document, std::string_view pointer,
                     bool ban_prototype_modifications = true) -> const nlohmann::json*;

/// Mutable overload of find_by_pointer().
auto find_by_pointer(nlohmann::json& document, std::string_view pointer,
                     bool ban_prototype_modifications = true) -> nlohmann::json*;

/// Get a copy of the value at a pointer.
///
/// The empty pointer returns the document itself. Any component that does
/// not resolve (missing key, index out of range, scalar or null parent)
/// yields nullopt; use apply_operation() with OpType::get and validation
/// enabled to get an OPERATION_PATH_UNRESOLVABLE error instead.
auto get_value_by_pointer(const nlohmann::json& document, std::string_view pointer)
    -> std::optional<nlohmann::json>;

/// Compute the longest prefix of `path` that resolves in `document`.
///
/// Returns `path` itself when every component resolves, otherwise the raw
/// prefix up to (excluding) the first missing component. This is the
/// "existing path fragment" the validator compares against.
auto existing_path_fragment(const nlohmann::json& document, std::string_view path)
    -> std::string;

/// Find the pointer of `node` inside `root`, comparing by address.
/// @throws std::invalid_argument if `node` is not part of `root`.
auto get_path(const nlohmann::json& root, const nlohmann::json& node) -> std::string;

}  // namespace json_patch_cpp
