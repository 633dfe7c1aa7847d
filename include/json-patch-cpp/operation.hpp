/// @file operation.hpp
/// @brief Patch operation types and their JSON wire form.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace json_patch_cpp {

/// The kind of a patch operation.
enum class OpType : std::uint8_t {
    add,      ///< Insert into an array or set a map member.
    remove,   ///< Remove an array element or map member.
    replace,  ///< Overwrite an existing value.
    move,     ///< Remove from `from` and add at `path`.
    copy,     ///< Add a copy of the value at `from` at `path`.
    test,     ///< Compare the value at `path` with `value`.
    get,      ///< Internal: read the value at `path`.
    x,        ///< Extended operation dispatched through the registry.
};

/// Convert an OpType to its wire name ("add", ..., "_get", "x").
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
        case OpType::test:    return "test";
        case OpType::get:     return "_get";
        case OpType::x:       return "x";
    }
    return "unknown";
}

/// Parse a wire name into an OpType, or nullopt if it is not one.
auto op_type_from_string(std::string_view name) -> std::optional<OpType>;

/// A single patch operation.
///
/// Standard operations use `path` plus `value` (add, replace, test) or
/// `from` (move, copy). Extended operations (`OpType::x`) name their
/// registered handler with `xid` and may carry `args` and the `resolve`
/// flag. Optional members model absent fields so the validator can report
/// exactly what is missing.
struct Operation {
    OpType op{OpType::add};                ///< The operation kind.
    std::string path;                      ///< Target pointer.
    std::optional<nlohmann::json> value{}; ///< Operand for add/replace/test.
    std::optional<std::string> from{};     ///< Source pointer for move/copy.
    std::string xid{};                     ///< Extended operation id ("x-...").
    std::optional<nlohmann::json> args{};  ///< Extended operation arguments.
    bool resolve{false};                   ///< Extended: create missing intermediates.
};

/// Build an Operation from its JSON form.
///
/// @param j The operation object.
/// @param index Position of the operation in its sequence, for error context.
/// @throws PatchError OPERATION_NOT_AN_OBJECT, OPERATION_OP_INVALID or
///   OPERATION_PATH_INVALID when the object cannot be represented.
auto parse_operation(const nlohmann::json& j, std::optional<std::size_t> index = std::nullopt)
    -> Operation;

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);

}  // namespace json_patch_cpp
