/// @file validate.hpp
/// @brief Structural and document-aware validation of patch operations.

#pragma once

#include <json-patch-cpp/error.hpp>
#include <json-patch-cpp/extended.hpp>
#include <json-patch-cpp/operation.hpp>
#include <json-patch-cpp/patch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace json_patch_cpp {

/// Validate a single operation, throwing PatchError on the first violation.
///
/// Shape checks always run: a known op with a well-formed path, `from` for
/// move/copy, a fully defined `value` for add/replace/test, and for extended
/// operations a well-formed registered `xid`, a path other than "/", array
/// `args`, and the operation's own validator.
///
/// When `document` is given, the path is also checked against it: `add`
/// needs the parent to exist, replace/remove/get need the full path to
/// exist, move/copy need `from` to exist. `existing_path` is the resolvable
/// prefix of the path; it is computed from `document` when omitted.
///
/// @param operation The operation to check.
/// @param index Position in the sequence, for error context.
/// @param document Optional document the operation will be applied to.
/// @param existing_path Optional resolvable prefix of `operation.path`.
/// @param registry Where extended operations are looked up.
void validate_operation(const Operation& operation, std::size_t index,
                        const nlohmann::json* document = nullptr,
                        const std::optional<std::string>& existing_path = std::nullopt,
                        const ExtendedOperationRegistry& registry = default_registry());

/// Parse and validate a single JSON operation.
void validate_operation(const nlohmann::json& operation, std::size_t index,
                        const nlohmann::json* document = nullptr,
                        const std::optional<std::string>& existing_path = std::nullopt,
                        const ExtendedOperationRegistry& registry = default_registry());

/// Validate a whole sequence and return the first domain error, if any.
///
/// With a document, the sequence is dry-run against a clone with validation
/// enabled, so every error application itself would raise is reported.
/// Without one, each operation is checked in isolation. PatchError is
/// returned rather than thrown; any other exception (including
/// PrototypeModificationError) propagates.
///
/// @param sequence The operations to check.
/// @param document Optional document the sequence will be applied to.
/// @param validator Optional replacement for validate_operation().
/// @param registry Where extended operations are looked up.
auto validate_sequence(const std::vector<Operation>& sequence,
                       const nlohmann::json* document = nullptr,
                       const OperationValidator& validator = {},
                       const ExtendedOperationRegistry& registry = default_registry())
    -> std::optional<PatchError>;

/// Validate a JSON sequence; reports SEQUENCE_NOT_AN_ARRAY and parse errors too.
auto validate_sequence(const nlohmann::json& sequence,
                       const nlohmann::json* document = nullptr,
                       const OperationValidator& validator = {},
                       const ExtendedOperationRegistry& registry = default_registry())
    -> std::optional<PatchError>;

}  // namespace json_patch_cpp
