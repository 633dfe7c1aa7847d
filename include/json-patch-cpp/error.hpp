/// @file error.hpp
/// @brief Error types for the json-patch-cpp library.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace json_patch_cpp {

/// Categories of errors raised while validating or applying a patch.
enum class ErrorKind : std::uint8_t {
    sequence_not_an_array,                     ///< The patch is not a list of operations.
    operation_not_an_object,                   ///< An operation is not a JSON object.
    operation_op_invalid,                      ///< `op` is missing or not a known operation.
    operation_x_args_not_array,                ///< Extended `args` is present but not an array.
    operation_x_op_invalid,                    ///< Extended `xid` is not registered.
    operation_x_config_invalid,                ///< An extended operation config is incomplete.
    operation_x_id_invalid,                    ///< Extended `xid` is malformed.
    operation_x_ambiguous_removal,             ///< A removal was reported while resolving a path.
    operation_path_invalid,                    ///< `path` is missing or malformed.
    operation_from_required,                   ///< `from` is missing on move/copy.
    operation_value_required,                  ///< `value` is missing on add/replace/test.
    operation_value_cannot_contain_undefined,  ///< `value` has undefined leaves.
    operation_path_cannot_add,                 ///< The parent of an `add` target does not exist.
    operation_path_unresolvable,               ///< The path does not resolve in the document.
    operation_from_unresolvable,               ///< The `from` path does not resolve.
    operation_path_illegal_array_index,        ///< A list was indexed with a non-index key.
    operation_value_out_of_bounds,             ///< A list index is past the end.
    test_operation_failed,                     ///< A `test` operation compared unequal.
};

/// Convert an ErrorKind to its canonical name (e.g. "TEST_OPERATION_FAILED").
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::sequence_not_an_array:                    return "SEQUENCE_NOT_AN_ARRAY";
        case ErrorKind::operation_not_an_object:                  return "OPERATION_NOT_AN_OBJECT";
        case ErrorKind::operation_op_invalid:                     return "OPERATION_OP_INVALID";
        case ErrorKind::operation_x_args_not_array:               return "OPERATION_X_ARGS_NOT_ARRAY";
        case ErrorKind::operation_x_op_invalid:                   return "OPERATION_X_OP_INVALID";
        case ErrorKind::operation_x_config_invalid:               return "OPERATION_X_CONFIG_INVALID";
        case ErrorKind::operation_x_id_invalid:                   return "OPERATION_X_ID_INVALID";
        case ErrorKind::operation_x_ambiguous_removal:            return "OPERATION_X_AMBIGUOUS_REMOVAL";
        case ErrorKind::operation_path_invalid:                   return "OPERATION_PATH_INVALID";
        case ErrorKind::operation_from_required:                  return "OPERATION_FROM_REQUIRED";
        case ErrorKind::operation_value_required:                 return "OPERATION_VALUE_REQUIRED";
        case ErrorKind::operation_value_cannot_contain_undefined: return "OPERATION_VALUE_CANNOT_CONTAIN_UNDEFINED";
        case ErrorKind::operation_path_cannot_add:                return "OPERATION_PATH_CANNOT_ADD";
        case ErrorKind::operation_path_unresolvable:              return "OPERATION_PATH_UNRESOLVABLE";
        case ErrorKind::operation_from_unresolvable:              return "OPERATION_FROM_UNRESOLVABLE";
        case ErrorKind::operation_path_illegal_array_index:       return "OPERATION_PATH_ILLEGAL_ARRAY_INDEX";
        case ErrorKind::operation_value_out_of_bounds:            return "OPERATION_VALUE_OUT_OF_BOUNDS";
        case ErrorKind::test_operation_failed:                    return "TEST_OPERATION_FAILED";
    }
    return "UNKNOWN";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception raised for every domain failure during validation or application.
///
/// Carries the error kind, the index of the operation within its sequence,
/// and snapshots of the offending operation and of the document it was
/// applied to. what() returns the message followed by one line per
/// available context field, with JSON context pretty-printed.
class PatchError : public std::runtime_error {
public:
    PatchError(ErrorKind kind, std::string message,
               std::optional<std::size_t> index = std::nullopt,
               nlohmann::json operation = nullptr,
               nlohmann::json document = nullptr);

    auto kind() const noexcept -> ErrorKind { return kind_; }

    /// The short message, without the appended context.
    auto message() const -> const std::string& { return message_; }

    auto index() const noexcept -> std::optional<std::size_t> { return index_; }

    /// Snapshot of the offending operation (null when not applicable).
    auto operation() const -> const nlohmann::json& { return operation_; }

    /// Snapshot of the document the operation ran against (null when not applicable).
    auto document() const -> const nlohmann::json& { return document_; }

    /// The kind and short message as a plain Error value.
    auto error() const -> Error { return Error{kind_, message_}; }

private:
    ErrorKind kind_;
    std::string message_;
    std::optional<std::size_t> index_;
    nlohmann::json operation_;
    nlohmann::json document_;
};

/// Message used when a path would modify `__proto__` or `constructor/prototype`.
inline constexpr std::string_view prototype_error_message =
    "JSON-Patch: modifying `__proto__` or `constructor/prototype` prop is banned "
    "for security reasons, if this was on purpose, please set "
    "`ban_prototype_modifications` to false and pass it to this function.";

/// Raised when a path component targets a prototype-pollution key.
///
/// Not a PatchError: batch validation lets it propagate to the caller.
class PrototypeModificationError : public std::invalid_argument {
public:
    PrototypeModificationError()
        : std::invalid_argument{std::string{prototype_error_message}} {}
};

}  // namespace json_patch_cpp
