/// @file patch.hpp
/// @brief Applying operations and operation sequences to a document.
///
/// Each entry point comes in two flavours with an explicit ownership
/// contract: the plain form takes `Document&` and patches it in place
/// (including replacing the root), the `_to_copy` form takes
/// `const Document&`, clones it once and returns the patched copy, leaving
/// the caller's document untouched.

#pragma once

#include <json-patch-cpp/extended.hpp>
#include <json-patch-cpp/operation.hpp>
#include <json-patch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace json_patch_cpp {

/// A replacement for the built-in operation validator.
///
/// Called with the operation, its index in the sequence, the document (if
/// any) and the existing-path fragment (if known). Throw PatchError to reject.
using OperationValidator = std::function<void(
    const Operation&, std::size_t, const nlohmann::json*, const std::optional<std::string>&)>;

/// Per-call configuration of the dispatcher.
struct ApplyOptions {
    /// Run the built-in validator before and during application.
    bool validate{false};

    /// Custom validator; setting it implies validation.
    OperationValidator validator{};

    /// Reject `__proto__` and `constructor/prototype` path components.
    bool ban_prototype_modifications{true};

    /// Registry for extended operations; nullptr selects default_registry().
    const ExtendedOperationRegistry* registry{nullptr};

    auto validating() const -> bool { return validate || static_cast<bool>(validator); }
};

/// Operation-specific output of a single application.
struct OperationResult {
    std::optional<nlohmann::json> removed;  ///< Value removed or overwritten (remove, replace, move, x).
    std::optional<bool> test;               ///< Outcome of a test operation.
    std::optional<std::size_t> index;       ///< Insertion index of an array add.
    std::optional<nlohmann::json> value;    ///< Value read by an internal get.
};

/// A patched copy of a document plus the operation's output.
struct AppliedOperation {
    Document new_document;
    OperationResult result;
};

/// A patched copy of a document plus the output of every operation.
struct PatchResult {
    Document new_document;
    std::vector<OperationResult> results;
};

// -- Single operations --------------------------------------------------------

/// Apply one operation to `document` in place.
///
/// @param document The document to patch; replaced wholesale by root operations.
/// @param operation The operation to apply.
/// @param options Validation, prototype guard and registry selection.
/// @param index Position of the operation in its sequence, for error context.
/// @throws PatchError on invalid operations, unresolvable paths or a failed test.
/// @throws PrototypeModificationError on a banned path component.
auto apply_operation(Document& document, const Operation& operation,
                     const ApplyOptions& options = {}, std::size_t index = 0)
    -> OperationResult;

/// Parse and apply one JSON operation in place.
auto apply_operation(Document& document, const nlohmann::json& operation,
                     const ApplyOptions& options = {}, std::size_t index = 0)
    -> OperationResult;

/// Apply one operation to a clone of `document`.
auto apply_operation_to_copy(const Document& document, const Operation& operation,
                             const ApplyOptions& options = {}, std::size_t index = 0)
    -> AppliedOperation;

/// Apply one operation and return the resulting document, for use as a fold step.
///
/// @code
/// auto result = std::accumulate(ops.begin(), ops.end(), doc,
///     [](Document d, const Operation& op) { return apply_reducer(std::move(d), op); });
/// @endcode
/// @throws PatchError TEST_OPERATION_FAILED if a test operation fails.
auto apply_reducer(Document document, const Operation& operation, std::size_t index = 0)
    -> Document;

// -- Sequences ----------------------------------------------------------------

/// Apply a sequence of operations to `document` in place, in order.
///
/// Each operation sees the document as left by its predecessor. There is no
/// rollback: when operation i throws, operations 0..i-1 have already been
/// applied. Use validate_sequence() first if all-or-nothing is required, or
/// apply_patch_to_copy() to keep the original intact.
auto apply_patch(Document& document, const std::vector<Operation>& patch,
                 const ApplyOptions& options = {}) -> std::vector<OperationResult>;

/// Apply a JSON array of operations in place.
///
/// A non-array patch raises SEQUENCE_NOT_AN_ARRAY when validating and is
/// otherwise treated as an empty sequence.
auto apply_patch(Document& document, const nlohmann::json& patch,
                 const ApplyOptions& options = {}) -> std::vector<OperationResult>;

/// Apply a sequence of operations to a clone of `document`.
auto apply_patch_to_copy(const Document& document, const std::vector<Operation>& patch,
                         const ApplyOptions& options = {}) -> PatchResult;

/// Apply a JSON array of operations to a clone of `document`.
auto apply_patch_to_copy(const Document& document, const nlohmann::json& patch,
                         const ApplyOptions& options = {}) -> PatchResult;

}  // namespace json_patch_cpp
