/// @file extended.hpp
/// @brief Extended (non-RFC 6902) operations and their registry.

#pragma once

#include <json-patch-cpp/operation.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace json_patch_cpp {

/// What an extended operation handler produced.
///
/// `new_document` is the handler's working document after its change (the
/// `document` argument it was given, typically). A set `removed` marks the
/// change as a removal of the targeted key.
struct ExtendedResult {
    nlohmann::json new_document;            ///< The working document after the change.
    std::optional<nlohmann::json> removed;  ///< The removed value, if the handler removed one.
};

/// Check whether an id is a well-formed extended operation id ("x-" prefix, length >= 3).
auto is_valid_extended_op_id(std::string_view xid) -> bool;

/// A user-defined operation kind.
///
/// Handlers always run against a private clone of the document. They may
/// mutate `container` (which lives inside `document`) freely; what they
/// return is the only thing that reaches the caller's document. Returning
/// nullopt leaves the document untouched.
class ExtendedOperation {
public:
    virtual ~ExtendedOperation() = default;

    /// Apply the operation when the targeted container is an array.
    /// @param op The operation being applied.
    /// @param container The array holding the target element.
    /// @param index The target index (`-` and `--` already resolved).
    /// @param document The whole working document.
    virtual auto apply_to_array(const Operation& op, nlohmann::json& container,
                                std::size_t index, nlohmann::json& document) const
        -> std::optional<ExtendedResult> = 0;

    /// Apply the operation when the targeted container is an object.
    /// At the root path, `container` is the document and `key` is empty.
    virtual auto apply_to_object(const Operation& op, nlohmann::json& container,
                                 const std::string& key, nlohmann::json& document) const
        -> std::optional<ExtendedResult> = 0;

    /// Check operation-specific rules; throw PatchError to reject.
    /// @param document The document the operation will run against, if known.
    /// @param existing_path The resolvable prefix of `op.path`, if known.
    virtual void validate(const Operation& op, std::size_t index,
                          const nlohmann::json* document,
                          const std::optional<std::string>& existing_path) const = 0;
};

/// The three capabilities of an extended operation as plain callables.
struct ExtendedOperationConfig {
    using ArrayHandler = std::function<std::optional<ExtendedResult>(
        const Operation&, nlohmann::json&, std::size_t, nlohmann::json&)>;
    using ObjectHandler = std::function<std::optional<ExtendedResult>(
        const Operation&, nlohmann::json&, const std::string&, nlohmann::json&)>;
    using Validator = std::function<void(
        const Operation&, std::size_t, const nlohmann::json*, const std::optional<std::string>&)>;

    ArrayHandler arr;     ///< Handler for array containers.
    ObjectHandler obj;    ///< Handler for object containers.
    Validator validator;  ///< Operation-specific validation.
};

/// Adapt a config to the ExtendedOperation interface.
/// @throws PatchError OPERATION_X_CONFIG_INVALID if any callable is empty.
auto make_extended_operation(ExtendedOperationConfig config)
    -> std::shared_ptr<const ExtendedOperation>;

/// Mapping from extended operation id to its implementation.
///
/// Registration overwrites an existing entry for the same id. Lookups take
/// a shared lock and registration/clearing an exclusive one, so a registry
/// may be read from several threads while it is not being modified.
class ExtendedOperationRegistry {
public:
    ExtendedOperationRegistry() = default;

    ExtendedOperationRegistry(const ExtendedOperationRegistry&) = delete;
    auto operator=(const ExtendedOperationRegistry&) -> ExtendedOperationRegistry& = delete;

    /// Register (or replace) an implementation.
    /// @throws PatchError OPERATION_X_ID_INVALID for a malformed id,
    ///   OPERATION_X_CONFIG_INVALID for a null implementation.
    void register_operation(std::string xid, std::shared_ptr<const ExtendedOperation> operation);

    /// Register (or replace) a config.
    void register_operation(std::string xid, ExtendedOperationConfig config);

    /// Look up an implementation.
    /// @return The implementation, or nullptr if `xid` is not registered.
    auto find(std::string_view xid) const -> std::shared_ptr<const ExtendedOperation>;

    /// Check whether `xid` is registered.
    /// @throws PatchError OPERATION_X_ID_INVALID for a malformed id.
    auto contains(std::string_view xid) const -> bool;

    /// Remove every registration.
    void clear();

    auto size() const -> std::size_t;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const ExtendedOperation>, std::less<>> operations_;
};

/// The process-wide registry used when no registry is passed explicitly.
auto default_registry() -> ExtendedOperationRegistry&;

/// Register a config in the default registry.
void register_extended_operation(std::string xid, ExtendedOperationConfig config);

/// Check the default registry for `xid`.
auto has_extended_operation(std::string_view xid) -> bool;

/// Empty the default registry.
void clear_extended_operations();

}  // namespace json_patch_cpp
