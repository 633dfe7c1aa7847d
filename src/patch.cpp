#include <json-patch-cpp/patch.hpp>
#include <json-patch-cpp/error.hpp>
#include <json-patch-cpp/graft.hpp>
#include <json-patch-cpp/pointer.hpp>
#include <json-patch-cpp/validate.hpp>

#include "json_access.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

namespace json_patch_cpp {

namespace {

constexpr auto illegal_index_message =
    "Expected an unsigned base-10 integer value, making the new referenced value "
    "the array element with the zero-based index";
constexpr auto out_of_bounds_message =
    "The specified index MUST NOT be greater than the number of elements in the array";
constexpr auto unresolvable_message = "Cannot perform operation at the desired path";
constexpr auto path_shape_message = "Operation `path` property must start with \"/\"";
constexpr auto from_shape_message = "Operation `from` property must start with \"/\"";
constexpr auto unregistered_message =
    "Extended operation `xid` property is not a registered extended operation";

auto snapshot(const Operation& operation) -> nlohmann::json {
    auto j = nlohmann::json{};
    to_json(j, operation);
    return j;
}

[[noreturn]] void fail(ErrorKind kind, std::string message, std::size_t index,
                       const Operation& operation, const Document& document) {
    throw PatchError{kind, std::move(message), index, snapshot(operation), document};
}

auto registry_of(const ApplyOptions& options) -> const ExtendedOperationRegistry& {
    return options.registry ? *options.registry : default_registry();
}

void run_validator(const ApplyOptions& options, const Operation& operation, std::size_t index,
                   const Document* document, const std::optional<std::string>& existing_path) {
    if (options.validator) {
        options.validator(operation, index, document, existing_path);
    } else {
        validate_operation(operation, index, document, existing_path, registry_of(options));
    }
}

// The value an add/replace writes; never aliases the operation.
auto operand(const Operation& operation) -> nlohmann::json {
    return operation.value ? deep_clone(*operation.value) : nlohmann::json(nullptr);
}

auto test_equal(const nlohmann::json* current, const Operation& operation) -> bool {
    static const auto undefined = undefined_value();
    return deep_equal(current ? *current : undefined,
                      operation.value ? *operation.value : undefined);
}

auto apply_impl(Document& document, const Operation& operation, const ApplyOptions& options,
                std::size_t index, bool mutate) -> OperationResult;

// -- move / copy (shared by both container kinds) -----------------------------

auto source_path(const Operation& operation, std::size_t index, const Document& document)
    -> const std::string& {
    if (!operation.from) {
        fail(ErrorKind::operation_from_required,
             "Operation `from` property is not present (applicable in `move` and `copy` operations)",
             index, operation, document);
    }
    if (!operation.from->empty() && operation.from->front() != '/') {
        fail(ErrorKind::operation_path_invalid, from_shape_message, index, operation, document);
    }
    return *operation.from;
}

auto apply_move(Document& document, const Operation& operation, std::size_t index)
    -> OperationResult {
    const auto& from = source_path(operation, index, document);
    const auto& path = operation.path;
    if (from.empty() || (path.size() > from.size() && path.starts_with(from) && path[from.size()] == '/')) {
        fail(ErrorKind::operation_path_unresolvable,
             "Cannot move a value into one of its own children", index, operation, document);
    }

    if (!find_by_pointer(document, from)) {
        fail(ErrorKind::operation_from_unresolvable,
             "Cannot perform the operation from a path that does not exist",
             index, operation, document);
    }

    auto result = OperationResult{};
    if (const auto* overwritten = find_by_pointer(document, path)) {
        result.removed = deep_clone(*overwritten);
    }

    auto removal = Operation{.op = OpType::remove, .path = from};
    auto original = apply_impl(document, removal, ApplyOptions{}, index, true).removed;

    auto addition = Operation{.op = OpType::add, .path = path, .value = std::move(original)};
    apply_impl(document, addition, ApplyOptions{}, index, true);
    return result;
}

auto apply_copy(Document& document, const Operation& operation, std::size_t index)
    -> OperationResult {
    const auto& from = source_path(operation, index, document);
    const auto* source = find_by_pointer(document, from);
    if (!source) {
        fail(ErrorKind::operation_from_unresolvable,
             "Cannot perform the operation from a path that does not exist",
             index, operation, document);
    }

    auto addition = Operation{.op = OpType::add, .path = operation.path, .value = deep_clone(*source)};
    apply_impl(document, addition, ApplyOptions{}, index, true);
    return {};
}

// -- Standard operations at the final container -------------------------------

auto apply_to_object(Document& document, nlohmann::json& container, const std::string& key,
                     const Operation& operation, std::size_t index) -> OperationResult {
    auto result = OperationResult{};
    switch (operation.op) {
        case OpType::add:
            container[key] = operand(operation);
            break;
        case OpType::remove:
            if (auto it = container.find(key); it != container.end()) {
                result.removed = std::move(*it);
                container.erase(it);
            }
            break;
        case OpType::replace:
            if (const auto* existing = detail::find_child(container, key)) {
                result.removed = *existing;
            }
            container[key] = operand(operation);
            break;
        case OpType::move:
            return apply_move(document, operation, index);
        case OpType::copy:
            return apply_copy(document, operation, index);
        case OpType::test:
            result.test = test_equal(detail::find_child(container, key), operation);
            if (!*result.test) {
                fail(ErrorKind::test_operation_failed, "Test operation failed",
                     index, operation, document);
            }
            break;
        case OpType::get:
            if (const auto* current = detail::find_child(container, key)) {
                result.value = *current;
            }
            break;
        case OpType::x:
            break;
    }
    return result;
}

auto apply_to_array(Document& document, nlohmann::json& container, std::size_t idx,
                    const Operation& operation, std::size_t index) -> OperationResult {
    auto result = OperationResult{};
    auto* current = idx < container.size() ? &container[idx] : nullptr;
    switch (operation.op) {
        case OpType::add: {
            auto position = std::min(idx, container.size());
            container.insert(container.begin() + static_cast<std::ptrdiff_t>(position),
                             operand(operation));
            result.index = idx;
            break;
        }
        case OpType::remove:
            if (current) {
                result.removed = std::move(*current);
                container.erase(idx);
            }
            break;
        case OpType::replace:
            if (!current) {
                fail(ErrorKind::operation_value_out_of_bounds, out_of_bounds_message,
                     index, operation, document);
            }
            result.removed = std::exchange(*current, operand(operation));
            break;
        case OpType::move:
            return apply_move(document, operation, index);
        case OpType::copy:
            return apply_copy(document, operation, index);
        case OpType::test:
            result.test = test_equal(current, operation);
            if (!*result.test) {
                fail(ErrorKind::test_operation_failed, "Test operation failed",
                     index, operation, document);
            }
            break;
        case OpType::get:
            if (current) result.value = *current;
            break;
        case OpType::x:
            break;
    }
    return result;
}

// -- Extended operations ------------------------------------------------------

auto find_extension(const ApplyOptions& options, const Operation& operation, std::size_t index,
                    const Document& document) -> std::shared_ptr<const ExtendedOperation> {
    auto extension = registry_of(options).find(operation.xid);
    if (!extension) {
        fail(ErrorKind::operation_x_op_invalid, unregistered_message, index, operation, document);
    }
    return extension;
}

// Bring a handler's outcome into `document`. `components` holds the
// unescaped path (index 0 unused, sentinels already resolved) and `end`
// is one past the targeted component.
auto finish_extended(Document& document, std::optional<ExtendedResult> outcome,
                     const Operation& operation, std::size_t index, bool mutate,
                     const std::vector<std::string>& components, std::size_t end,
                     std::optional<std::size_t> graft_end) -> OperationResult {
    if (!outcome) return {};

    if (outcome->removed && operation.resolve) {
        fail(ErrorKind::operation_x_ambiguous_removal,
             "Extended operation should not remove items while resolving undefined paths",
             index, operation, document);
    }

    auto result = OperationResult{};
    result.removed = std::move(outcome->removed);

    if (!mutate) {
        document = std::move(outcome->new_document);
        return result;
    }

    auto path = PathComponents{};
    auto first = components.begin() + 1;
    if (result.removed) {
        path.mod_type = ModType::prune;
        path.components.assign(first, components.begin() + static_cast<std::ptrdiff_t>(end));
    } else {
        path.mod_type = ModType::graft;
        path.components.assign(
            first, components.begin() + static_cast<std::ptrdiff_t>(graft_end.value_or(end)));
    }
    graft_tree(outcome->new_document, document, path);
    return result;
}

// -- Root path ----------------------------------------------------------------

auto apply_to_root(Document& document, const Operation& operation, const ApplyOptions& options,
                   std::size_t index) -> OperationResult {
    auto result = OperationResult{};
    switch (operation.op) {
        case OpType::add:
            document = operand(operation);
            break;
        case OpType::replace:
            result.removed = std::exchange(document, operand(operation));
            break;
        case OpType::remove:
            result.removed = std::exchange(document, nullptr);
            break;
        case OpType::move:
        case OpType::copy: {
            const auto& from = source_path(operation, index, document);
            const auto* source = find_by_pointer(document, from, options.ban_prototype_modifications);
            if (!source) {
                fail(ErrorKind::operation_from_unresolvable,
                     "Cannot perform the operation from a path that does not exist",
                     index, operation, document);
            }
            auto value = deep_clone(*source);
            if (operation.op == OpType::move) {
                result.removed = std::move(document);
            }
            document = std::move(value);
            break;
        }
        case OpType::test:
            result.test = test_equal(&document, operation);
            if (!*result.test) {
                fail(ErrorKind::test_operation_failed, "Test operation failed",
                     index, operation, document);
            }
            break;
        case OpType::get:
            result.value = document;
            break;
        case OpType::x: {
            // At the root an extended operation always takes the object handler
            auto extension = find_extension(options, operation, index, document);
            auto working = deep_clone(document);
            auto outcome = extension->apply_to_object(operation, working, std::string{}, working);
            if (!outcome) return result;
            if (outcome->removed && operation.resolve) {
                fail(ErrorKind::operation_x_ambiguous_removal,
                     "Extended operation should not remove items while resolving undefined paths",
                     index, operation, document);
            }
            document = std::move(outcome->new_document);
            result.removed = std::move(outcome->removed);
            break;
        }
    }
    return result;
}

// -- Nested paths -------------------------------------------------------------

auto apply_nested(Document& document, const Operation& operation, const ApplyOptions& options,
                  std::size_t index, bool mutate) -> OperationResult {
    const auto validating = options.validating();
    const auto extended = operation.op == OpType::x;

    if (operation.path.front() != '/') {
        fail(ErrorKind::operation_path_invalid, path_shape_message, index, operation, document);
    }

    auto raw = split_pointer(operation.path);
    const auto len = raw.size();
    auto components = std::vector<std::string>(len);

    auto extension = std::shared_ptr<const ExtendedOperation>{};
    auto working = Document{};
    auto* working_document = &document;
    if (extended) {
        extension = find_extension(options, operation, index, document);
        // The handler gets its own copy so that returning nullopt discards its changes
        working = deep_clone(document);
        working_document = &working;
    }

    auto* container = working_document;
    auto existing_path = std::optional<std::string>{};
    auto graft_end = std::optional<std::size_t>{};

    auto t = std::size_t{1};
    while (true) {
        auto key = unescape_path_component(raw[t]);
        if (options.ban_prototype_modifications && is_prototype_key(key, raw[t - 1])) {
            throw PrototypeModificationError{};
        }

        if (validating && !existing_path) {
            if (!detail::find_child(*container, key)) {
                existing_path = detail::join_components(raw, t);
            } else if (t == len - 1) {
                existing_path = operation.path;
            }
            if (existing_path) {
                run_validator(options, operation, index, &document, existing_path);
            }
        }

        ++t;
        const auto terminal = t >= len;

        if (!container->is_structured()) {
            if (operation.op == OpType::get && !validating) return {};
            fail(ErrorKind::operation_path_unresolvable, unresolvable_message,
                 index, operation, document);
        }

        auto* child = static_cast<nlohmann::json*>(nullptr);
        auto idx = std::size_t{0};

        if (container->is_array()) {
            if (extended && !operation.resolve && key.empty()) {
                fail(ErrorKind::operation_path_illegal_array_index, illegal_index_message,
                     index, operation, document);
            }
            if (key == "-" || (extended && key == "--")) {
                if (key == "--" && container->empty()) {
                    fail(ErrorKind::operation_value_out_of_bounds,
                         "The `--` index needs at least one element in the array",
                         index, operation, document);
                }
                idx = key == "-" ? container->size() : container->size() - 1;
                if (extended) {
                    // The resolved index becomes part of the path to graft at
                    key = std::to_string(idx);
                    raw[t - 1] = key;
                    if (!graft_end) graft_end = t;
                }
            } else {
                auto parsed = try_parse_index(key);
                if (!parsed) {
                    fail(ErrorKind::operation_path_illegal_array_index, illegal_index_message,
                         index, operation, document);
                }
                idx = *parsed;
                // Resolving may append one element, never leave a gap
                const auto limit = operation.resolve ? container->size() + 1 : container->size();
                if (extended && idx >= limit) {
                    fail(ErrorKind::operation_value_out_of_bounds, out_of_bounds_message,
                         index, operation, document);
                }
            }
            components[t - 1] = key;

            if (terminal) {
                if (extended) {
                    auto outcome = extension->apply_to_array(operation, *container, idx, *working_document);
                    return finish_extended(document, std::move(outcome), operation, index, mutate,
                                           components, t, graft_end);
                }
                if (validating && operation.op == OpType::add && idx > container->size()) {
                    fail(ErrorKind::operation_value_out_of_bounds, out_of_bounds_message,
                         index, operation, document);
                }
                return apply_to_array(document, *container, idx, operation, index);
            }
            if (idx < container->size()) child = &(*container)[idx];
        } else {
            components[t - 1] = key;

            if (terminal) {
                if (extended) {
                    // An empty leaf key behaves like the root: nothing to do without resolve
                    if (key.empty() && !operation.resolve) return {};
                    auto outcome = extension->apply_to_object(operation, *container, key, *working_document);
                    return finish_extended(document, std::move(outcome), operation, index, mutate,
                                           components, t, graft_end);
                }
                return apply_to_object(document, *container, key, operation, index);
            }
            child = detail::find_child(*container, key);
        }

        if (extended && !child) {
            // First missing branch: the handler's result is grafted from here
            if (!graft_end) graft_end = t;
            if (operation.resolve) {
                // A new array starts empty, so only index 0 can follow it
                auto next = try_parse_index(raw[t]);
                auto created = (document.is_array() && next)
                                   ? nlohmann::json::array()
                                   : nlohmann::json::object();
                child = container->is_array() ? &((*container)[idx] = std::move(created))
                                              : &((*container)[key] = std::move(created));
            }
        }

        if (!child || !child->is_structured()) {
            if (operation.op == OpType::get && !validating) return {};
            fail(ErrorKind::operation_path_unresolvable, unresolvable_message,
                 index, operation, document);
        }
        container = child;
    }
}

auto apply_impl(Document& document, const Operation& operation, const ApplyOptions& options,
                std::size_t index, bool mutate) -> OperationResult {
    if (options.validating()) {
        if (options.validator) {
            options.validator(operation, index, &document, operation.path);
        } else {
            validate_operation(operation, index, nullptr, std::nullopt, registry_of(options));
        }
    }

    if (operation.path.empty()) {
        return apply_to_root(document, operation, options, index);
    }
    return apply_nested(document, operation, options, index, mutate);
}

}  // anonymous namespace

auto apply_operation(Document& document, const Operation& operation,
                     const ApplyOptions& options, std::size_t index) -> OperationResult {
    return apply_impl(document, operation, options, index, true);
}

auto apply_operation(Document& document, const nlohmann::json& operation,
                     const ApplyOptions& options, std::size_t index) -> OperationResult {
    return apply_impl(document, parse_operation(operation, index), options, index, true);
}

auto apply_operation_to_copy(const Document& document, const Operation& operation,
                             const ApplyOptions& options, std::size_t index) -> AppliedOperation {
    auto applied = AppliedOperation{deep_clone(document), {}};
    applied.result = apply_impl(applied.new_document, operation, options, index, false);
    return applied;
}

auto apply_reducer(Document document, const Operation& operation, std::size_t index) -> Document {
    apply_impl(document, operation, ApplyOptions{}, index, true);
    return document;
}

auto apply_patch(Document& document, const std::vector<Operation>& patch,
                 const ApplyOptions& options) -> std::vector<OperationResult> {
    auto results = std::vector<OperationResult>{};
    results.reserve(patch.size());
    for (std::size_t i = 0; i < patch.size(); ++i) {
        results.push_back(apply_impl(document, patch[i], options, i, true));
    }
    return results;
}

auto apply_patch(Document& document, const nlohmann::json& patch,
                 const ApplyOptions& options) -> std::vector<OperationResult> {
    if (!patch.is_array()) {
        if (options.validating()) {
            throw PatchError{ErrorKind::sequence_not_an_array, "Patch sequence must be an array"};
        }
        return {};
    }

    auto results = std::vector<OperationResult>{};
    results.reserve(patch.size());
    for (std::size_t i = 0; i < patch.size(); ++i) {
        results.push_back(apply_impl(document, parse_operation(patch[i], i), options, i, true));
    }
    return results;
}

auto apply_patch_to_copy(const Document& document, const std::vector<Operation>& patch,
                         const ApplyOptions& options) -> PatchResult {
    auto out = PatchResult{deep_clone(document), {}};
    out.results = apply_patch(out.new_document, patch, options);
    return out;
}

auto apply_patch_to_copy(const Document& document, const nlohmann::json& patch,
                         const ApplyOptions& options) -> PatchResult {
    auto out = PatchResult{deep_clone(document), {}};
    out.results = apply_patch(out.new_document, patch, options);
    return out;
}

}  // namespace json_patch_cpp
