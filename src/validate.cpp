#include <json-patch-cpp/validate.hpp>
#include <json-patch-cpp/pointer.hpp>
#include <json-patch-cpp/value.hpp>

#include <algorithm>
#include <utility>

namespace json_patch_cpp {

namespace {

auto snapshot(const Operation& operation) -> nlohmann::json {
    auto j = nlohmann::json{};
    to_json(j, operation);
    return j;
}

[[noreturn]] void fail(ErrorKind kind, std::string message, std::size_t index,
                       const Operation& operation, const nlohmann::json* document) {
    throw PatchError{kind, std::move(message), index, snapshot(operation),
                     document ? *document : nlohmann::json(nullptr)};
}

void check_path_shape(const Operation& operation, std::size_t index,
                      const nlohmann::json* document) {
    if (!operation.path.empty() && operation.path.front() != '/') {
        fail(ErrorKind::operation_path_invalid,
             "Operation `path` property must start with \"/\"", index, operation, document);
    }
}

// Number of segments the path splits into on '/', counting the leading empty one.
auto segment_count(std::string_view path) -> std::size_t {
    return static_cast<std::size_t>(std::count(path.begin(), path.end(), '/')) + 1;
}

void validate_extended(const Operation& operation, std::size_t index,
                       const nlohmann::json* document,
                       const std::optional<std::string>& existing_path,
                       const ExtendedOperationRegistry& registry) {
    if (!is_valid_extended_op_id(operation.xid)) {
        fail(ErrorKind::operation_x_id_invalid,
             "Operation `xid` property is not present or not a valid extended operation id",
             index, operation, document);
    }
    auto extension = registry.find(operation.xid);
    if (!extension) {
        fail(ErrorKind::operation_x_op_invalid,
             "Extended operation `xid` property is not a registered extended operation",
             index, operation, document);
    }
    check_path_shape(operation, index, document);
    if (operation.path == "/") {
        fail(ErrorKind::operation_path_unresolvable,
             "Extended operation `path` of a single slash is ambiguous", index, operation, document);
    }
    if (operation.args && !operation.args->is_array()) {
        fail(ErrorKind::operation_x_args_not_array,
             "Extended operation `args` property must be an array", index, operation, document);
    }
    extension->validate(operation, index, document, existing_path);
}

}  // anonymous namespace

void validate_operation(const Operation& operation, std::size_t index,
                        const nlohmann::json* document,
                        const std::optional<std::string>& existing_path,
                        const ExtendedOperationRegistry& registry) {
    if (operation.op == OpType::x) {
        validate_extended(operation, index, document, existing_path, registry);
        return;
    }

    check_path_shape(operation, index, document);

    switch (operation.op) {
        case OpType::move:
        case OpType::copy:
            if (!operation.from) {
                fail(ErrorKind::operation_from_required,
                     "Operation `from` property is not present (applicable in `move` and `copy` operations)",
                     index, operation, document);
            }
            if (!operation.from->empty() && operation.from->front() != '/') {
                fail(ErrorKind::operation_path_invalid,
                     "Operation `from` property must start with \"/\"", index, operation, document);
            }
            break;
        case OpType::add:
        case OpType::replace:
        case OpType::test:
            if (!operation.value || operation.value->is_discarded()) {
                fail(ErrorKind::operation_value_required,
                     "Operation `value` property is not present (applicable in `add`, `replace` and `test` operations)",
                     index, operation, document);
            }
            if (has_undefined(*operation.value)) {
                fail(ErrorKind::operation_value_cannot_contain_undefined,
                     "Operation `value` property cannot contain undefined values",
                     index, operation, document);
            }
            break;
        default:
            break;
    }

    if (!document) return;

    const auto existing = existing_path ? *existing_path
                                        : existing_path_fragment(*document, operation.path);

    switch (operation.op) {
        case OpType::add: {
            const auto path_length = segment_count(operation.path);
            const auto existing_length = segment_count(existing);
            if (path_length != existing_length && path_length != existing_length + 1) {
                fail(ErrorKind::operation_path_cannot_add,
                     "Cannot perform an `add` operation at the desired path",
                     index, operation, document);
            }
            break;
        }
        case OpType::replace:
        case OpType::remove:
        case OpType::get:
            if (operation.path != existing) {
                fail(ErrorKind::operation_path_unresolvable,
                     "Cannot perform the operation at a path that does not exist",
                     index, operation, document);
            }
            break;
        case OpType::move:
        case OpType::copy: {
            auto lookup = Operation{.op = OpType::get, .path = *operation.from};
            auto error = validate_sequence(std::vector<Operation>{lookup}, document, {}, registry);
            if (error && error->kind() == ErrorKind::operation_path_unresolvable) {
                fail(ErrorKind::operation_from_unresolvable,
                     "Cannot perform the operation from a path that does not exist",
                     index, operation, document);
            }
            break;
        }
        case OpType::test:
        case OpType::x:
            break;
    }
}

void validate_operation(const nlohmann::json& operation, std::size_t index,
                        const nlohmann::json* document,
                        const std::optional<std::string>& existing_path,
                        const ExtendedOperationRegistry& registry) {
    validate_operation(parse_operation(operation, index), index, document, existing_path, registry);
}

auto validate_sequence(const std::vector<Operation>& sequence, const nlohmann::json* document,
                       const OperationValidator& validator,
                       const ExtendedOperationRegistry& registry) -> std::optional<PatchError> {
    try {
        if (document) {
            auto scratch = deep_clone(*document);
            auto options = ApplyOptions{.validate = true, .validator = validator, .registry = &registry};
            apply_patch(scratch, sequence, options);
        } else {
            for (std::size_t i = 0; i < sequence.size(); ++i) {
                if (validator) {
                    validator(sequence[i], i, nullptr, std::nullopt);
                } else {
                    validate_operation(sequence[i], i, nullptr, std::nullopt, registry);
                }
            }
        }
    } catch (const PatchError& e) {
        return e;
    }
    return std::nullopt;
}

auto validate_sequence(const nlohmann::json& sequence, const nlohmann::json* document,
                       const OperationValidator& validator,
                       const ExtendedOperationRegistry& registry) -> std::optional<PatchError> {
    auto operations = std::vector<Operation>{};
    try {
        if (!sequence.is_array()) {
            throw PatchError{ErrorKind::sequence_not_an_array, "Patch sequence must be an array"};
        }
        operations.reserve(sequence.size());
        for (std::size_t i = 0; i < sequence.size(); ++i) {
            operations.push_back(parse_operation(sequence[i], i));
        }
    } catch (const PatchError& e) {
        return e;
    }
    return validate_sequence(operations, document, validator, registry);
}

}  // namespace json_patch_cpp
