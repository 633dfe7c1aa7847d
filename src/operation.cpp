#include <json-patch-cpp/operation.hpp>
#include <json-patch-cpp/error.hpp>

#include <array>
#include <utility>

namespace json_patch_cpp {

auto op_type_from_string(std::string_view name) -> std::optional<OpType> {
    static constexpr auto all = std::array{
        OpType::add, OpType::remove, OpType::replace, OpType::move,
        OpType::copy, OpType::test, OpType::get, OpType::x,
    };
    for (auto type : all) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

auto parse_operation(const nlohmann::json& j, std::optional<std::size_t> index) -> Operation {
    if (!j.is_object()) {
        throw PatchError{ErrorKind::operation_not_an_object,
                         "Operation is not an object", index, j};
    }

    auto op = Operation{};

    auto op_it = j.find("op");
    auto type = (op_it != j.end() && op_it->is_string())
                    ? op_type_from_string(op_it->get<std::string>())
                    : std::nullopt;
    if (!type) {
        throw PatchError{ErrorKind::operation_op_invalid,
                         "Operation `op` property is not one of operations defined in RFC-6902",
                         index, j};
    }
    op.op = *type;

    auto path_it = j.find("path");
    if (path_it == j.end() || !path_it->is_string()) {
        throw PatchError{ErrorKind::operation_path_invalid,
                         "Operation `path` property is not a string", index, j};
    }
    op.path = path_it->get<std::string>();

    if (auto it = j.find("value"); it != j.end()) {
        op.value = *it;
    }
    // A non-string `from` is treated as absent; the validator reports it.
    if (auto it = j.find("from"); it != j.end() && it->is_string()) {
        op.from = it->get<std::string>();
    }
    if (auto it = j.find("xid"); it != j.end() && it->is_string()) {
        op.xid = it->get<std::string>();
    }
    if (auto it = j.find("args"); it != j.end()) {
        op.args = *it;
    }
    if (auto it = j.find("resolve"); it != j.end() && it->is_boolean()) {
        op.resolve = it->get<bool>();
    }
    return op;
}

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"op", std::string{to_string_view(op.op)}},
        {"path", op.path},
    };
    if (op.value && !op.value->is_discarded()) j["value"] = *op.value;
    if (op.from) j["from"] = *op.from;
    if (op.op == OpType::x) {
        j["xid"] = op.xid;
        if (op.args) j["args"] = *op.args;
        if (op.resolve) j["resolve"] = true;
    }
}

void from_json(const nlohmann::json& j, Operation& op) {
    op = parse_operation(j);
}

}  // namespace json_patch_cpp
