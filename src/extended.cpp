#include <json-patch-cpp/extended.hpp>
#include <json-patch-cpp/error.hpp>

#include <mutex>
#include <utility>

namespace json_patch_cpp {

auto is_valid_extended_op_id(std::string_view xid) -> bool {
    return xid.size() >= 3 && xid.starts_with("x-");
}

namespace {

class FunctionalExtendedOperation final : public ExtendedOperation {
public:
    explicit FunctionalExtendedOperation(ExtendedOperationConfig config)
        : config_{std::move(config)} {}

    auto apply_to_array(const Operation& op, nlohmann::json& container,
                        std::size_t index, nlohmann::json& document) const
        -> std::optional<ExtendedResult> override {
        return config_.arr(op, container, index, document);
    }

    auto apply_to_object(const Operation& op, nlohmann::json& container,
                         const std::string& key, nlohmann::json& document) const
        -> std::optional<ExtendedResult> override {
        return config_.obj(op, container, key, document);
    }

    void validate(const Operation& op, std::size_t index,
                  const nlohmann::json* document,
                  const std::optional<std::string>& existing_path) const override {
        config_.validator(op, index, document, existing_path);
    }

private:
    ExtendedOperationConfig config_;
};

void check_id(std::string_view xid) {
    if (!is_valid_extended_op_id(xid)) {
        throw PatchError{ErrorKind::operation_x_id_invalid,
                         "Extended operation `xid` has malformed id (MUST begin with `x-`)",
                         std::nullopt, std::string{xid}};
    }
}

}  // anonymous namespace

auto make_extended_operation(ExtendedOperationConfig config)
    -> std::shared_ptr<const ExtendedOperation> {
    auto invalid = [](std::string_view what) {
        return PatchError{ErrorKind::operation_x_config_invalid,
                          "Extended operation config has invalid `" + std::string{what} + "` function"};
    };
    if (!config.arr) throw invalid("arr");
    if (!config.obj) throw invalid("obj");
    if (!config.validator) throw invalid("validator");
    return std::make_shared<FunctionalExtendedOperation>(std::move(config));
}

void ExtendedOperationRegistry::register_operation(
    std::string xid, std::shared_ptr<const ExtendedOperation> operation) {
    check_id(xid);
    if (!operation) {
        throw PatchError{ErrorKind::operation_x_config_invalid,
                         "Extended operation config is missing", std::nullopt, xid};
    }
    auto lock = std::unique_lock{mutex_};
    operations_.insert_or_assign(std::move(xid), std::move(operation));
}

void ExtendedOperationRegistry::register_operation(std::string xid, ExtendedOperationConfig config) {
    check_id(xid);
    register_operation(std::move(xid), make_extended_operation(std::move(config)));
}

auto ExtendedOperationRegistry::find(std::string_view xid) const
    -> std::shared_ptr<const ExtendedOperation> {
    auto lock = std::shared_lock{mutex_};
    auto it = operations_.find(xid);
    if (it == operations_.end()) return nullptr;
    return it->second;
}

auto ExtendedOperationRegistry::contains(std::string_view xid) const -> bool {
    check_id(xid);
    auto lock = std::shared_lock{mutex_};
    return operations_.find(xid) != operations_.end();
}

void ExtendedOperationRegistry::clear() {
    auto lock = std::unique_lock{mutex_};
    operations_.clear();
}

auto ExtendedOperationRegistry::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return operations_.size();
}

auto default_registry() -> ExtendedOperationRegistry& {
    static auto registry = ExtendedOperationRegistry{};
    return registry;
}

void register_extended_operation(std::string xid, ExtendedOperationConfig config) {
    default_registry().register_operation(std::move(xid), std::move(config));
}

auto has_extended_operation(std::string_view xid) -> bool {
    return default_registry().contains(xid);
}

void clear_extended_operations() {
    default_registry().clear();
}

}  // namespace json_patch_cpp
