#include <json-patch-cpp/error.hpp>

#include <utility>

namespace json_patch_cpp {

namespace {

// Message followed by one "key: value" line per available context field;
// structured context is pretty-printed.
auto format_message(std::string_view message, ErrorKind kind,
                    std::optional<std::size_t> index,
                    const nlohmann::json& operation,
                    const nlohmann::json& document) -> std::string {
    auto pretty = [](const nlohmann::json& j) {
        return j.is_string() ? j.get<std::string>()
                             : j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    };

    auto result = std::string{message};
    result += "\nname: ";
    result += to_string_view(kind);
    if (index) {
        result += "\nindex: ";
        result += std::to_string(*index);
    }
    if (!operation.is_null()) {
        result += "\noperation: ";
        result += pretty(operation);
    }
    if (!document.is_null()) {
        result += "\ntree: ";
        result += pretty(document);
    }
    return result;
}

}  // anonymous namespace

PatchError::PatchError(ErrorKind kind, std::string message,
                       std::optional<std::size_t> index,
                       nlohmann::json operation,
                       nlohmann::json document)
    : std::runtime_error{format_message(message, kind, index, operation, document)},
      kind_{kind},
      message_{std::move(message)},
      index_{index},
      operation_{std::move(operation)},
      document_{std::move(document)} {}

}  // namespace json_patch_cpp
