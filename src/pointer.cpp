#include <json-patch-cpp/pointer.hpp>
#include <json-patch-cpp/error.hpp>

#include "json_access.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>

namespace json_patch_cpp {

auto escape_path_component(std::string_view component) -> std::string {
    auto result = std::string{};
    result.reserve(component.size());
    for (char c : component) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto unescape_path_component(std::string_view component) -> std::string {
    auto result = std::string{component};
    if (result.find('~') == std::string::npos) return result;
    // Single left-to-right pass so "~01" becomes "~1", not "/"
    for (auto i = std::size_t{0}; i < result.size(); ++i) {
        if (result[i] == '~' && i + 1 < result.size()) {
            if (result[i + 1] == '1') {
                result.replace(i, 2, "/");
            } else if (result[i + 1] == '0') {
                result.replace(i, 2, "~");
            }
        }
    }
    return result;
}

auto split_pointer(std::string_view pointer) -> std::vector<std::string> {
    auto components = std::vector<std::string>{};
    auto pos = std::size_t{0};
    while (true) {
        auto next = pointer.find('/', pos);
        components.emplace_back(pointer.substr(pos, next - pos));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return components;
}

auto parse_pointer(std::string_view pointer) -> std::vector<std::string> {
    if (pointer.empty()) return {};
    if (pointer[0] != '/') {
        throw std::invalid_argument{"JSON Pointer must start with '/' or be empty"};
    }
    auto raw = split_pointer(pointer);
    auto components = std::vector<std::string>{};
    components.reserve(raw.size() - 1);
    for (std::size_t i = 1; i < raw.size(); ++i) {
        components.push_back(unescape_path_component(raw[i]));
    }
    return components;
}

auto try_parse_index(std::string_view component) -> std::optional<std::size_t> {
    if (component.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (component.size() > 1 && component[0] == '0') return std::nullopt;
    for (char c : component) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(component.data(), component.data() + component.size(), result);
    if (ec == std::errc{} && ptr == component.data() + component.size()) return result;
    return std::nullopt;
}

auto is_prototype_key(std::string_view component, std::string_view previous) -> bool {
    return component == "__proto__" || (component == "prototype" && previous == "constructor");
}

auto find_by_pointer(const nlohmann::json& document, std::string_view pointer,
                     bool ban_prototype_modifications) -> const nlohmann::json* {
    if (pointer.empty()) return &document;
    if (pointer.front() != '/') return nullptr;

    auto raw = split_pointer(pointer);
    const auto* current = &document;
    for (std::size_t t = 1; t < raw.size(); ++t) {
        auto key = unescape_path_component(raw[t]);
        if (ban_prototype_modifications && is_prototype_key(key, raw[t - 1])) {
            throw PrototypeModificationError{};
        }
        current = detail::find_child(*current, key);
        if (!current) return nullptr;
    }
    return current;
}

auto find_by_pointer(nlohmann::json& document, std::string_view pointer,
                     bool ban_prototype_modifications) -> nlohmann::json* {
    return const_cast<nlohmann::json*>(find_by_pointer(
        static_cast<const nlohmann::json&>(document), pointer, ban_prototype_modifications));
}

auto get_value_by_pointer(const nlohmann::json& document, std::string_view pointer)
    -> std::optional<nlohmann::json> {
    const auto* found = find_by_pointer(document, pointer);
    if (!found) return std::nullopt;
    return *found;
}

auto existing_path_fragment(const nlohmann::json& document, std::string_view path)
    -> std::string {
    if (path.empty()) return {};

    auto raw = split_pointer(path);
    const auto* current = &document;
    for (std::size_t t = 1; t < raw.size(); ++t) {
        current = detail::find_child(*current, unescape_path_component(raw[t]));
        if (!current) return detail::join_components(raw, t);
    }
    return std::string{path};
}

namespace {

auto find_path_recursive(const nlohmann::json& current, const nlohmann::json& node,
                         std::string& path) -> bool {
    if (&current == &node) return true;
    if (current.is_object()) {
        for (auto it = current.begin(); it != current.end(); ++it) {
            auto mark = path.size();
            path += '/';
            path += escape_path_component(it.key());
            if (find_path_recursive(it.value(), node, path)) return true;
            path.resize(mark);
        }
    } else if (current.is_array()) {
        for (std::size_t i = 0; i < current.size(); ++i) {
            auto mark = path.size();
            path += '/';
            path += std::to_string(i);
            if (find_path_recursive(current[i], node, path)) return true;
            path.resize(mark);
        }
    }
    return false;
}

}  // anonymous namespace

auto get_path(const nlohmann::json& root, const nlohmann::json& node) -> std::string {
    auto path = std::string{};
    if (!find_path_recursive(root, node, path)) {
        throw std::invalid_argument{"node not found in root"};
    }
    return path;
}

}  // namespace json_patch_cpp
