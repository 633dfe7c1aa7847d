#include <json-patch-cpp/value.hpp>

#include <algorithm>

namespace json_patch_cpp {

auto deep_equal(const nlohmann::json& a, const nlohmann::json& b) -> bool {
    if (a.is_discarded() || b.is_discarded()) {
        return a.is_discarded() && b.is_discarded();
    }

    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) return false;
        return std::equal(a.begin(), a.end(), b.begin(),
            [](const nlohmann::json& x, const nlohmann::json& y) {
                return deep_equal(x, y);
            });
    }

    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end()) return false;
            if (!deep_equal(it.value(), *other)) return false;
        }
        return true;
    }

    if (a.is_structured() || b.is_structured()) return false;

    if (a == b) return true;
    // NaN is the only scalar that is unequal to itself
    return a != a && b != b;
}

auto deep_clone(const nlohmann::json& value) -> nlohmann::json {
    if (value.is_discarded()) return nullptr;

    if (value.is_array()) {
        auto result = nlohmann::json::array();
        for (const auto& element : value) {
            result.push_back(deep_clone(element));
        }
        return result;
    }

    if (value.is_object()) {
        auto result = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it.value().is_discarded()) continue;
            result[it.key()] = deep_clone(it.value());
        }
        return result;
    }

    return value;
}

auto has_undefined(const nlohmann::json& value) -> bool {
    if (value.is_discarded()) return true;
    if (value.is_structured()) {
        return std::any_of(value.begin(), value.end(),
            [](const nlohmann::json& child) { return has_undefined(child); });
    }
    return false;
}

}  // namespace json_patch_cpp
