/// @file value.hpp
/// @brief Document type and the value primitives patch operations rely on.

#pragma once

#include <nlohmann/json.hpp>

namespace json_patch_cpp {

/// A JSON document: null, boolean, number, string, array or object.
using Document = nlohmann::json;

/// An "undefined" value for use inside documents and operation values.
///
/// JSON itself has no undefined; nlohmann's discarded value plays that role
/// here. Documents should never contain it once a patch has been applied:
/// deep_clone() normalises it away and validation rejects it in values.
inline auto undefined_value() -> nlohmann::json {
    return nlohmann::json(nlohmann::json::value_t::discarded);
}

/// Structural equality used by the `test` operation.
///
/// Arrays compare element-wise in order, objects compare by key set and
/// member values regardless of order. Two values that both compare unequal
/// to themselves (NaN) are treated as equal, as are two undefined values.
/// Integers and floats compare numerically.
auto deep_equal(const nlohmann::json& a, const nlohmann::json& b) -> bool;

/// Copy a value so that it shares nothing with the original.
///
/// Follows serialization semantics: undefined array elements become null,
/// undefined object members are dropped and an undefined top-level value
/// becomes null.
auto deep_clone(const nlohmann::json& value) -> nlohmann::json;

/// Check recursively whether a value is, or contains, an undefined value.
auto has_undefined(const nlohmann::json& value) -> bool;

}  // namespace json_patch_cpp
