/// @file json_patch.hpp
/// @brief Umbrella header for the json-patch-cpp library.
///
/// Include this single header for access to all public types:
/// Document, Operation, ApplyOptions, OperationResult, PatchError,
/// ExtendedOperation, ExtendedOperationRegistry, and the pointer helpers.

#pragma once

#include <json-patch-cpp/error.hpp>
#include <json-patch-cpp/extended.hpp>
#include <json-patch-cpp/graft.hpp>
#include <json-patch-cpp/operation.hpp>
#include <json-patch-cpp/patch.hpp>
#include <json-patch-cpp/pointer.hpp>
#include <json-patch-cpp/validate.hpp>
#include <json-patch-cpp/value.hpp>
