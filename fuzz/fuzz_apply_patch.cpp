// Fuzz target for apply_patch(): the input is split at the first NUL into
// a document and a patch. Malformed JSON is skipped; any patch that applies
// must leave a document that serializes, and validation must agree with
// application about success.

#include <json-patch-cpp/json_patch.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view(reinterpret_cast<const char*>(data), size);
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    const auto* middle = input.data() + split;
    auto doc = nlohmann::json::parse(input.data(), middle, nullptr, false);
    auto patch = nlohmann::json::parse(middle + 1, input.data() + input.size(), nullptr, false);
    if (doc.is_discarded() || patch.is_discarded()) return 0;

    auto error = std::optional<json_patch_cpp::PatchError>{};
    try {
        error = json_patch_cpp::validate_sequence(patch, &doc);
    } catch (const json_patch_cpp::PrototypeModificationError&) {
        return 0;
    }

    try {
        auto out = json_patch_cpp::apply_patch_to_copy(
            doc, patch, json_patch_cpp::ApplyOptions{.validate = true});
        if (error) __builtin_trap();
        auto serialized = out.new_document.dump();
        (void)serialized;
    } catch (const json_patch_cpp::PatchError&) {
        if (!error) __builtin_trap();
    }
    return 0;
}
