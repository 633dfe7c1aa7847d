// extended_ops_demo: registering and applying custom `x` operations
//
// Registers two extended operations on a private registry: `x-increment`
// adds to a number (creating missing parents with "resolve": true) and
// `x-pop` removes the targeted element and reports it.
//
// Build: cmake -B build -DJSON_PATCH_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/extended_ops_demo

#include <json-patch-cpp/json_patch.hpp>

#include <cstdio>
#include <memory>
#include <string>

namespace jp = json_patch_cpp;
using json = nlohmann::json;

namespace {

auto step(const jp::Operation& op) -> long long {
    return op.args && !op.args->empty() ? (*op.args)[0].get<long long>() : 1;
}

/// Adds `args[0]` (default 1) to the targeted number; a missing target counts as 0.
class Increment final : public jp::ExtendedOperation {
public:
    auto apply_to_array(const jp::Operation& op, json& container, std::size_t index,
                        json& document) const -> std::optional<jp::ExtendedResult> override {
        auto& target = container[index];
        target = (target.is_number() ? target.get<long long>() : 0) + step(op);
        return jp::ExtendedResult{document, std::nullopt};
    }

    auto apply_to_object(const jp::Operation& op, json& container, const std::string& key,
                         json& document) const -> std::optional<jp::ExtendedResult> override {
        if (key.empty()) return std::nullopt;
        container[key] = container.value(key, 0LL) + step(op);
        return jp::ExtendedResult{document, std::nullopt};
    }

    void validate(const jp::Operation& op, std::size_t index, const json*,
                  const std::optional<std::string>&) const override {
        if (op.args && (op.args->size() != 1 || !(*op.args)[0].is_number_integer())) {
            throw jp::PatchError{jp::ErrorKind::operation_x_args_not_array,
                                 "x-increment takes a single integer argument", index};
        }
    }
};

}  // anonymous namespace

int main() {
    auto registry = jp::ExtendedOperationRegistry{};
    registry.register_operation("x-increment", std::make_shared<Increment>());

    // Config form: three callables instead of a subclass
    auto pop = jp::ExtendedOperationConfig{};
    pop.arr = [](const jp::Operation&, json& container, std::size_t index, json& document)
        -> std::optional<jp::ExtendedResult> {
        auto removed = container[index];
        container.erase(index);
        return jp::ExtendedResult{document, removed};
    };
    pop.obj = [](const jp::Operation&, json&, const std::string&, json&)
        -> std::optional<jp::ExtendedResult> {
        return std::nullopt;
    };
    pop.validator = [](const jp::Operation&, std::size_t, const json*, const std::optional<std::string>&) {};
    registry.register_operation("x-pop", pop);

    auto options = jp::ApplyOptions{.validate = true, .registry = &registry};

    auto doc = json::parse(R"({"stats": {"visits": 41}, "queue": ["a", "b", "c"]})");
    auto results = jp::apply_patch(doc, json::parse(R"([
        {"op": "x", "xid": "x-increment", "path": "/stats/visits"},
        {"op": "x", "xid": "x-increment", "path": "/stats/daily/monday", "args": [5], "resolve": true},
        {"op": "x", "xid": "x-pop", "path": "/queue/--"}
    ])"), options);

    std::printf("document: %s\n", doc.dump().c_str());
    std::printf("popped:   %s\n", results[2].removed->dump().c_str());

    // A declined operation leaves the document alone
    auto before = doc;
    jp::apply_operation(doc, jp::Operation{.op = jp::OpType::x, .path = "", .xid = "x-increment"}, options);
    std::printf("unchanged: %s\n", jp::deep_equal(before, doc) ? "yes" : "no");

    // Validation failures surface as PatchError
    if (auto error = jp::validate_sequence(json::parse(R"([
            {"op": "x", "xid": "x-increment", "path": "/stats/visits", "args": ["many"]}
        ])"), &doc, {}, registry)) {
        std::printf("rejected: %s\n", error->message().c_str());
    }

    return 0;
}
